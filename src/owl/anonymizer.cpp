#include "anonymizer.hpp"

#include <arpa/inet.h>

#include <array>
#include <cctype>
#include <stdexcept>

namespace {

struct PrivateClass
{
    uint32_t network;
    uint32_t netmask;
    unsigned prefix_len;
};

// RFC 1918 address classes; disjoint
constexpr std::array<PrivateClass, 3> PRIVATE_IPV4_CLASSES = {{
    {0x0A000000u, 0xFF000000u, 8},   // 10.0.0.0/8
    {0xAC100000u, 0xFFF00000u, 12},  // 172.16.0.0/12
    {0xC0A80000u, 0xFFFF0000u, 16},  // 192.168.0.0/16
}};

constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ull;
constexpr uint64_t FNV_PRIME = 1099511628211ull;

// Number of syllables in a pseudonym; each one encodes a digest byte
constexpr size_t PSEUDONYM_SYLLABLES = 3;

constexpr std::array<const char*, 16> CONSONANTS = {
    "b", "d", "f", "g", "h", "j", "k", "l", "m", "n", "p", "r", "s", "t", "v", "z"};
constexpr std::array<const char*, 16> VOWELS = {
    "a", "e", "i", "o", "u", "ai", "au", "ea", "ee", "ia", "io", "oa", "oo", "ou", "ua", "ui"};

uint64_t fnv1a(const std::string& bytes)
{
    uint64_t hash = FNV_OFFSET_BASIS;
    for (unsigned char c : bytes)
    {
        hash ^= c;
        hash *= FNV_PRIME;
    }
    return hash;
}

}  // namespace

std::string Anonymizer::pseudonymFor(const std::string& name)
{
    uint64_t digest = fnv1a(name);

    std::string word;
    for (size_t i = 0; i < PSEUDONYM_SYLLABLES; ++i)
    {
        uint8_t b = static_cast<uint8_t>(digest >> (8 * i));
        word += CONSONANTS[b >> 4];
        word += VOWELS[b & 0x0F];
    }
    for (char& c : word)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return word + NAME_SUFFIX;
}

unsigned Anonymizer::privatePrefixLength(uint32_t addr)
{
    for (const auto& cls : PRIVATE_IPV4_CLASSES)
    {
        if ((addr & cls.netmask) == cls.network)
        {
            return cls.prefix_len;
        }
    }
    return 0;
}

std::string Anonymizer::redactIp(const std::string& ip)
{
    struct in_addr parsed;
    if (inet_pton(AF_INET, ip.c_str(), &parsed) != 1)
    {
        throw std::invalid_argument("not an IPv4 address: '" + ip + "'");
    }
    uint32_t addr = ntohl(parsed.s_addr);

    // 0 for public addresses: every octet is redacted
    unsigned prefix_len_bits = privatePrefixLength(addr);
    if (prefix_len_bits > 32)
    {
        throw std::logic_error("prefix length " + std::to_string(prefix_len_bits) + " for " + ip);
    }
    unsigned prefix_len_octets = prefix_len_bits / 8;

    std::string out;
    for (unsigned i = 0; i < 4; ++i)
    {
        if (i > 0)
        {
            out += '.';
        }
        if (i < prefix_len_octets)
        {
            out += std::to_string((addr >> (24 - 8 * i)) & 0xFF);
        }
        else
        {
            out += REDACTED_OCTET;
        }
    }
    return out;
}

std::string Anonymizer::anonymizeName(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_names.find(name);
    if (it == m_names.end())
    {
        it = m_names.emplace(name, pseudonymFor(name)).first;
    }
    return it->second;
}

std::string Anonymizer::anonymizeIp(const std::string& ip)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_ips.find(ip);
    if (it == m_ips.end())
    {
        it = m_ips.emplace(ip, redactIp(ip)).first;
    }
    return it->second;
}

size_t Anonymizer::cachedNames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_names.size();
}

size_t Anonymizer::cachedIps() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ips.size();
}
