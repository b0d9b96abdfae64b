#ifndef ANONYMIZER_HPP
#define ANONYMIZER_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

// Display-only redaction of host names and IPv4 addresses.
// Results are memoized for the lifetime of the object; the stored log
// always keeps the raw values.
class Anonymizer
{
   public:
    static constexpr const char* NAME_SUFFIX = "-LT";
    static constexpr const char* REDACTED_OCTET = "XXX";

    Anonymizer() = default;
    ~Anonymizer() = default;

    Anonymizer(const Anonymizer&) = delete;
    Anonymizer& operator=(const Anonymizer&) = delete;

    // Stable pronounceable pseudonym, e.g. "KOUBATI-LT"
    std::string anonymizeName(const std::string& name);

    // Public addresses lose all four octets. Private addresses keep the
    // whole octets of their RFC 1918 class prefix:
    //   1.1.1.1      -> XXX.XXX.XXX.XXX
    //   10.42.0.1    -> 10.XXX.XXX.XXX
    //   172.16.0.32  -> 172.XXX.XXX.XXX
    //   192.168.0.12 -> 192.168.XXX.XXX
    // Throws std::invalid_argument if ip is not a dotted-quad IPv4 address.
    std::string anonymizeIp(const std::string& ip);

    size_t cachedNames() const;
    size_t cachedIps() const;

    static std::string pseudonymFor(const std::string& name);
    static std::string redactIp(const std::string& ip);

    // Prefix length in bits of the private class containing addr (host
    // byte order), or 0 if addr is public.
    static unsigned privatePrefixLength(uint32_t addr);

   private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::string> m_names;
    std::unordered_map<std::string, std::string> m_ips;
};

#endif  // ANONYMIZER_HPP
