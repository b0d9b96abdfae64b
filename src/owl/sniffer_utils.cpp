#include "sniffer_utils.hpp"

#include <net/ethernet.h>
#include <netinet/ip.h>
#include <netinet/udp.h>

#include <cctype>
#include <cstring>
#include <utility>

// Linux cooked capture headers
constexpr size_t SLL_HEADER_LEN = 16;
constexpr size_t SLL_PROTOCOL_OFFSET = 14;
constexpr size_t SLL2_HEADER_LEN = 20;
constexpr size_t SLL2_PROTOCOL_OFFSET = 0;

// NetBIOS datagram header (RFC 1002, 4.4)
constexpr uint8_t NBDGM_DIRECT_UNIQUE = 0x10;
constexpr uint8_t NBDGM_DIRECT_GROUP = 0x11;
constexpr uint8_t NBDGM_BROADCAST = 0x12;
constexpr size_t NBDGM_HEADER_LEN = 14;

// SMB_COM_TRANSACTION request, all offsets from the SMB header start
constexpr uint8_t SMB_COM_TRANSACTION = 0x25;
constexpr size_t SMB_HEADER_LEN = 32;
constexpr size_t SMB_WORD_COUNT_OFFSET = SMB_HEADER_LEN;
constexpr size_t SMB_WORDS_OFFSET = SMB_WORD_COUNT_OFFSET + 1;
constexpr size_t SMB_TRANS_DATA_COUNT_WORD = 11;
constexpr size_t SMB_TRANS_DATA_OFFSET_WORD = 12;
constexpr uint8_t SMB_TRANS_MIN_WORD_COUNT = 14;

constexpr const char* BROWSE_MAILSLOT = "\\MAILSLOT\\BROWSE";

static inline uint16_t read_be16(const u_char* p)
{
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

static inline uint16_t read_le16(const u_char* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

std::string build_capture_filter(const std::string& user_filter)
{
    std::string base = "udp and port " + std::to_string(NETBIOS_DATAGRAM_PORT);
    if (user_filter.empty())
    {
        return base;
    }
    return "(" + base + ") and (" + user_filter + ")";
}

bool get_datagram_info(LinkType link, const u_char* bytes, size_t caplen, DatagramInfo& out)
{
    uint16_t eth_type = 0;
    size_t offset = 0;

    switch (link)
    {
        case LinkType::ETHERNET:
            if (caplen < sizeof(struct ether_header))
            {
                return false;
            }
            eth_type = ntohs(reinterpret_cast<const struct ether_header*>(bytes)->ether_type);
            offset = sizeof(struct ether_header);

            // VLAN
            if (eth_type == ETHERTYPE_VLAN)
            {
                if (caplen < offset + 4)
                {
                    return false;
                }
                eth_type = read_be16(bytes + offset + 2);
                offset += 4;
            }
            break;
        case LinkType::LINUX_SLL:
            if (caplen < SLL_HEADER_LEN)
            {
                return false;
            }
            eth_type = read_be16(bytes + SLL_PROTOCOL_OFFSET);
            offset = SLL_HEADER_LEN;
            break;
        case LinkType::LINUX_SLL2:
            if (caplen < SLL2_HEADER_LEN)
            {
                return false;
            }
            eth_type = read_be16(bytes + SLL2_PROTOCOL_OFFSET);
            offset = SLL2_HEADER_LEN;
            break;
    }

    if (eth_type != ETHERTYPE_IP)
    {
        return false;
    }
    if (caplen < offset + sizeof(struct ip))
    {
        return false;
    }

    const struct ip* ip = reinterpret_cast<const struct ip*>(bytes + offset);
    if (ip->ip_v != 4 || ip->ip_p != IPPROTO_UDP)
    {
        return false;
    }

    uint16_t ip_off = ntohs(ip->ip_off);
    if ((ip_off & 0x1fff) != 0 || (ip_off & IP_MF) != 0)
    {
        return false;  // fragmented
    }

    size_t ip_header_len = static_cast<size_t>(ip->ip_hl) * 4;
    if (ip_header_len < 20)
    {
        return false;
    }
    if (caplen < offset + ip_header_len + sizeof(struct udphdr))
    {
        return false;
    }

    const struct udphdr* udp =
        reinterpret_cast<const struct udphdr*>(bytes + offset + ip_header_len);
    size_t udp_len = ntohs(udp->uh_ulen);
    if (udp_len < sizeof(struct udphdr))
    {
        return false;
    }

    size_t payload_offset = offset + ip_header_len + sizeof(struct udphdr);
    size_t payload_len = caplen - payload_offset;
    // Ethernet padding may follow the datagram
    if (payload_len > udp_len - sizeof(struct udphdr))
    {
        payload_len = udp_len - sizeof(struct udphdr);
    }

    out.payload_offset = payload_offset;
    out.payload_len = payload_len;
    out.srcport = ntohs(udp->uh_sport);
    out.dstport = ntohs(udp->uh_dport);

    // copy ip strings
    memset(out.src, 0, sizeof(out.src));
    memset(out.dst, 0, sizeof(out.dst));
    inet_ntop(AF_INET, &ip->ip_src, out.src, sizeof(out.src));
    inet_ntop(AF_INET, &ip->ip_dst, out.dst, sizeof(out.dst));

    return true;
}

// Skips one encoded NetBIOS name (length-prefixed labels ending with a zero
// label). Returns the offset just past it, or 0 if it runs off the buffer.
static size_t skip_netbios_name(const uint8_t* payload, size_t len, size_t offset)
{
    while (offset < len)
    {
        uint8_t label_len = payload[offset];
        if (label_len == 0)
        {
            return offset + 1;
        }
        if ((label_len & 0xC0) != 0)
        {
            // compression pointer
            return offset + 2 <= len ? offset + 2 : 0;
        }
        offset += 1 + label_len;
    }
    return 0;
}

static bool is_browse_mailslot(const uint8_t* name, size_t available)
{
    size_t expected_len = std::strlen(BROWSE_MAILSLOT);
    if (available < expected_len + 1)
    {
        return false;
    }
    for (size_t i = 0; i < expected_len; ++i)
    {
        if (std::toupper(name[i]) != BROWSE_MAILSLOT[i])
        {
            return false;
        }
    }
    return name[expected_len] == '\0';
}

bool parse_browser_announcement(const uint8_t* payload, size_t len, std::string& computer_name)
{
    if (len < NBDGM_HEADER_LEN)
    {
        return false;
    }
    uint8_t msg_type = payload[0];
    if (msg_type != NBDGM_DIRECT_UNIQUE && msg_type != NBDGM_DIRECT_GROUP &&
        msg_type != NBDGM_BROADCAST)
    {
        return false;
    }

    // Source and destination names precede the SMB message
    size_t offset = skip_netbios_name(payload, len, NBDGM_HEADER_LEN);
    if (offset == 0)
    {
        return false;
    }
    offset = skip_netbios_name(payload, len, offset);
    if (offset == 0)
    {
        return false;
    }

    const uint8_t* smb = payload + offset;
    size_t smb_len = len - offset;
    if (smb_len < SMB_WORDS_OFFSET)
    {
        return false;
    }
    if (smb[0] != 0xFF || smb[1] != 'S' || smb[2] != 'M' || smb[3] != 'B' ||
        smb[4] != SMB_COM_TRANSACTION)
    {
        return false;
    }

    uint8_t word_count = smb[SMB_WORD_COUNT_OFFSET];
    if (word_count < SMB_TRANS_MIN_WORD_COUNT)
    {
        return false;
    }
    size_t byte_count_offset = SMB_WORDS_OFFSET + 2 * static_cast<size_t>(word_count);
    if (smb_len < byte_count_offset + 2)
    {
        return false;
    }

    // The transaction name follows the byte count
    size_t name_offset = byte_count_offset + 2;
    if (!is_browse_mailslot(smb + name_offset, smb_len - name_offset))
    {
        return false;
    }

    size_t data_count = read_le16(smb + SMB_WORDS_OFFSET + 2 * SMB_TRANS_DATA_COUNT_WORD);
    size_t data_offset = read_le16(smb + SMB_WORDS_OFFSET + 2 * SMB_TRANS_DATA_OFFSET_WORD);
    if (data_offset >= smb_len)
    {
        return false;
    }
    if (data_count > smb_len - data_offset)
    {
        data_count = smb_len - data_offset;
    }

    // Request Announcement: opcode, one unused byte, NUL-terminated name
    const uint8_t* browser = smb + data_offset;
    if (data_count < 3 || browser[0] != BROWSER_REQUEST_ANNOUNCEMENT)
    {
        return false;
    }

    std::string name;
    for (size_t i = 2; i < data_count && browser[i] != '\0'; ++i)
    {
        name += static_cast<char>(browser[i]);
    }
    if (name.empty())
    {
        return false;
    }

    computer_name = std::move(name);
    return true;
}
