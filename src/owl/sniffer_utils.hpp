#ifndef SNIFFER_UTILS_HPP
#define SNIFFER_UTILS_HPP

#include <arpa/inet.h>
#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <string>

// Link-layer framings the decoder understands
enum class LinkType
{
    ETHERNET,    // DLT_EN10MB, optionally one 802.1Q tag
    LINUX_SLL,   // DLT_LINUX_SLL, "any" device on older kernels/libpcap
    LINUX_SLL2,  // DLT_LINUX_SLL2
};

// NetBIOS datagram service (RFC 1002)
constexpr uint16_t NETBIOS_DATAGRAM_PORT = 138;

// Browser protocol opcode carried by the datagrams owl records
constexpr uint8_t BROWSER_REQUEST_ANNOUNCEMENT = 0x02;

struct DatagramInfo
{
    size_t payload_offset;
    size_t payload_len;
    char src[INET_ADDRSTRLEN];
    char dst[INET_ADDRSTRLEN];
    uint16_t srcport;
    uint16_t dstport;
};

// BPF program installed on the capture handle; the user filter, if any,
// narrows it further.
std::string build_capture_filter(const std::string& user_filter);

// Returns true if the packet contains a full link->IPv4->UDP frame and fills
// out the DatagramInfo structure. caplen bounds every read.
bool get_datagram_info(LinkType link, const u_char* bytes, size_t caplen, DatagramInfo& out);

// Walks NetBIOS datagram -> SMB transaction on \MAILSLOT\BROWSE -> browser
// frame. Returns true and sets computer_name for a Request Announcement.
bool parse_browser_announcement(const uint8_t* payload, size_t len, std::string& computer_name);

#endif  // SNIFFER_UTILS_HPP
