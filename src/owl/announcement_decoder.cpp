#include "announcement_decoder.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "logger.hpp"

static inline std::chrono::system_clock::time_point ts_to_time_point(const struct timeval& tv)
{
    auto since_epoch = std::chrono::seconds(tv.tv_sec) + std::chrono::microseconds(tv.tv_usec);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

AnnouncementDecoder::AnnouncementDecoder(SightingQueue& queue, LinkType link_type)
    : m_queue(queue), m_link_type(link_type)
{
}

void AnnouncementDecoder::onPacketReceived(const struct timeval& ts, const u_char* bytes,
                                           size_t caplen)
{
    m_packets_seen.fetch_add(1, std::memory_order_relaxed);

    DatagramInfo info;
    if (!get_datagram_info(m_link_type, bytes, caplen, info))
    {
        LOG_DEBUG("Skipping frame that is not a complete IPv4/UDP datagram");
        return;
    }

    std::string computer_name;
    if (!parse_browser_announcement(bytes + info.payload_offset, info.payload_len, computer_name))
    {
        LOG_DEBUG("Skipping datagram from " << info.src << ":" << info.srcport
                  << ", not a browser request announcement");
        return;
    }

    LOG_INFO("Sighting: " << computer_name << " at " << info.src);

    SightingEvent event;
    event.observed_at = ts_to_time_point(ts);
    event.source_ip = info.src;
    event.host_name = std::move(computer_name);
    m_queue.put(std::move(event));
    m_sightings_queued.fetch_add(1, std::memory_order_relaxed);
}

void AnnouncementDecoder::printStatistics() const
{
    LOG_INFO("=== ANNOUNCEMENT STATISTICS ===");
    LOG_INFO("Packets seen: " << packetsSeen());
    LOG_INFO("Sightings queued: " << sightingsQueued());
    LOG_INFO("===============================");
}
