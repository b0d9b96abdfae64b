#ifndef ANNOUNCEMENT_DECODER_HPP
#define ANNOUNCEMENT_DECODER_HPP

#include <sys/time.h>
#include <sys/types.h>

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "sighting_queue.hpp"
#include "sniffer_utils.hpp"

// Turns captured browser announcements into sightings on the queue
class AnnouncementDecoder
{
   public:
    explicit AnnouncementDecoder(SightingQueue& queue, LinkType link_type = LinkType::ETHERNET);
    ~AnnouncementDecoder() = default;

    void setLinkType(LinkType link_type) { m_link_type = link_type; }
    LinkType linkType() const { return m_link_type; }

    // Main entry point: receives one raw captured frame
    void onPacketReceived(const struct timeval& ts, const u_char* bytes, size_t caplen);

    uint64_t packetsSeen() const { return m_packets_seen.load(); }
    uint64_t sightingsQueued() const { return m_sightings_queued.load(); }

    // Logs packet/sighting counters
    void printStatistics() const;

   private:
    SightingQueue& m_queue;
    LinkType m_link_type;
    std::atomic<uint64_t> m_packets_seen{0};
    std::atomic<uint64_t> m_sightings_queued{0};
};

#endif  // ANNOUNCEMENT_DECODER_HPP
