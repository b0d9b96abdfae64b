#ifndef CAPTURE_ENGINE_HPP
#define CAPTURE_ENGINE_HPP

#include <pcap.h>

#include <string>

#include "announcement_decoder.hpp"

// Live libpcap handle delivering NetBIOS datagrams to an AnnouncementDecoder.
// Opening or activating the interface fails with std::runtime_error.
class CaptureEngine
{
   public:
    explicit CaptureEngine(const std::string& interface);
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    // Installs the NetBIOS datagram filter, narrowed by user_filter if not empty
    bool setFilter(const std::string& user_filter);

    // Framing of the frames delivered by this handle
    LinkType linkType() const { return m_link_type; }

    // Feeds every captured frame to the decoder. Returns only on a capture
    // error, which throws std::runtime_error.
    void run(AnnouncementDecoder& decoder);

   private:
    void logStatistics();

    pcap_t* m_handle{nullptr};
    std::string m_interface;
    LinkType m_link_type{LinkType::ETHERNET};
};

#endif  // CAPTURE_ENGINE_HPP
