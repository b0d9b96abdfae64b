#include "capture_engine.hpp"

#include <memory>
#include <stdexcept>

#include "logger.hpp"

constexpr int PCAP_BUFFER_SIZE = 1024 * 1024; // 1MB, announcements are rare
constexpr int PCAP_TIMEOUT_MS = 1000;
constexpr int PCAP_SNAPLEN = 65535; // whole datagram

using PcapPtr = std::unique_ptr<pcap_t, decltype(&pcap_close)>;

extern "C" void announcement_handler(u_char* user, const struct pcap_pkthdr* hdr, const u_char* bytes)
{
    auto* decoder = reinterpret_cast<AnnouncementDecoder*>(user);
    decoder->onPacketReceived(hdr->ts, bytes, hdr->caplen);
}

static void checkSetting(pcap_t* handle, int rc, const char* setting)
{
    if (rc != 0)
    {
        throw std::runtime_error(std::string("cannot set ") + setting + ": " +
                                 pcap_statustostr(rc) + " (" + pcap_geterr(handle) + ")");
    }
}

static LinkType link_type_for(int dlt)
{
    switch (dlt)
    {
        case DLT_EN10MB:
            return LinkType::ETHERNET;
        case DLT_LINUX_SLL:
            return LinkType::LINUX_SLL;
#ifdef DLT_LINUX_SLL2
        case DLT_LINUX_SLL2:
            return LinkType::LINUX_SLL2;
#endif
        default:
            break;
    }
    const char* name = pcap_datalink_val_to_name(dlt);
    throw std::runtime_error("unsupported link type " +
                             (name ? std::string(name) : std::to_string(dlt)));
}

CaptureEngine::CaptureEngine(const std::string& interface) : m_interface(interface)
{
    char errbuf[PCAP_ERRBUF_SIZE];
    errbuf[0] = '\0';

    // Closed automatically until setup has fully succeeded
    PcapPtr handle(pcap_create(m_interface.c_str(), errbuf), &pcap_close);
    if (!handle)
    {
        throw std::runtime_error("cannot open interface '" + m_interface + "': " + errbuf);
    }

    checkSetting(handle.get(), pcap_set_snaplen(handle.get(), PCAP_SNAPLEN), "snaplen");
    // Announcements are broadcast, promiscuous mode is not needed
    checkSetting(handle.get(), pcap_set_promisc(handle.get(), 0), "promiscuous mode");
    checkSetting(handle.get(), pcap_set_timeout(handle.get(), PCAP_TIMEOUT_MS), "read timeout");
    checkSetting(handle.get(), pcap_set_buffer_size(handle.get(), PCAP_BUFFER_SIZE), "buffer size");

    int status = pcap_activate(handle.get());
    if (status < 0)
    {
        throw std::runtime_error("cannot capture on '" + m_interface + "': " +
                                 pcap_statustostr(status) + " (" + pcap_geterr(handle.get()) + ")");
    }
    if (status > 0)
    {
        LOG_WARNING("Capture on " << m_interface << ": " << pcap_statustostr(status) << " ("
                    << pcap_geterr(handle.get()) << ")");
    }

    int dlt = pcap_datalink(handle.get());
    m_link_type = link_type_for(dlt);
    m_handle = handle.release();

    const char* dlt_name = pcap_datalink_val_to_name(dlt);
    LOG_INFO("Listening for browser announcements on " << m_interface << " ("
             << (dlt_name ? dlt_name : "unknown link type") << ")");
}

CaptureEngine::~CaptureEngine()
{
    if (m_handle != nullptr)
    {
        pcap_close(m_handle);
    }
}

bool CaptureEngine::setFilter(const std::string& user_filter)
{
    std::string filter = build_capture_filter(user_filter);

    struct bpf_program program;
    if (pcap_compile(m_handle, &program, filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) == -1)
    {
        LOG_ERROR("Invalid capture filter '" << filter << "': " << pcap_geterr(m_handle));
        return false;
    }

    bool installed = pcap_setfilter(m_handle, &program) == 0;
    if (!installed)
    {
        LOG_ERROR("Cannot install capture filter: " << pcap_geterr(m_handle));
    }
    pcap_freecode(&program);

    if (installed)
    {
        LOG_INFO("Capture filter: " << filter);
    }
    return installed;
}

void CaptureEngine::logStatistics()
{
    struct pcap_stat stats;
    if (pcap_stats(m_handle, &stats) != 0)
    {
        LOG_WARNING("No capture statistics for " << m_interface << ": " << pcap_geterr(m_handle));
        return;
    }
    LOG_INFO("Capture on " << m_interface << ": " << stats.ps_recv << " received, "
             << stats.ps_drop << " dropped by kernel, " << stats.ps_ifdrop
             << " dropped by interface");
}

void CaptureEngine::run(AnnouncementDecoder& decoder)
{
    decoder.setLinkType(m_link_type);

    int result = pcap_loop(m_handle, -1, announcement_handler, reinterpret_cast<u_char*>(&decoder));

    logStatistics();
    decoder.printStatistics();

    if (result == PCAP_ERROR)
    {
        throw std::runtime_error("capture on '" + m_interface + "' failed: " + pcap_geterr(m_handle));
    }
    LOG_INFO("Capture loop on " << m_interface << " ended (" << result << ")");
}
