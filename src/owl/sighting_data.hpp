#ifndef SIGHTING_DATA_HPP
#define SIGHTING_DATA_HPP

#include <chrono>
#include <cstdint>
#include <string>

// One decoded announcement, as produced by the capture side
struct SightingEvent
{
    std::chrono::system_clock::time_point observed_at;
    std::string source_ip;  // dotted-quad IPv4
    std::string host_name;  // announced computer name
};

// One row of the durable sighting log
struct LogEntry
{
    int64_t id{0};         // insertion-order surrogate key, assigned by the store
    int64_t timestamp{0};  // epoch seconds
    std::string ip;
    std::string name;
};

// Maximum length of the textual IPv4 address kept in the log
constexpr size_t LOG_ENTRY_IP_MAX_LEN = 15;

#endif  // SIGHTING_DATA_HPP
