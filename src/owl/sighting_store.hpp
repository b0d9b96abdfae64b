#ifndef SIGHTING_STORE_HPP
#define SIGHTING_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "sighting_data.hpp"

// Abstract data-access interface over the durable sighting log.
// One writer thread appends while any number of readers query.
class SightingStore
{
   public:
    virtual ~SightingStore() = default;

    // Insert-only. entry.id is ignored; returns the id assigned by the store.
    // Throws std::runtime_error on storage failure.
    virtual int64_t append(const LogEntry& entry) = 0;

    // Most recent entry (greatest id) per distinct name, newest timestamp first
    virtual std::vector<LogEntry> latestPerName() = 0;

    // Total number of rows in the log
    virtual size_t size() = 0;
};

#endif  // SIGHTING_STORE_HPP
