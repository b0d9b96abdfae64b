#ifndef PERSISTENCE_WRITER_HPP
#define PERSISTENCE_WRITER_HPP

#include <atomic>
#include <cstddef>

#include "sighting_queue.hpp"
#include "sighting_store.hpp"

// Drains the sighting queue into the store, one committed row per event.
class PersistenceWriter
{
   public:
    PersistenceWriter(SightingQueue& queue, SightingStore& store);
    ~PersistenceWriter() = default;

    // Returns after the sentinel has been received and acknowledged.
    // A storage failure propagates to the caller.
    void run();

    // Number of events appended so far
    size_t writtenCount() const { return m_written.load(std::memory_order_acquire); }

    static LogEntry toLogEntry(const SightingEvent& event);

   private:
    SightingQueue& m_queue;
    SightingStore& m_store;
    std::atomic<size_t> m_written{0};
};

#endif  // PERSISTENCE_WRITER_HPP
