#include "persistence_writer.hpp"

#include <chrono>

#include "logger.hpp"

PersistenceWriter::PersistenceWriter(SightingQueue& queue, SightingStore& store)
    : m_queue(queue), m_store(store)
{
}

LogEntry PersistenceWriter::toLogEntry(const SightingEvent& event)
{
    LogEntry entry;
    entry.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                          event.observed_at.time_since_epoch())
                          .count();
    entry.ip = event.source_ip;
    entry.name = event.host_name;
    return entry;
}

void PersistenceWriter::run()
{
    LOG_INFO("Persistence writer started");
    while (true)
    {
        std::optional<SightingEvent> item = m_queue.get();
        if (!item)
        {
            m_queue.taskDone();
            LOG_INFO("Persistence writer drained, " << writtenCount() << " sightings written");
            return;
        }

        // No taskDone() on failure: the item was not persisted
        m_store.append(toLogEntry(*item));
        m_written.fetch_add(1, std::memory_order_release);
        m_queue.taskDone();
    }
}
