#ifndef SIGHTING_QUEUE_HPP
#define SIGHTING_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "sighting_data.hpp"

// Unbounded FIFO mailbox between the capture thread (producer) and the
// persistence thread (consumer). An empty optional is the shutdown sentinel.
class SightingQueue
{
   public:
    SightingQueue() = default;
    ~SightingQueue() = default;

    SightingQueue(const SightingQueue&) = delete;
    SightingQueue& operator=(const SightingQueue&) = delete;

    // Never blocks beyond the internal mutex
    void put(SightingEvent event);

    // Enqueue the shutdown marker; the consumer stops after receiving it
    void putSentinel();

    // Blocks until an item is available. std::nullopt means sentinel.
    std::optional<SightingEvent> get();

    // Consumer acknowledgment for one item returned by get()
    void taskDone();

    // Blocks until every enqueued item has been acknowledged
    void join();

    size_t size() const;

   private:
    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_all_done;
    std::queue<std::optional<SightingEvent>> m_items;
    size_t m_unfinished{0};
};

#endif  // SIGHTING_QUEUE_HPP
