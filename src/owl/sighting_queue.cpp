#include "sighting_queue.hpp"

#include <stdexcept>
#include <utility>

void SightingQueue::put(SightingEvent event)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_items.push(std::move(event));
        ++m_unfinished;
    }
    m_not_empty.notify_one();
}

void SightingQueue::putSentinel()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_items.push(std::nullopt);
        ++m_unfinished;
    }
    m_not_empty.notify_one();
}

std::optional<SightingEvent> SightingQueue::get()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_not_empty.wait(lock, [this] { return !m_items.empty(); });
    std::optional<SightingEvent> item = std::move(m_items.front());
    m_items.pop();
    return item;
}

void SightingQueue::taskDone()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_unfinished == 0)
    {
        throw std::logic_error("taskDone() called more times than there were items");
    }
    if (--m_unfinished == 0)
    {
        m_all_done.notify_all();
    }
}

void SightingQueue::join()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_all_done.wait(lock, [this] { return m_unfinished == 0; });
}

size_t SightingQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
}
