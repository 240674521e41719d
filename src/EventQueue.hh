#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

// Mutex-guarded FIFO handing items from producer threads to the thread that drains it.
// When capacity is non-zero the oldest items are dropped to make room.
template <typename T>
class EventQueue
{
private:
    mutable std::mutex mutex;
    std::deque<T> items;
    std::size_t capacity;
    std::size_t droppedCount = 0;

public:
    explicit EventQueue(std::size_t maxItems = 0) : capacity(maxItems) {}

    // Returns false when an older item had to be dropped
    bool push(T item)
    {
        std::lock_guard<std::mutex> lock(mutex);
        bool dropped = false;

        if (capacity > 0 && items.size() >= capacity)
        {
            items.pop_front();
            ++droppedCount;
            dropped = true;
        }

        items.push_back(std::move(item));
        return !dropped;
    }

    std::vector<T> drain(std::size_t maxItems = 0)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<T> out;

        while (!items.empty() && (maxItems == 0 || out.size() < maxItems))
        {
            out.push_back(std::move(items.front()));
            items.pop_front();
        }

        return out;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }

    std::size_t dropped() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return droppedCount;
    }
};
