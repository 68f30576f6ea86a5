#ifndef BOUNDEDCHANNEL_HPP
#define BOUNDEDCHANNEL_HPP

#include <deque>
#include <mutex>
#include <chrono>
#include <atomic>
#include <condition_variable>

// Fixed-capacity FIFO between producer threads and an observer
// A push into a full channel drops the new item instead of blocking the producer
template <typename T>
class BoundedChannel
{
public:
    explicit BoundedChannel(size_t capacity) : _capacity(capacity == 0 ? 1 : capacity) {}

    // Returns false if the item was dropped
    bool tryPush(T item)
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_items.size() >= _capacity)
            {
                ++_dropped;
                return false;
            }
            _items.push_back(std::move(item));
        }
        _condition.notify_one();
        return true;
    }

    bool tryPop(T &out)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_items.empty())
        {
            return false;
        }
        out = std::move(_items.front());
        _items.pop_front();
        return true;
    }

    bool popFor(T &out, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_condition.wait_for(lock, timeout, [this]
                                 { return !_items.empty(); }))
        {
            return false;
        }
        out = std::move(_items.front());
        _items.pop_front();
        return true;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

    size_t capacity() const { return _capacity; }
    size_t droppedCount() const { return _dropped.load(); }

private:
    const size_t _capacity;
    mutable std::mutex _mutex;
    std::condition_variable _condition;
    std::deque<T> _items;
    std::atomic<size_t> _dropped{0};
};

#endif
