#pragma once

#include "Lock.h"
#include <condition_variable>
#include <deque>
#include <memory>
#include <stddef.h>
#include <stdint.h>

namespace concurrency
{

/**
 * Re-entrant queue used to hand immutable frames from a renderer to the display thread.
 *
 * Items are shared, read-only handles so the producer can keep drawing into a new frame while the consumer plans
 * against the old one. With a capacity set, pushing into a full queue drops the oldest pending item: a display
 * only ever needs the most recent picture.
 */
template <typename T> class FrameQueue
{
  public:
    typedef std::shared_ptr<const T> ItemPtr;

    /// @param capacity maximum pending items, 0 means unbounded
    explicit FrameQueue(size_t capacity = 0) : capacity(capacity) {}

    FrameQueue(FrameQueue const &other) = delete;

    /**
     * Push an item. Returns false if the queue was closed (the item is discarded).
     */
    bool push(ItemPtr item)
    {
        {
            LockGuard guard(lock);
            if (closed)
                return false;
            if (capacity > 0 && queue.size() >= capacity) {
                queue.pop_front();
                dropped++;
            }
            queue.push_back(std::move(item));
        }
        cond.notify_one();
        return true;
    }

    /**
     * Pop the oldest item (non-blocking)
     */
    ItemPtr tryPop()
    {
        LockGuard guard(lock);
        if (queue.empty())
            return nullptr;
        ItemPtr item = std::move(queue.front());
        queue.pop_front();
        return item;
    }

    /**
     * Take the newest item and discard everything older (non-blocking).
     * @param skipped if not null, receives the number of discarded items
     */
    ItemPtr takeLatest(uint32_t *skipped = nullptr)
    {
        LockGuard guard(lock);
        if (skipped)
            *skipped = queue.empty() ? 0 : (uint32_t)(queue.size() - 1);
        if (queue.empty())
            return nullptr;
        ItemPtr item = std::move(queue.back());
        queue.clear();
        return item;
    }

    /// Wait until an item is pending or the queue is closed. Returns false if closed and empty.
    bool waitForItem()
    {
        std::unique_lock<std::mutex> waiter(lock.native());
        cond.wait(waiter, [this] { return closed || !queue.empty(); });
        return !queue.empty();
    }

    /// Drop every pending item, returns how many were dropped
    uint32_t clear()
    {
        LockGuard guard(lock);
        uint32_t n = (uint32_t)queue.size();
        queue.clear();
        return n;
    }

    /// Wake all waiters and refuse further pushes
    void close()
    {
        {
            LockGuard guard(lock);
            closed = true;
        }
        cond.notify_all();
    }

    /// Accept pushes again after close()
    void reopen()
    {
        LockGuard guard(lock);
        closed = false;
    }

    uint32_t size() const
    {
        LockGuard guard(lock);
        return queue.size();
    }

    /// Items discarded because the queue was full
    uint32_t droppedCount() const
    {
        LockGuard guard(lock);
        return dropped;
    }

  private:
    const size_t capacity;
    mutable Lock lock;
    std::condition_variable cond;
    std::deque<ItemPtr> queue;
    uint32_t dropped = 0;
    bool closed = false;
};

} // namespace concurrency
