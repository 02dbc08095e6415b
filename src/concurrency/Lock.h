#pragma once

#include <mutex>

namespace concurrency
{

/**
 * Mutex shared by the planner, the sink model and the frame queue.
 * Not recursive: a thread must not take it twice.
 */
class Lock
{
  public:
    Lock() = default;

    Lock(const Lock &) = delete;
    Lock &operator=(const Lock &) = delete;

    void lock();
    void unlock();

    /// The underlying mutex, for waits on a std::condition_variable
    std::mutex &native() { return handle; }

  private:
    std::mutex handle;
};

/**
 * Holds a Lock for the lifetime of the guard
 */
class LockGuard
{
  public:
    explicit LockGuard(Lock &lock) : held(lock) { held.lock(); }
    ~LockGuard() { held.unlock(); }

    LockGuard(const LockGuard &) = delete;
    LockGuard &operator=(const LockGuard &) = delete;

  private:
    Lock &held;
};

} // namespace concurrency
