#include "Lock.h"

namespace concurrency
{

void Lock::lock()
{
    handle.lock();
}

void Lock::unlock()
{
    handle.unlock();
}

} // namespace concurrency
