#include "WorkerSlots.hpp"

#include <algorithm>

namespace Livecheck {

Semaphore::Semaphore(size_t capacity)
    : m_capacity(capacity), m_available(capacity) {}

void Semaphore::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_available > 0; });
    --m_available;
    m_peak = std::max(m_peak, m_capacity - m_available);
}

void Semaphore::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_available;
    }
    m_cv.notify_one();
}

size_t Semaphore::inUse() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity - m_available;
}

size_t Semaphore::peak() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peak;
}

} // namespace Livecheck
