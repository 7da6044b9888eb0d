// WorkerSlots.hpp
// Counting semaphore bounding how many targets are probed at once
#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace Livecheck {

class Semaphore {
public:
    explicit Semaphore(size_t capacity);

    void acquire();
    void release();

    size_t capacity() const { return m_capacity; }
    size_t inUse() const;
    // Highest number of slots held at the same time since construction.
    size_t peak() const;

private:
    const size_t m_capacity;
    size_t m_available;
    size_t m_peak{0};
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

// Holds one slot for its lifetime; released on every exit path.
class SlotGuard {
public:
    explicit SlotGuard(Semaphore& sem) : m_sem(sem) { m_sem.acquire(); }
    ~SlotGuard() { m_sem.release(); }
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    Semaphore& m_sem;
};

} // namespace Livecheck
