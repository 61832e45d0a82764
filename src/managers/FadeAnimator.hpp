#pragma once

#include "../helpers/memory/Memory.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

// One background thread ticking a single fade session at a time. Starting a
// new session replaces the running one instead of queueing behind it.
class CFadeAnimator {
  public:
    // returns true once the fade reached its target
    using StepFn = std::function<bool()>;

    CFadeAnimator(std::chrono::milliseconds interval = std::chrono::milliseconds(16));
    ~CFadeAnimator();

    CFadeAnimator(const CFadeAnimator&)            = delete;
    CFadeAnimator& operator=(const CFadeAnimator&) = delete;

    // spawns the thread on first use, returns the new session id
    uint64_t start(StepFn step);
    void     stop();

    bool     active();
    uint64_t session() const;
    uint64_t ticks() const;

  private:
    void                      threadMain();

    std::chrono::milliseconds m_interval;

    UP<std::thread>           m_thread;
    std::mutex                m_mutex;
    std::condition_variable   m_cv;

    StepFn                    m_step;
    bool                      m_running = false;
    std::atomic<uint64_t>     m_session = 0;
    std::atomic<uint64_t>     m_ticks   = 0;
    std::atomic<bool>         m_exit    = false;
};
