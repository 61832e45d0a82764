#include "FadeAnimator.hpp"
#include "../debug/Log.hpp"

CFadeAnimator::CFadeAnimator(std::chrono::milliseconds interval) : m_interval(interval) {
    ;
}

CFadeAnimator::~CFadeAnimator() {
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_exit = true;
    }
    m_cv.notify_all();

    if (m_thread && m_thread->joinable())
        m_thread->join();
}

uint64_t CFadeAnimator::start(StepFn step) {
    uint64_t id = 0;

    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_step    = std::move(step);
        m_running = true;
        id        = ++m_session;

        if (!m_thread)
            m_thread = makeUnique<std::thread>([this] { threadMain(); });
    }

    m_cv.notify_all();

    Debug::log(TRACE, "CFadeAnimator: session {} started", id);

    return id;
}

void CFadeAnimator::stop() {
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_running = false;
        m_step    = nullptr;
        ++m_session;
    }

    m_cv.notify_all();
}

bool CFadeAnimator::active() {
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_running;
}

uint64_t CFadeAnimator::session() const {
    return m_session;
}

uint64_t CFadeAnimator::ticks() const {
    return m_ticks;
}

void CFadeAnimator::threadMain() {
    while (!m_exit) {
        StepFn   step;
        uint64_t session = 0;

        {
            std::unique_lock<std::mutex> lk(m_mutex);

            m_cv.wait(lk, [this] { return m_running || m_exit; });
            if (m_exit)
                break;

            // a stop() or a newer start() during the sleep is picked up below
            m_cv.wait_for(lk, m_interval, [this] { return m_exit.load(); });
            if (m_exit)
                break;

            if (!m_running)
                continue;

            step    = m_step;
            session = m_session;
        }

        // the step takes the render state lock, ours must not be held across it
        const bool DONE = step ? step() : true;
        ++m_ticks;

        std::lock_guard<std::mutex> lg(m_mutex);
        if (DONE && session == m_session) {
            m_running = false;
            m_step    = nullptr;
            Debug::log(TRACE, "CFadeAnimator: session {} reached its target after {} ticks", session, m_ticks.load());
        }
    }
}
