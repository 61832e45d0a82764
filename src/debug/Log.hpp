#pragma once
#include <cstdint>
#include <string>
#include <format>
#include <mutex>

enum eLogLevel : int8_t {
    NONE = -1,
    LOG  = 0,
    WARN,
    ERR,
    CRIT,
    INFO,
    TRACE
};

// NOLINTNEXTLINE(readability-identifier-naming)
namespace Debug {
    inline bool        m_enabled      = false;
    inline bool        m_trace        = false;
    inline bool        m_disableColor = false;
    inline bool        m_shuttingDown = false;

    inline std::mutex  m_logMutex;

    // reads the debug env switches, called once when the library is attached
    void init();
    void close();

    //
    void log(eLogLevel level, std::string str);

    template <typename... Args>
    //NOLINTNEXTLINE
    void log(eLogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (!m_enabled && level != INFO)
            return;

        if (level == TRACE && !m_trace)
            return;

        if (m_shuttingDown)
            return;

        // std::format_string<Args...> makes bad specifiers a compile error, vformat won't throw here
        log(level, std::vformat(fmt.get(), std::make_format_args(args...)));
    }
};
