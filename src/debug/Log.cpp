#include "Log.hpp"
#include "../helpers/env/Env.hpp"

#include <cstdio>
#include <unistd.h>

void Debug::init() {
    m_enabled      = Env::isDebug();
    m_trace        = Env::isTrace();
    m_disableColor = !isatty(STDERR_FILENO);
}

void Debug::close() {
    std::lock_guard<std::mutex> guard(m_logMutex);
    m_shuttingDown = true;
    fflush(stderr);
}

void Debug::log(eLogLevel level, std::string str) {
    // INFO is the opt-in attach dump, everything else needs the debug switch
    if (!m_enabled && level != INFO)
        return;

    if (level == TRACE && !m_trace)
        return;

    if (m_shuttingDown)
        return;

    std::lock_guard<std::mutex> guard(m_logMutex);

    std::string                 coloredStr = str;
    //NOLINTBEGIN
    switch (level) {
        case LOG:
            str        = "[LOG] " + str;
            coloredStr = str;
            break;
        case WARN:
            str        = "[WARN] " + str;
            coloredStr = "\033[1;33m" + str + "\033[0m"; // yellow
            break;
        case ERR:
            str        = "[ERR] " + str;
            coloredStr = "\033[1;31m" + str + "\033[0m"; // red
            break;
        case CRIT:
            str        = "[CRITICAL] " + str;
            coloredStr = "\033[1;35m" + str + "\033[0m"; // magenta
            break;
        case INFO:
            str        = "[INFO] " + str;
            coloredStr = "\033[1;32m" + str + "\033[0m"; // green
            break;
        case TRACE:
            str        = "[TRACE] " + str;
            coloredStr = "\033[1;34m" + str + "\033[0m"; // blue
            break;
        default: break;
    }
    //NOLINTEND

    // we live inside someone else's process, stdout belongs to the host
    fprintf(stderr, "[constellation-cursor] %s\n", m_disableColor ? str.c_str() : coloredStr.c_str());
}
