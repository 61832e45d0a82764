#pragma once

#include <csignal>
#include <format>
#include <string>

#include "debug/Log.hpp"

#ifndef NDEBUG
#ifdef CONSTELLATION_DEBUG
#define ISDEBUG true
#else
#define ISDEBUG false
#endif
#else
#define ISDEBUG false
#endif

#ifndef CONSTELLATION_VERSION
#define CONSTELLATION_VERSION "0.1.0"
#endif

// only ever compiled in debug builds, an injected library must not abort its host
#define RASSERT(expr, reason, ...)                                                                                                                                                 \
    if (ISDEBUG && !(expr)) {                                                                                                                                                      \
        Debug::log(CRIT, "\n==========================================================================================\nASSERTION FAILED! \n\n{}\n\nat: line {} in {}",            \
                   std::format(reason, ##__VA_ARGS__), __LINE__,                                                                                                                   \
                   ([]() constexpr -> std::string { return std::string(__FILE__).substr(std::string(__FILE__).find_last_of('/') + 1); })());                                       \
        raise(SIGABRT);                                                                                                                                                            \
    }
