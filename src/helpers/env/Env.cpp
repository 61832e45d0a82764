#include "Env.hpp"

#include <cstdlib>
#include <string_view>

bool Env::envEnabled(const std::string& env) {
    auto ret = getenv(env.c_str());
    if (!ret)
        return false;

    const std::string_view sv = ret;

    return !sv.empty() && sv != "0";
}

std::optional<std::string> Env::envValue(const std::string& env) {
    auto ret = getenv(env.c_str());
    if (!ret || !*ret)
        return std::nullopt;

    return std::string{ret};
}

bool Env::isDebug() {
    static bool DEBUG = envEnabled("CONSTELLATION_CURSOR_DEBUG");
    return DEBUG;
}

bool Env::isTrace() {
    static bool TRACE = isDebug() && envEnabled("CONSTELLATION_CURSOR_TRACE");
    return TRACE;
}

bool Env::isInfo() {
    static bool INFO = envEnabled("CONSTELLATION_CURSOR_INFO");
    return INFO;
}
