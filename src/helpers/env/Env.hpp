#pragma once

#include <optional>
#include <string>

//NOLINTNEXTLINE
namespace Env {
    bool                       envEnabled(const std::string& env);
    std::optional<std::string> envValue(const std::string& env);

    bool                       isDebug();
    bool                       isTrace();
    bool                       isInfo();
};
