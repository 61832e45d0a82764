#pragma once
#include <optional>
#include <string>

namespace NFsUtils {
    // Returns the path to the constellation_cursor directory in config home, without creating it.
    std::optional<std::string> getConfigHome();

    // Returns the full path of cursor.conf
    std::optional<std::string> getSettingsPath();

    std::optional<std::string> readFileAsString(const std::string& path);

    // overwrites the file if exists, creates missing parent dirs
    bool writeToFile(const std::string& path, const std::string& content);
};
