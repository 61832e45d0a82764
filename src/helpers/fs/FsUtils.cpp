#include "FsUtils.hpp"
#include "../../debug/Log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

std::optional<std::string> NFsUtils::getConfigHome() {
    const auto  CONFIG_HOME = getenv("XDG_CONFIG_HOME");

    std::string configRoot;

    if (!CONFIG_HOME || !*CONFIG_HOME) {
        const auto HOME = getenv("HOME");

        if (!HOME || !*HOME) {
            Debug::log(ERR, "FsUtils::getConfigHome: can't get config home: no $HOME or $XDG_CONFIG_HOME");
            return std::nullopt;
        }

        configRoot = HOME + std::string{"/.config/"};
    } else
        configRoot = CONFIG_HOME + std::string{"/"};

    return configRoot + "constellation_cursor/";
}

std::optional<std::string> NFsUtils::getSettingsPath() {
    const auto HOME = getConfigHome();
    if (!HOME)
        return std::nullopt;

    return *HOME + "cursor.conf";
}

std::optional<std::string> NFsUtils::readFileAsString(const std::string& path) {
    std::error_code ec;

    if (!std::filesystem::exists(path, ec) || ec)
        return std::nullopt;

    std::ifstream file(path);
    if (!file.good())
        return std::nullopt;

    return trim(std::string((std::istreambuf_iterator<char>(file)), (std::istreambuf_iterator<char>())));
}

bool NFsUtils::writeToFile(const std::string& path, const std::string& content) {
    std::error_code ec;
    const auto      PARENT = std::filesystem::path(path).parent_path();

    if (!PARENT.empty() && !std::filesystem::exists(PARENT, ec)) {
        std::filesystem::create_directories(PARENT, ec);
        if (ec) {
            Debug::log(ERR, "FsUtils::writeToFile: couldn't create {}: {}", PARENT.string(), ec.message());
            return false;
        }
    }

    std::ofstream of(path, std::ios::trunc);
    if (!of.good()) {
        Debug::log(ERR, "FsUtils::writeToFile: couldn't open an ofstream for {}", path);
        return false;
    }

    of << content;
    of.close();

    return true;
}
