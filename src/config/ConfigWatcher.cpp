#include "ConfigWatcher.hpp"
#include "../debug/Log.hpp"
#include "../helpers/fs/FsUtils.hpp"

#include <algorithm>
#include <sys/stat.h>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

std::optional<int64_t> CRealFileStat::mtime(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0)
        return std::nullopt;

    return (int64_t)st.st_mtim.tv_sec * 1000000000LL + st.st_mtim.tv_nsec;
}

std::optional<std::string> CRealFileStat::read(const std::string& path) {
    return NFsUtils::readFileAsString(path);
}

bool CRealFileStat::write(const std::string& path, const std::string& content) {
    return NFsUtils::writeToFile(path, content);
}

bool SConfigWatchEvent::empty() const {
    return !reloadSettings && !reloadCustom && !control.refresh;
}

CConfigWatcher::CConfigWatcher(SP<IFileStat> fs, std::string settingsPath, SControlPaths paths) : m_fs(fs), m_settingsPath(std::move(settingsPath)), m_paths(std::move(paths)) {
    ;
}

void CConfigWatcher::setPolling(bool enabled, int interval) {
    m_polling      = enabled;
    m_pollInterval = std::clamp(interval, 1, 1000);
    m_moveCounter  = std::min(m_moveCounter, m_pollInterval - 1);
}

void CConfigWatcher::arm() {
    m_settingsMtime = m_fs->mtime(m_settingsPath);
    m_refreshMtime  = m_fs->mtime(m_paths.refresh);
    m_customMtime   = m_fs->mtime(m_paths.custom);
    m_moveCounter   = 0;
}

int CConfigWatcher::moveCounter() const {
    return m_moveCounter;
}

SControlSignal CConfigWatcher::readControl() {
    SControlSignal signal;

    if (const auto TYPE = m_fs->read(m_paths.type); TYPE && !TYPE->empty()) {
        signal.type = cursorTypeFromString(*TYPE);
        if (!signal.type)
            Debug::log(WARN, "CConfigWatcher: unknown cursor type \"{}\" in {}", *TYPE, m_paths.type);
    }

    if (const auto SCALE = m_fs->read(m_paths.scale); SCALE && !SCALE->empty()) {
        try {
            signal.scale = std::clamp(std::stof(trim(*SCALE)), 0.5F, 10.F);
        } catch (std::exception& e) { Debug::log(WARN, "CConfigWatcher: bad scale \"{}\" in {}: {}", *SCALE, m_paths.scale, e.what()); }
    }

    return signal;
}

SConfigWatchEvent CConfigWatcher::onMove() {
    SConfigWatchEvent event;

    if (m_polling && ++m_moveCounter >= m_pollInterval) {
        m_moveCounter = 0;

        const auto MTIME = m_fs->mtime(m_settingsPath);
        if (MTIME && (!m_settingsMtime || *MTIME > *m_settingsMtime)) {
            Debug::log(LOG, "CConfigWatcher: {} changed, reloading", m_settingsPath);
            m_settingsMtime      = MTIME;
            event.reloadSettings = true;
        }

        if (const auto CUSTOM = m_fs->mtime(m_paths.custom); CUSTOM != m_customMtime) {
            Debug::log(LOG, "CConfigWatcher: {} {}", m_paths.custom, CUSTOM ? "changed" : "is gone");
            m_customMtime      = CUSTOM;
            event.reloadCustom = true;
        }

        const auto CONTROL = readControl();
        if (CONTROL.type)
            m_staged.type = CONTROL.type;
        if (CONTROL.scale)
            m_staged.scale = CONTROL.scale;
    }

    // the trigger is cheap enough to check on every move
    const auto REFRESH = m_fs->mtime(m_paths.refresh);
    if (REFRESH && (!m_refreshMtime || *REFRESH > *m_refreshMtime)) {
        m_refreshMtime = REFRESH;

        // whatever was written last before the touch wins over what was staged
        event.control = readControl();
        if (!event.control.type)
            event.control.type = m_staged.type;
        if (!event.control.scale)
            event.control.scale = m_staged.scale;

        event.control.refresh = true;
        m_staged              = {};
        event.reloadSettings  = true;
        event.reloadCustom    = true;
        m_settingsMtime       = m_fs->mtime(m_settingsPath);
        m_customMtime         = m_fs->mtime(m_paths.custom);

        Debug::log(LOG, "CConfigWatcher: refresh requested, type {}, scale {}", event.control.type ? cursorTypeToString(*event.control.type) : "unchanged",
                   event.control.scale ? std::to_string(*event.control.scale) : "unchanged");
    }

    return event;
}
