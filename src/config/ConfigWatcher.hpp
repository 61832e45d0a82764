#pragma once
#include "../helpers/memory/Memory.hpp"
#include "../state/CursorState.hpp"

#include <cstdint>
#include <optional>
#include <string>

// modification times in ns, nullopt when the file can't be stat'ed
class IFileStat {
  public:
    virtual ~IFileStat() = default;

    virtual std::optional<int64_t>     mtime(const std::string& path) = 0;
    virtual std::optional<std::string> read(const std::string& path)  = 0;
    // creates missing parent directories
    virtual bool                       write(const std::string& path, const std::string& content) = 0;
};

class CRealFileStat : public IFileStat {
  public:
    virtual std::optional<int64_t>     mtime(const std::string& path);
    virtual std::optional<std::string> read(const std::string& path);
    virtual bool                       write(const std::string& path, const std::string& content);
};

struct SControlPaths {
    std::string refresh = "/tmp/constellation_cursor_refresh";
    std::string type    = "/tmp/constellation_cursor_type";
    std::string scale   = "/tmp/constellation_cursor_scale";
    std::string custom  = "/tmp/constellation_cursor_custom";
};

// values read from the control files, only committed once the refresh trigger moves
struct SControlSignal {
    std::optional<eCursorType> type;
    std::optional<float>       scale;
    bool                       refresh = false;
};

struct SConfigWatchEvent {
    bool           reloadSettings = false;
    // the custom cursor file appeared, changed or went away
    bool           reloadCustom = false;
    SControlSignal control;

    bool           empty() const;
};

// Polls the settings file and the control files from the cursor move path.
// Nothing here runs on its own, every check is driven by onMove().
class CConfigWatcher {
  public:
    CConfigWatcher(SP<IFileStat> fs, std::string settingsPath, SControlPaths paths = {});
    ~CConfigWatcher() = default;

    void              setPolling(bool enabled, int interval);

    // remembers the current mtimes so files that already exist don't count as changed
    void              arm();

    SConfigWatchEvent onMove();

    int               moveCounter() const;

  private:
    SControlSignal         readControl();

    SP<IFileStat>          m_fs;
    std::string            m_settingsPath;
    SControlPaths          m_paths;

    bool                   m_polling      = true;
    int                    m_pollInterval = 50;
    int                    m_moveCounter  = 0;

    std::optional<int64_t> m_settingsMtime;
    std::optional<int64_t> m_refreshMtime;
    std::optional<int64_t> m_customMtime;
    // last values seen at a poll checkpoint, the fallback for files unreadable at the refresh
    SControlSignal         m_staged;
};
