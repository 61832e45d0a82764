#pragma once

#include <optional>
#include <string>
#include <vector>

#include <hyprlang.hpp>

#include "../helpers/memory/Memory.hpp"
#include "ConfigWatcher.hpp"
#include "../state/CursorState.hpp"

struct SCursorConfig {
    float scale            = 1.5F;
    float outlineThickness = 0.F;
    bool  fadeEnabled      = false;
    bool  fadeInEnabled    = false;
    int   fadeSpeed        = 30;
    int   frostIntensity   = 0;
    bool  hotspotSmoothing = false;
    int   hotspotThreshold = 0;
    bool  configPolling    = true;
    int   pollInterval     = 50;

    bool  operator==(const SCursorConfig&) const = default;
};

// snapshot of the CONSTELLATION_CURSOR_* variables, taken once at attach
struct SEnvOverrides {
    std::optional<eCursorType> type;
    std::optional<float>       scale;
    std::optional<bool>        fade;

    static SEnvOverrides       fromEnvironment();
};

class CConfigManager {
  public:
    CConfigManager(SP<IFileStat> fs, std::string path, SEnvOverrides env);

    // defaults, overwritten by the settings file, overwritten by the env.
    // writes the commented default file first if there is none.
    SCursorConfig                   load();

    const std::string&              path() const;
    const std::vector<std::string>& lastErrors() const;

    // never fails as a whole, bad lines keep their defaults and land in errors
    static SCursorConfig parse(const std::string& content, std::vector<std::string>* errors = nullptr);
    static SCursorConfig clamp(SCursorConfig config);
    static std::string   defaultConfigContent();

  private:
    SP<IFileStat>            m_fs;
    std::string              m_path;
    SEnvOverrides            m_env;
    std::vector<std::string> m_lastErrors;
};
