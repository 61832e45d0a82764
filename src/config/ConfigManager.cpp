#include "ConfigManager.hpp"
#include "../debug/Log.hpp"
#include "../helpers/env/Env.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <any>
#include <format>
#include <string_view>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

SEnvOverrides SEnvOverrides::fromEnvironment() {
    SEnvOverrides env;

    if (const auto TYPE = Env::envValue("CONSTELLATION_CURSOR_TYPE"); TYPE) {
        env.type = cursorTypeFromString(*TYPE);
        if (!env.type)
            Debug::log(WARN, "Env: unknown CONSTELLATION_CURSOR_TYPE \"{}\", ignoring", *TYPE);
    }

    if (const auto SCALE = Env::envValue("CONSTELLATION_CURSOR_SCALE"); SCALE) {
        try {
            env.scale = std::clamp(std::stof(*SCALE), 0.5F, 10.F);
        } catch (std::exception& e) { Debug::log(WARN, "Env: bad CONSTELLATION_CURSOR_SCALE \"{}\": {}", *SCALE, e.what()); }
    }

    if (Env::envValue("CONSTELLATION_CURSOR_FADE"))
        env.fade = Env::envEnabled("CONSTELLATION_CURSOR_FADE");

    return env;
}

CConfigManager::CConfigManager(SP<IFileStat> fs, std::string path, SEnvOverrides env) : m_fs(fs), m_path(std::move(path)), m_env(env) {
    ;
}

const std::string& CConfigManager::path() const {
    return m_path;
}

const std::vector<std::string>& CConfigManager::lastErrors() const {
    return m_lastErrors;
}

SCursorConfig CConfigManager::clamp(SCursorConfig c) {
    c.scale            = std::clamp(c.scale, 0.5F, 10.F);
    c.outlineThickness = std::clamp(c.outlineThickness, 0.F, 5.F);
    c.fadeSpeed        = std::clamp(c.fadeSpeed, 1, 255);
    c.frostIntensity   = std::clamp(c.frostIntensity, 0, 100);
    c.hotspotThreshold = std::clamp(c.hotspotThreshold, 0, 50);
    c.pollInterval     = std::clamp(c.pollInterval, 1, 1000);
    return c;
}

SCursorConfig CConfigManager::parse(const std::string& content, std::vector<std::string>* errors) {
    const SCursorConfig DEFAULTS;

    // a fresh instance every time, values left over from a previous file must not survive
    auto config = makeUnique<Hyprlang::CConfig>(content.c_str(), Hyprlang::SConfigOptions{.throwAllErrors = true, .allowMissingConfig = true, .pathIsStream = true});

    config->addConfigValue("cursor_scale", Hyprlang::FLOAT{DEFAULTS.scale});
    config->addConfigValue("outline_thickness", Hyprlang::FLOAT{DEFAULTS.outlineThickness});
    config->addConfigValue("fade_enabled", Hyprlang::INT{DEFAULTS.fadeEnabled});
    config->addConfigValue("fade_in_enabled", Hyprlang::INT{DEFAULTS.fadeInEnabled});
    config->addConfigValue("fade_speed", Hyprlang::INT{DEFAULTS.fadeSpeed});
    config->addConfigValue("frost_intensity", Hyprlang::INT{DEFAULTS.frostIntensity});
    config->addConfigValue("hotspot_smoothing", Hyprlang::INT{DEFAULTS.hotspotSmoothing});
    config->addConfigValue("hotspot_threshold", Hyprlang::INT{DEFAULTS.hotspotThreshold});
    config->addConfigValue("config_polling", Hyprlang::INT{DEFAULTS.configPolling});
    config->addConfigValue("config_poll_interval", Hyprlang::INT{DEFAULTS.pollInterval});

    config->commence();

    const auto RESULT = config->parse();
    if (RESULT.error) {
        Debug::log(WARN, "CConfigManager: settings have errors, affected keys keep their defaults:\n{}", RESULT.getError());
        if (errors)
            errors->emplace_back(RESULT.getError());
    }

    // hyprlang only hands out what the registered type is, a bad any_cast means a programming error
    const auto    FLOATV = [&config](const char* name) { return std::any_cast<Hyprlang::FLOAT>(config->getConfigValue(name)); };
    const auto    INTV   = [&config](const char* name) { return std::any_cast<Hyprlang::INT>(config->getConfigValue(name)); };

    SCursorConfig out;
    out.scale            = FLOATV("cursor_scale");
    out.outlineThickness = FLOATV("outline_thickness");
    out.fadeEnabled      = INTV("fade_enabled") != 0;
    out.fadeInEnabled    = INTV("fade_in_enabled") != 0;
    out.fadeSpeed        = (int)std::clamp<Hyprlang::INT>(INTV("fade_speed"), INT32_MIN, INT32_MAX);
    out.frostIntensity   = (int)std::clamp<Hyprlang::INT>(INTV("frost_intensity"), INT32_MIN, INT32_MAX);
    out.hotspotSmoothing = INTV("hotspot_smoothing") != 0;
    out.hotspotThreshold = (int)std::clamp<Hyprlang::INT>(INTV("hotspot_threshold"), INT32_MIN, INT32_MAX);
    out.configPolling    = INTV("config_polling") != 0;
    out.pollInterval     = (int)std::clamp<Hyprlang::INT>(INTV("config_poll_interval"), INT32_MIN, INT32_MAX);

    // nan can't be clamped, treat it like any other malformed value
    if (std::isnan(out.scale))
        out.scale = DEFAULTS.scale;
    if (std::isnan(out.outlineThickness))
        out.outlineThickness = DEFAULTS.outlineThickness;

    return clamp(out);
}

SCursorConfig CConfigManager::load() {
    m_lastErrors.clear();

    if (!m_path.empty() && !m_fs->mtime(m_path)) {
        if (m_fs->write(m_path, defaultConfigContent()))
            Debug::log(LOG, "CConfigManager: wrote default settings to {}", m_path);
    }

    SCursorConfig config;

    if (const auto CONTENT = m_path.empty() ? std::nullopt : m_fs->read(m_path); CONTENT)
        config = parse(*CONTENT, &m_lastErrors);
    else
        Debug::log(LOG, "CConfigManager: no readable settings at {}, using defaults", m_path);

    if (m_env.scale)
        config.scale = *m_env.scale;
    if (m_env.fade)
        config.fadeEnabled = *m_env.fade;

    Debug::log(LOG, "CConfigManager: scale {:.2f}, outline {:.1f}, fade {}/{} speed {}, frost {}, smoothing {} ({}px), polling {} every {}", config.scale, config.outlineThickness,
               config.fadeEnabled, config.fadeInEnabled, config.fadeSpeed, config.frostIntensity, config.hotspotSmoothing, config.hotspotThreshold, config.configPolling,
               config.pollInterval);

    return config;
}

std::string CConfigManager::defaultConfigContent() {
    return R"#(# constellation_cursor settings
# Changes are picked up while the cursor moves, no restart needed.

# Size multiplier for the cursor (0.5 - 10.0)
cursor_scale = 1.5

# Outline thickness in pixels, 0 keeps each shape's own outline (0 - 5.0)
outline_thickness = 0

# Fade the cursor out instead of hiding it instantly
fade_enabled = false

# Fade the cursor back in when it reappears
fade_in_enabled = false

# Alpha change per fade step, about 60 steps a second (1 - 255)
fade_speed = 30

# Frosted glass blur over the cursor (0 - 100)
frost_intensity = 0

# Smooth hotspot transitions between cursor types
hotspot_smoothing = false

# Hotspot changes up to this many pixels are ignored when smoothing (0 - 50)
hotspot_threshold = 0

# Check this file for changes while the cursor moves
config_polling = true

# Cursor moves between two checks (1 - 1000)
config_poll_interval = 50
)#";
}
