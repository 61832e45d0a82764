#include "CursorState.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

#include <hyprutils/string/String.hpp>
using namespace Hyprutils::String;

std::optional<eCursorType> cursorTypeFromString(const std::string& str) {
    static const std::unordered_map<std::string, eCursorType> ALIASES = {
        {"default", CURSOR_DEFAULT},     {"arrow", CURSOR_DEFAULT},       {"pointer", CURSOR_POINTER}, {"hand", CURSOR_POINTER},
        {"text", CURSOR_TEXT},           {"ibeam", CURSOR_TEXT},          {"i-beam", CURSOR_TEXT},     {"crosshair", CURSOR_CROSSHAIR},
        {"cross", CURSOR_CROSSHAIR},     {"wait", CURSOR_WAIT},           {"loading", CURSOR_WAIT},    {"busy", CURSOR_WAIT},
        {"grab", CURSOR_GRAB},           {"grabbing", CURSOR_GRABBING},   {"not-allowed", CURSOR_FORBIDDEN},
        {"forbidden", CURSOR_FORBIDDEN}, {"no", CURSOR_FORBIDDEN},
    };

    std::string lower = trim(str);
    std::ranges::transform(lower, lower.begin(), ::tolower);

    if (const auto IT = ALIASES.find(lower); IT != ALIASES.end())
        return IT->second;

    return std::nullopt;
}

const char* cursorTypeToString(eCursorType type) {
    switch (type) {
        case CURSOR_DEFAULT: return "default";
        case CURSOR_POINTER: return "pointer";
        case CURSOR_TEXT: return "text";
        case CURSOR_CROSSHAIR: return "crosshair";
        case CURSOR_WAIT: return "wait";
        case CURSOR_GRAB: return "grab";
        case CURSOR_GRABBING: return "grabbing";
        case CURSOR_FORBIDDEN: return "not-allowed";
        default: break;
    }

    return "unknown";
}

uint8_t stepFade(uint8_t current, uint8_t target, int speed) {
    speed = std::clamp(speed, 1, 255);

    if (current > target)
        return (uint8_t)std::max<int>(target, (int)current - speed);
    if (current < target)
        return (uint8_t)std::min<int>(target, (int)current + speed);

    return current;
}

void CHotspotSmoother::configure(bool enabled, int threshold) {
    m_enabled   = enabled;
    m_threshold = std::clamp(threshold, 0, 50);

    if (!m_enabled)
        snap();
}

bool CHotspotSmoother::setTarget(const Vector2D& target) {
    m_target = target;

    if (!m_initialized || !m_enabled) {
        m_initialized = true;
        const bool CHANGED = m_applied != target;
        m_applied          = target;
        m_stepsLeft        = 0;
        return CHANGED;
    }

    const auto DELTA = (m_target - m_applied);
    if (std::abs(DELTA.x) > m_threshold || std::abs(DELTA.y) > m_threshold) {
        // first step happens right away, the rest on the following moves
        m_stepsLeft = MAX_STEPS;
        return onMove();
    }

    // inside the dead zone the plane keeps its hotspot
    m_stepsLeft = 0;
    return false;
}

bool CHotspotSmoother::onMove() {
    if (m_stepsLeft <= 0)
        return false;

    const auto OLD = m_applied;

    if (--m_stepsLeft == 0)
        m_applied = m_target;
    else {
        const auto DELTA = m_target - m_applied;
        m_applied        = m_applied + Vector2D{std::trunc(DELTA.x / 3.0), std::trunc(DELTA.y / 3.0)};

        if (m_applied == m_target)
            m_stepsLeft = 0;
    }

    return OLD != m_applied;
}

void CHotspotSmoother::snap() {
    m_applied   = m_target;
    m_stepsLeft = 0;
}

const Vector2D& CHotspotSmoother::applied() const {
    return m_applied;
}

const Vector2D& CHotspotSmoother::target() const {
    return m_target;
}

bool CHotspotSmoother::pending() const {
    return m_stepsLeft > 0;
}

bool SRenderState::setType(eCursorType t) {
    if (t == type)
        return false;

    type  = t;
    dirty = true;
    return true;
}

bool SRenderState::setScale(float s) {
    s = std::clamp(s, 0.5F, 10.F);
    if (s == scale)
        return false;

    scale = s;
    dirty = true;
    return true;
}

bool SRenderState::setStyle(float outline_, int frost_) {
    if (outline_ == outline && frost_ == frost)
        return false;

    outline = outline_;
    frost   = frost_;
    dirty   = true;
    return true;
}

bool SRenderState::setAlpha(uint8_t a) {
    if (a == alpha)
        return false;

    alpha      = a;
    alphaDirty = true;
    return true;
}
