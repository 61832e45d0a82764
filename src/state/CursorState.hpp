#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <hyprutils/math/Vector2D.hpp>

using namespace Hyprutils::Math;

enum eCursorType : uint8_t {
    CURSOR_DEFAULT = 0,
    CURSOR_POINTER,
    CURSOR_TEXT,
    CURSOR_CROSSHAIR,
    CURSOR_WAIT,
    CURSOR_GRAB,
    CURSOR_GRABBING,
    CURSOR_FORBIDDEN,

    CURSOR_TYPE_COUNT,
};

// accepts the names and aliases used by the control file and the env
std::optional<eCursorType> cursorTypeFromString(const std::string& str);
const char*                cursorTypeToString(eCursorType type);

// one fade tick: moves current towards target by speed, never overshoots
uint8_t stepFade(uint8_t current, uint8_t target, int speed);

// Distributes a hotspot jump larger than the threshold over the next few moves,
// each closing a third of the remaining delta. The last one snaps.
class CHotspotSmoother {
  public:
    static constexpr int MAX_STEPS = 4;

    void                 configure(bool enabled, int threshold);

    // returns true if the applied hotspot changed
    bool            setTarget(const Vector2D& target);
    bool            onMove();
    void            snap();

    const Vector2D& applied() const;
    const Vector2D& target() const;
    bool            pending() const;

  private:
    bool     m_enabled     = false;
    int      m_threshold   = 0;
    bool     m_initialized = false;
    int      m_stepsLeft   = 0;

    Vector2D m_applied, m_target;
};

// Everything the synthesizer needs plus the fade bookkeeping. Guarded by the
// override manager's mutex, never touched without it.
struct SRenderState {
    eCursorType           type        = CURSOR_DEFAULT;
    float                 scale       = 1.5F;
    float                 outline     = 0.F;
    int                   frost       = 0;

    uint8_t               alpha       = 255;
    uint8_t               targetAlpha = 255;
    bool                  hidden      = false;

    CHotspotSmoother      hotspot;

    // last synthesis at full opacity, and the same with alpha applied. Premultiplied ARGB.
    std::vector<uint32_t> opaquePixels;
    std::vector<uint32_t> pixels;
    uint32_t              displaySize = 64;
    Vector2D              reportedHotspot;

    // dirty needs a full synthesis, alphaDirty only the alpha pass over opaquePixels
    bool                  dirty      = true;
    bool                  alphaDirty = false;
    uint32_t              synthesisCount = 0;

    // transitions, each returns whether anything changed. Alpha marks alphaDirty, the rest dirty.
    bool setType(eCursorType t);
    bool setScale(float s);
    bool setStyle(float outline, int frost);
    bool setAlpha(uint8_t a);
};
