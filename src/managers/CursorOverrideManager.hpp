#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <xf86drmMode.h>

#include "../config/ConfigManager.hpp"
#include "../config/ConfigWatcher.hpp"
#include "../helpers/memory/Memory.hpp"
#include "../render/Synthesizer.hpp"
#include "../state/CursorState.hpp"

class IDrmCalls;
class CPlaneLocator;
class CKernelBuffer;
class CFadeAnimator;

// The substitution engine. Every intercepted cursor call goes through here and
// is either rewritten to show our buffer or forwarded untouched.
//
// Locking: m_mutex guards the render state, the buffer and the config. It is
// released before any real entry point runs. The locator has its own lock and
// is always queried before m_mutex is taken. Fade ticks take m_mutex from the
// animator thread.
class CCursorOverrideManager {
  public:
    struct SOptions {
        std::string               settingsPath;
        SControlPaths             controlPaths;
        SEnvOverrides             env;
        std::chrono::milliseconds fadeInterval = std::chrono::milliseconds(16);
    };

    CCursorOverrideManager(SP<IDrmCalls> drm, SP<IFileStat> fs, SOptions options);
    ~CCursorOverrideManager();

    CCursorOverrideManager(const CCursorOverrideManager&)            = delete;
    CCursorOverrideManager& operator=(const CCursorOverrideManager&) = delete;

    // legacy entry points
    int  onSetCursor(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height);
    int  onSetCursor2(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height, int32_t hotX, int32_t hotY);
    int  onMoveCursor(int fd, uint32_t crtcId, int x, int y);

    // raw DRM_IOCTL_MODE_CURSOR / CURSOR2, arg is never modified
    int  onCursorIoctl(int fd, unsigned long request, void* arg);

    // atomic, fd is the last mode setting handle the host used
    int  onAtomicAddProperty(int fd, drmModeAtomicReqPtr req, uint32_t objectId, uint32_t propertyId, uint64_t value);

    // host enumerated a plane, warm the cache for its device
    void onGetPlane(int fd, uint32_t planeId);

    // one animator step, returns true once alpha reached its target
    bool fadeTick();

    //
    SRenderState      stateSnapshot();
    SCursorConfig     config();
    uint32_t          framebufferId();
    bool              fadeActive();
    bool              customShapeActive();
    CPlaneLocator&    locator();

  private:
    enum eLegacyKind : uint8_t {
        LEGACY_NONE = 0,
        LEGACY_SET,
        LEGACY_SET2,
    };

    // everything below expects m_mutex to be held
    void                     onMoveEvent();
    void                     applyConfig(const SCursorConfig& config);
    void                     applyEffective();
    void                     reloadCustomShape();
    const SShapeDefinition&  currentShape() const;
    bool                     ensureBuffer(int fd);
    bool                     ensureSynthesized();
    uint32_t                 maxDisplaySize(int fd);

    // true if our buffer stays attached while it fades out
    bool                     beginHide();
    void                     beginShow();
    void                     startFade(uint8_t target);

    Vector2D                 correctedPosition(int x, int y) const;

    SP<IDrmCalls>            m_drm;
    SP<IFileStat>            m_fs;
    SOptions                 m_options;

    UP<CPlaneLocator>        m_locator;
    UP<CConfigManager>       m_configManager;
    UP<CConfigWatcher>       m_watcher;
    UP<CKernelBuffer>        m_buffer;
    UP<CFadeAnimator>        m_animator;
    CSynthesizer             m_synthesizer;

    std::mutex               m_mutex;
    SRenderState             m_state;
    SCursorConfig            m_config;

    // committed control file values, the env still wins over them
    std::optional<eCursorType> m_controlType;
    std::optional<float>       m_controlScale;

    // the custom cursor file wins over every type while it exists
    std::optional<std::string>      m_customSource;
    std::optional<SShapeDefinition> m_customShape;

    bool                     m_substituting = false;
    Vector2D                 m_hostHotspot;
    int                      m_allocFailedFd = -1;
    std::unordered_map<int, uint32_t> m_maxDisplaySizes;

    // what the legacy plane currently has from us
    eLegacyKind              m_legacyKind = LEGACY_NONE;
    uint32_t                 m_legacySize = 0;
    Vector2D                 m_legacyHotspot;
};
