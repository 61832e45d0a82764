// The symbols the host resolves to us instead of libc and libdrm.
// <sys/ioctl.h> stays out of this file, our ioctl() is the definition.

#include "HookSystem.hpp"
#include "DrmCalls.hpp"
#include "../config/ConfigManager.hpp"
#include "../config/ConfigWatcher.hpp"
#include "../debug/Log.hpp"
#include "../helpers/env/Env.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../managers/CursorOverrideManager.hpp"

#include <atomic>
#include <cstdarg>
#include <exception>

#include <drm.h>
#include <drm_mode.h>
#include <xf86drmMode.h>

// first of the mode setting requests, only primary nodes take these
constexpr unsigned int MODE_IOCTL_FIRST = 0xA0;

// the device handle the host last used for mode setting, atomic requests don't carry one
static std::atomic<int> g_modesetFd = -1;

static SP<IDrmCalls>&   realCalls() {
    static auto* const CALLS = new SP<IDrmCalls>(makeShared<CRealDrmCalls>(hookSystem()));
    return *CALLS;
}

static CCursorOverrideManager& manager() {
    // never destroyed, see hookSystem()
    static auto* const MANAGER = [] {
        // anything we do while setting up must not come back in here
        NHooks::CForwardGuard guard;

        CCursorOverrideManager::SOptions options;
        options.settingsPath = NFsUtils::getSettingsPath().value_or("");
        options.env          = SEnvOverrides::fromEnvironment();

        if (options.settingsPath.empty())
            Debug::log(WARN, "Exports: neither XDG_CONFIG_HOME nor HOME is set, running without a settings file");

        return new CCursorOverrideManager(realCalls(), makeShared<CRealFileStat>(), options);
    }();

    return *MANAGER;
}

static bool isModeIoctl(unsigned long request) {
    return _IOC_TYPE(request) == DRM_IOCTL_BASE && _IOC_NR(request) >= MODE_IOCTL_FIRST;
}

extern "C" {

// NOLINTNEXTLINE
int ioctl(int fd, unsigned long request, ...) noexcept {
    va_list args;
    va_start(args, request);
    void* arg = va_arg(args, void*);
    va_end(args);

    if (isModeIoctl(request))
        g_modesetFd.store(fd, std::memory_order_relaxed);

    if ((request != DRM_IOCTL_MODE_CURSOR && request != DRM_IOCTL_MODE_CURSOR2) || NHooks::inForward())
        return realCalls()->forwardIoctl(fd, request, arg);

    try {
        return manager().onCursorIoctl(fd, request, arg);
    } catch (std::exception& e) { Debug::log(ERR, "Exports: cursor ioctl failed with {}, forwarding", e.what()); }

    return realCalls()->forwardIoctl(fd, request, arg);
}

int drmModeSetCursor(int fd, uint32_t crtcId, uint32_t bo_handle, uint32_t width, uint32_t height) {
    Debug::log(TRACE, "Exports: drmModeSetCursor fd {} crtc {} bo {} {}x{}", fd, crtcId, bo_handle, width, height);

    try {
        return manager().onSetCursor(fd, crtcId, bo_handle, width, height);
    } catch (std::exception& e) { Debug::log(ERR, "Exports: drmModeSetCursor failed with {}, forwarding", e.what()); }

    return realCalls()->setCursor(fd, crtcId, bo_handle, width, height);
}

int drmModeSetCursor2(int fd, uint32_t crtcId, uint32_t bo_handle, uint32_t width, uint32_t height, int32_t hot_x, int32_t hot_y) {
    Debug::log(TRACE, "Exports: drmModeSetCursor2 fd {} crtc {} bo {} {}x{} hot {},{}", fd, crtcId, bo_handle, width, height, hot_x, hot_y);

    try {
        return manager().onSetCursor2(fd, crtcId, bo_handle, width, height, hot_x, hot_y);
    } catch (std::exception& e) { Debug::log(ERR, "Exports: drmModeSetCursor2 failed with {}, forwarding", e.what()); }

    return realCalls()->setCursor2(fd, crtcId, bo_handle, width, height, hot_x, hot_y);
}

int drmModeMoveCursor(int fd, uint32_t crtcId, int x, int y) {
    try {
        return manager().onMoveCursor(fd, crtcId, x, y);
    } catch (std::exception& e) { Debug::log(ERR, "Exports: drmModeMoveCursor failed with {}, forwarding", e.what()); }

    return realCalls()->moveCursor(fd, crtcId, x, y);
}

drmModePlanePtr drmModeGetPlane(int fd, uint32_t plane_id) {
    const auto* HOOK = hookSystem().getHook("drmModeGetPlane");
    if (!HOOK || !HOOK->m_active)
        return nullptr;

    drmModePlanePtr plane = HOOK->original<drmModePlanePtr (*)(int, uint32_t)>()(fd, plane_id);

    if (plane && !NHooks::inForward()) {
        try {
            manager().onGetPlane(fd, plane_id);
        } catch (std::exception& e) { Debug::log(ERR, "Exports: plane lookup for {} failed with {}", plane_id, e.what()); }
    }

    return plane;
}

int drmModeAtomicAddProperty(drmModeAtomicReqPtr req, uint32_t object_id, uint32_t property_id, uint64_t value) {
    if (NHooks::inForward())
        return realCalls()->atomicAddProperty(req, object_id, property_id, value);

    try {
        return manager().onAtomicAddProperty(g_modesetFd.load(std::memory_order_relaxed), req, object_id, property_id, value);
    } catch (std::exception& e) { Debug::log(ERR, "Exports: drmModeAtomicAddProperty failed with {}, forwarding", e.what()); }

    return realCalls()->atomicAddProperty(req, object_id, property_id, value);
}
}

__attribute__((constructor)) static void onAttach() {
    Debug::init();

    // resolve everything up front, later lookups happen on the host's hot path
    const auto& HOOKS = hookSystem();

    if (Env::isInfo())
        Debug::log(INFO, "{}", HOOKS.describe());

    Debug::log(LOG, "Exports: attached, {} calls intercepted", HOOKS.hooks().size());
}

__attribute__((destructor)) static void onDetach() {
    Debug::close();
}
