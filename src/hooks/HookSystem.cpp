#include "HookSystem.hpp"
#include "../debug/Log.hpp"
#include "../macros.hpp"

#include <dlfcn.h>
#include <format>

CSymbolHook::CSymbolHook(std::string symbol, std::string description) : m_symbol(std::move(symbol)), m_description(std::move(description)) {
    ;
}

bool CSymbolHook::resolve() {
    dlerror();
    m_original = dlsym(RTLD_NEXT, m_symbol.c_str());
    m_active   = m_original != nullptr;

    if (!m_active) {
        const char* DLERR = dlerror();
        Debug::log(ERR, " [HookSystem] couldn't resolve the real {}: {}. Calls to it will not be forwarded.", m_symbol, DLERR ? DLERR : "not found");
    }

    return m_active;
}

CHookSystem::CHookSystem() {
    initHook("ioctl", "raw DRM_IOCTL_MODE_CURSOR / CURSOR2 requests, device handle capture");
    initHook("drmModeSetCursor", "legacy cursor image");
    initHook("drmModeSetCursor2", "legacy cursor image with hotspot");
    initHook("drmModeMoveCursor", "legacy cursor position");
    initHook("drmModeGetPlane", "cursor plane detection");
    initHook("drmModeAtomicAddProperty", "atomic cursor plane FB_ID and size");
}

CSymbolHook* CHookSystem::initHook(const std::string& symbol, const std::string& description) {
    auto* const HOOK = m_hooks.emplace_back(makeUnique<CSymbolHook>(symbol, description)).get();
    HOOK->resolve();
    return HOOK;
}

CSymbolHook* CHookSystem::getHook(const std::string& symbol) const {
    for (const auto& h : m_hooks) {
        if (h->m_symbol == symbol)
            return h.get();
    }

    return nullptr;
}

const std::vector<UP<CSymbolHook>>& CHookSystem::hooks() const {
    return m_hooks;
}

std::string CHookSystem::describe() const {
    std::string result = std::format("constellation-cursor {}\nintercepted calls:\n", CONSTELLATION_VERSION);

    for (const auto& h : m_hooks) {
        result += std::format("  {:<26} {} {}\n", h->m_symbol, h->m_active ? "[ok]     " : "[missing]", h->m_description);
    }

    result += "environment:\n"
              "  CONSTELLATION_CURSOR_TYPE   default, pointer, text, crosshair, wait, grab, grabbing, not-allowed\n"
              "  CONSTELLATION_CURSOR_SCALE  0.5 - 10.0\n"
              "  CONSTELLATION_CURSOR_FADE   1 to fade out on hide\n"
              "  CONSTELLATION_CURSOR_DEBUG  1 for logs on stderr\n"
              "  CONSTELLATION_CURSOR_TRACE  1 for per-call logs, needs DEBUG\n"
              "  CONSTELLATION_CURSOR_INFO   1 for this summary\n";

    return result;
}

CHookSystem& hookSystem() {
    // never destroyed, the host keeps calling into us while it tears itself down
    static auto* const SYSTEM = new CHookSystem();
    return *SYSTEM;
}

static thread_local bool g_inForward = false;

NHooks::CForwardGuard::CForwardGuard() : m_previous(g_inForward) {
    g_inForward = true;
}

NHooks::CForwardGuard::~CForwardGuard() {
    g_inForward = m_previous;
}

bool NHooks::inForward() {
    return g_inForward;
}
