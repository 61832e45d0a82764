#include "CursorOverrideManager.hpp"
#include "FadeAnimator.hpp"
#include "PlaneLocator.hpp"
#include "../debug/Log.hpp"
#include "../hooks/DrmCalls.hpp"
#include "../render/CustomCursor.hpp"
#include "../render/KernelBuffer.hpp"
#include "../render/Rasterizer.hpp"
#include "../render/ShapeCatalog.hpp"

#include <algorithm>
#include <cstring>

#include <drm.h>
#include <drm_mode.h>
#include <xf86drm.h>

CCursorOverrideManager::CCursorOverrideManager(SP<IDrmCalls> drm, SP<IFileStat> fs, SOptions options) : m_drm(drm), m_fs(fs), m_options(std::move(options)) {
    m_locator       = makeUnique<CPlaneLocator>(m_drm);
    m_configManager = makeUnique<CConfigManager>(m_fs, m_options.settingsPath, m_options.env);
    m_watcher       = makeUnique<CConfigWatcher>(m_fs, m_options.settingsPath, m_options.controlPaths);
    m_buffer        = makeUnique<CKernelBuffer>(m_drm);
    m_animator      = makeUnique<CFadeAnimator>(m_options.fadeInterval);

    std::lock_guard<std::mutex> lg(m_mutex);

    applyConfig(m_configManager->load());
    reloadCustomShape();

    // whatever is on disk now is the baseline, not a change
    m_watcher->arm();

    Debug::log(LOG, "CCursorOverrideManager: ready, type {} at {:.2f}", cursorTypeToString(m_state.type), m_state.scale);
}

CCursorOverrideManager::~CCursorOverrideManager() {
    // the animator thread calls back into us, it has to go first
    m_animator.reset();
}

void CCursorOverrideManager::applyConfig(const SCursorConfig& config) {
    m_config = config;

    m_watcher->setPolling(config.configPolling, config.pollInterval);
    m_state.hotspot.configure(config.hotspotSmoothing, config.hotspotThreshold);
    m_state.setStyle(config.outlineThickness, config.frostIntensity);

    applyEffective();
}

void CCursorOverrideManager::applyEffective() {
    // env pins, then committed control files, then the settings file
    const auto TYPE  = m_options.env.type ? *m_options.env.type : m_controlType.value_or(CURSOR_DEFAULT);
    const auto SCALE = m_options.env.scale ? *m_options.env.scale : m_controlScale.value_or(m_config.scale);

    if (m_state.setType(TYPE))
        Debug::log(LOG, "CCursorOverrideManager: type is now {}", cursorTypeToString(TYPE));
    if (m_state.setScale(SCALE))
        Debug::log(LOG, "CCursorOverrideManager: scale is now {:.2f}", SCALE);
}

void CCursorOverrideManager::reloadCustomShape() {
    auto content = m_fs->read(m_options.controlPaths.custom);
    if (content == m_customSource)
        return;

    m_customSource = std::move(content);
    m_state.dirty  = true;

    if (!m_customSource) {
        Debug::log(LOG, "CCursorOverrideManager: no custom cursor, back to {}", cursorTypeToString(m_state.type));
        m_customShape.reset();
        return;
    }

    auto shape = NCustomCursor::parse(*m_customSource);
    if (!shape) {
        Debug::log(ERR, "CCursorOverrideManager: custom cursor {} is unusable ({}), drawing the arrow instead", m_options.controlPaths.custom, shape.error());
        m_customShape = shapeCatalog().get(CURSOR_DEFAULT);
        return;
    }

    Debug::log(LOG, "CCursorOverrideManager: using the custom cursor from {}", m_options.controlPaths.custom);
    m_customShape = std::move(*shape);
}

const SShapeDefinition& CCursorOverrideManager::currentShape() const {
    return m_customShape ? *m_customShape : shapeCatalog().get(m_state.type);
}

void CCursorOverrideManager::onMoveEvent() {
    const auto EVENT = m_watcher->onMove();

    if (EVENT.control.refresh) {
        if (EVENT.control.type)
            m_controlType = EVENT.control.type;
        if (EVENT.control.scale)
            m_controlScale = EVENT.control.scale;
    }

    if (EVENT.reloadSettings)
        applyConfig(m_configManager->load());
    else if (EVENT.control.refresh)
        applyEffective();

    if (EVENT.reloadCustom)
        reloadCustomShape();

    // a refresh always redraws, even when nothing we track changed
    if (EVENT.control.refresh)
        m_state.dirty = true;

    m_state.hotspot.onMove();

    if ((m_state.dirty || m_state.alphaDirty) && m_substituting && m_buffer->isAllocated())
        ensureSynthesized();
}

uint32_t CCursorOverrideManager::maxDisplaySize(int fd) {
    if (const auto IT = m_maxDisplaySizes.find(fd); IT != m_maxDisplaySizes.end())
        return IT->second;

    const auto WIDTH  = m_drm->getCap(fd, DRM_CAP_CURSOR_WIDTH);
    const auto HEIGHT = m_drm->getCap(fd, DRM_CAP_CURSOR_HEIGHT);

    // the kernel reports 64 for drivers that never set a limit, do the same
    uint32_t size = CURSOR_DISPLAY_SIZES[0];
    if (WIDTH && HEIGHT)
        size = (uint32_t)std::clamp<uint64_t>(std::min(*WIDTH, *HEIGHT), CURSOR_DISPLAY_SIZES[0], CURSOR_BUFFER_SIZE);

    Debug::log(LOG, "CCursorOverrideManager: fd {} allows cursors up to {}x{}", fd, size, size);

    m_maxDisplaySizes[fd] = size;
    return size;
}

bool CCursorOverrideManager::ensureBuffer(int fd) {
    if (m_buffer->isAllocated() && m_buffer->fd() == fd)
        return true;

    if (fd == m_allocFailedFd)
        return false;

    if (const auto RET = m_buffer->alloc(fd, CURSOR_BUFFER_SIZE); !RET) {
        Debug::log(ERR, "CCursorOverrideManager: couldn't allocate a cursor buffer on fd {}: {}. Passing the host cursor through.", fd, RET.error());
        m_allocFailedFd = fd;
        m_substituting  = false;
        return false;
    }

    // fresh mapping is blank
    m_state.dirty = true;
    m_legacyKind  = LEGACY_NONE;
    return true;
}

bool CCursorOverrideManager::ensureSynthesized() {
    if (!m_state.dirty && !m_state.alphaDirty && !m_state.pixels.empty())
        return true;

    if (m_state.dirty || m_state.opaquePixels.empty()) {
        // alpha is applied separately, fade ticks only redo that part
        const SSynthesisParams PARAMS = {
            .scale          = m_state.scale,
            .outline        = m_state.outline,
            .frost          = m_state.frost,
            .alpha          = 255,
            .maxDisplaySize = m_buffer->isAllocated() ? maxDisplaySize(m_buffer->fd()) : (uint32_t)CURSOR_BUFFER_SIZE,
        };

        auto result = m_synthesizer.synthesize(currentShape(), PARAMS);
        if (!result) {
            // keep showing the last good image if there is one
            Debug::log(ERR, "CCursorOverrideManager: synthesis failed: {}", result.error());
            return !m_state.pixels.empty();
        }

        m_state.opaquePixels    = std::move(result->pixels);
        m_state.reportedHotspot = result->hotspot;
        m_state.displaySize     = result->displaySize;
        m_state.dirty           = false;
        m_state.synthesisCount++;

        m_state.hotspot.setTarget(result->hotspot);
    }

    m_state.pixels = m_state.opaquePixels;
    NRasterizer::applyAlpha(m_state.pixels, m_state.alpha);
    m_state.alphaDirty = false;

    if (m_buffer->isAllocated() && !m_buffer->upload(m_state.pixels, CURSOR_BUFFER_SIZE))
        Debug::log(WARN, "CCursorOverrideManager: upload into fb {} failed", m_buffer->fbId());

    return true;
}

void CCursorOverrideManager::startFade(uint8_t target) {
    if (m_state.targetAlpha == target && m_animator->active())
        return;

    m_state.targetAlpha = target;

    if (m_state.alpha == target) {
        m_animator->stop();
        return;
    }

    m_animator->start([this] { return fadeTick(); });
}

bool CCursorOverrideManager::beginHide() {
    if (m_config.fadeEnabled && m_substituting && m_buffer->isAllocated()) {
        m_state.hidden = true;
        startFade(0);
        return true;
    }

    m_animator->stop();
    m_state.hidden      = true;
    m_state.targetAlpha = 0;
    m_substituting      = false;

    // the next show starts from nothing so it has something to fade in from
    if (m_config.fadeInEnabled)
        m_state.setAlpha(0);

    return false;
}

void CCursorOverrideManager::beginShow() {
    m_state.hidden = false;

    if (m_config.fadeInEnabled && m_state.alpha < 255) {
        startFade(255);
        return;
    }

    m_animator->stop();
    m_state.targetAlpha = 255;
    m_state.setAlpha(255);
}

bool CCursorOverrideManager::fadeTick() {
    std::lock_guard<std::mutex> lg(m_mutex);

    m_state.setAlpha(stepFade(m_state.alpha, m_state.targetAlpha, m_config.fadeSpeed));

    // the host may not commit again before the fade ends, refresh the mapping ourselves
    if (m_substituting && m_buffer->isAllocated())
        ensureSynthesized();

    return m_state.alpha == m_state.targetAlpha;
}

Vector2D CCursorOverrideManager::correctedPosition(int x, int y) const {
    // the host placed its own image by its own hotspot
    return Vector2D{(double)x, (double)y} + m_hostHotspot - m_state.hotspot.applied();
}

int CCursorOverrideManager::onSetCursor(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height) {
    const auto FORWARD = [&] { return m_drm->setCursor(fd, crtcId, bo, width, height); };

    const auto PLANE = m_locator->locate(fd, crtcId);
    if (!PLANE)
        return FORWARD();

    std::unique_lock<std::mutex> lk(m_mutex);

    if (bo == 0) {
        if (beginHide())
            return 0;

        m_legacyKind = LEGACY_NONE;
        lk.unlock();
        return FORWARD();
    }

    if (!ensureBuffer(fd)) {
        lk.unlock();
        return FORWARD();
    }

    beginShow();

    if (!ensureSynthesized()) {
        m_substituting = false;
        lk.unlock();
        return FORWARD();
    }

    m_substituting  = true;
    m_hostHotspot   = {};
    m_legacyKind    = LEGACY_SET;
    m_legacySize    = m_state.displaySize;

    const auto HANDLE = m_buffer->handle();
    const auto SIZE   = m_state.displaySize;

    lk.unlock();

    if (const auto RET = m_drm->setCursor(fd, crtcId, HANDLE, SIZE, SIZE); RET != 0) {
        Debug::log(WARN, "CCursorOverrideManager: setCursor with our bo failed ({}), forwarding the host's", RET);
        m_locator->revalidate(fd, PLANE->planeId);
        {
            std::lock_guard<std::mutex> lg(m_mutex);
            m_substituting = false;
            m_legacyKind   = LEGACY_NONE;
        }
        return FORWARD();
    }

    return 0;
}

int CCursorOverrideManager::onSetCursor2(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height, int32_t hotX, int32_t hotY) {
    const auto FORWARD = [&] { return m_drm->setCursor2(fd, crtcId, bo, width, height, hotX, hotY); };

    const auto PLANE = m_locator->locate(fd, crtcId);
    if (!PLANE)
        return FORWARD();

    std::unique_lock<std::mutex> lk(m_mutex);

    if (bo == 0) {
        if (beginHide())
            return 0;

        m_legacyKind = LEGACY_NONE;
        lk.unlock();
        return FORWARD();
    }

    if (!ensureBuffer(fd)) {
        lk.unlock();
        return FORWARD();
    }

    beginShow();

    if (!ensureSynthesized()) {
        m_substituting = false;
        lk.unlock();
        return FORWARD();
    }

    m_substituting  = true;
    m_hostHotspot   = Vector2D{(double)hotX, (double)hotY};
    m_legacyKind    = LEGACY_SET2;
    m_legacySize    = m_state.displaySize;
    m_legacyHotspot = m_state.hotspot.applied();

    const auto HANDLE = m_buffer->handle();
    const auto SIZE   = m_state.displaySize;
    const auto HOT    = m_legacyHotspot;

    lk.unlock();

    if (const auto RET = m_drm->setCursor2(fd, crtcId, HANDLE, SIZE, SIZE, (int32_t)HOT.x, (int32_t)HOT.y); RET != 0) {
        Debug::log(WARN, "CCursorOverrideManager: setCursor2 with our bo failed ({}), forwarding the host's", RET);
        m_locator->revalidate(fd, PLANE->planeId);
        {
            std::lock_guard<std::mutex> lg(m_mutex);
            m_substituting = false;
            m_legacyKind   = LEGACY_NONE;
        }
        return FORWARD();
    }

    return 0;
}

int CCursorOverrideManager::onMoveCursor(int fd, uint32_t crtcId, int x, int y) {
    const auto PLANE = m_locator->locate(fd, crtcId);
    if (!PLANE)
        return m_drm->moveCursor(fd, crtcId, x, y);

    std::unique_lock<std::mutex> lk(m_mutex);

    onMoveEvent();

    if (!m_substituting || m_legacyKind == LEGACY_NONE) {
        lk.unlock();
        return m_drm->moveCursor(fd, crtcId, x, y);
    }

    // a reload or smoothing step changed what the plane should hold
    const bool RESET = m_legacySize != m_state.displaySize || (m_legacyKind == LEGACY_SET2 && m_legacyHotspot != m_state.hotspot.applied());
    const auto KIND  = m_legacyKind;
    const auto HAND  = m_buffer->handle();
    const auto SIZE  = m_state.displaySize;
    const auto HOT   = m_state.hotspot.applied();
    const auto POS   = correctedPosition(x, y);

    if (RESET) {
        m_legacySize    = SIZE;
        m_legacyHotspot = HOT;
    }

    lk.unlock();

    if (RESET) {
        const auto RET = KIND == LEGACY_SET2 ? m_drm->setCursor2(fd, crtcId, HAND, SIZE, SIZE, (int32_t)HOT.x, (int32_t)HOT.y) : m_drm->setCursor(fd, crtcId, HAND, SIZE, SIZE);
        if (RET != 0)
            Debug::log(WARN, "CCursorOverrideManager: re-setting the cursor after a change failed ({})", RET);
    }

    return m_drm->moveCursor(fd, crtcId, (int)POS.x, (int)POS.y);
}

int CCursorOverrideManager::onCursorIoctl(int fd, unsigned long request, void* arg) {
    if (!arg || (request != DRM_IOCTL_MODE_CURSOR && request != DRM_IOCTL_MODE_CURSOR2))
        return m_drm->forwardIoctl(fd, request, arg);

    const bool       V2 = request == DRM_IOCTL_MODE_CURSOR2;

    drm_mode_cursor2 cursor = {};
    std::memcpy(&cursor, arg, V2 ? sizeof(drm_mode_cursor2) : sizeof(drm_mode_cursor));

    const auto PLANE = m_locator->locate(fd, cursor.crtc_id);
    if (!PLANE)
        return m_drm->forwardIoctl(fd, request, arg);

    std::unique_lock<std::mutex> lk(m_mutex);

    bool                         modified = false;

    if (cursor.flags & DRM_MODE_CURSOR_BO) {
        if (cursor.handle == 0) {
            if (beginHide()) {
                // ours stays up while it fades, only a move goes through
                if (!(cursor.flags & DRM_MODE_CURSOR_MOVE))
                    return 0;

                cursor.flags &= ~DRM_MODE_CURSOR_BO;
                modified = true;
            } else
                m_legacyKind = LEGACY_NONE;
        } else if (ensureBuffer(fd)) {
            beginShow();

            if (ensureSynthesized()) {
                m_substituting  = true;
                m_hostHotspot   = V2 ? Vector2D{(double)cursor.hot_x, (double)cursor.hot_y} : Vector2D{};
                m_legacyKind    = V2 ? LEGACY_SET2 : LEGACY_SET;
                m_legacySize    = m_state.displaySize;
                m_legacyHotspot = m_state.hotspot.applied();
                modified        = true;
            } else
                m_substituting = false;
        }
    }

    if (cursor.flags & DRM_MODE_CURSOR_MOVE) {
        onMoveEvent();

        if (m_substituting && m_legacyKind != LEGACY_NONE) {
            const auto POS = correctedPosition(cursor.x, cursor.y);
            cursor.x       = (int32_t)POS.x;
            cursor.y       = (int32_t)POS.y;
            modified       = true;

            if (m_legacySize != m_state.displaySize || (V2 && m_legacyHotspot != m_state.hotspot.applied())) {
                cursor.flags |= DRM_MODE_CURSOR_BO;
                m_legacySize    = m_state.displaySize;
                m_legacyHotspot = m_state.hotspot.applied();
            }
        }
    }

    if (modified && (cursor.flags & DRM_MODE_CURSOR_BO) && m_substituting) {
        cursor.handle = m_buffer->handle();
        cursor.width  = m_state.displaySize;
        cursor.height = m_state.displaySize;
        cursor.hot_x  = (int32_t)m_state.hotspot.applied().x;
        cursor.hot_y  = (int32_t)m_state.hotspot.applied().y;
    }

    lk.unlock();

    if (!modified)
        return m_drm->forwardIoctl(fd, request, arg);

    if (const auto RET = m_drm->forwardIoctl(fd, request, &cursor); RET != 0) {
        Debug::log(WARN, "CCursorOverrideManager: rewritten cursor ioctl failed, forwarding the host's");
        m_locator->revalidate(fd, PLANE->planeId);
        return m_drm->forwardIoctl(fd, request, arg);
    }

    return 0;
}

int CCursorOverrideManager::onAtomicAddProperty(int fd, drmModeAtomicReqPtr req, uint32_t objectId, uint32_t propertyId, uint64_t value) {
    const auto FORWARD = [&] { return m_drm->atomicAddProperty(req, objectId, propertyId, value); };

    if (fd < 0)
        return FORWARD();

    const auto PLANE = m_locator->planeForObject(fd, objectId);
    if (!PLANE)
        return FORWARD();

    const auto IS = [propertyId](uint32_t prop) { return prop != 0 && prop == propertyId; };

    uint64_t   newValue = value;

    {
        std::lock_guard<std::mutex> lg(m_mutex);

        if (IS(PLANE->fbIdProp)) {
            if (value == 0) {
                if (beginHide())
                    newValue = m_buffer->fbId();
            } else if (ensureBuffer(fd)) {
                beginShow();

                if (ensureSynthesized()) {
                    m_substituting = true;
                    newValue       = m_buffer->fbId();
                } else
                    m_substituting = false;
            }
        } else if (IS(PLANE->crtcXProp))
            onMoveEvent();
        else if (m_substituting) {
            if (IS(PLANE->srcWProp) || IS(PLANE->srcHProp))
                newValue = (uint64_t)m_state.displaySize << 16;
            else if (IS(PLANE->crtcWProp) || IS(PLANE->crtcHProp))
                newValue = m_state.displaySize;
            else if (IS(PLANE->hotspotXProp))
                newValue = (uint64_t)(int64_t)m_state.hotspot.applied().x;
            else if (IS(PLANE->hotspotYProp))
                newValue = (uint64_t)(int64_t)m_state.hotspot.applied().y;
        }
    }

    if (newValue == value)
        return FORWARD();

    Debug::log(TRACE, "CCursorOverrideManager: plane {} prop {}: {} -> {}", objectId, propertyId, value, newValue);

    if (const auto RET = m_drm->atomicAddProperty(req, objectId, propertyId, newValue); RET < 0) {
        Debug::log(WARN, "CCursorOverrideManager: substituted property {} was rejected ({}), forwarding the host's", propertyId, RET);
        m_locator->revalidate(fd, objectId);
        return FORWARD();
    } else
        return RET;
}

void CCursorOverrideManager::onGetPlane(int fd, uint32_t planeId) {
    if (fd < 0 || m_locator->planeForObject(fd, planeId))
        return;

    // the host can enumerate now, a cursorless scan from before may have been too early
    if (m_locator->cachedPlanes(fd) == 0)
        m_locator->invalidate(fd);
}

SRenderState CCursorOverrideManager::stateSnapshot() {
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_state;
}

SCursorConfig CCursorOverrideManager::config() {
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_config;
}

uint32_t CCursorOverrideManager::framebufferId() {
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_buffer->fbId();
}

bool CCursorOverrideManager::fadeActive() {
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_animator->active();
}

bool CCursorOverrideManager::customShapeActive() {
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_customShape.has_value();
}

CPlaneLocator& CCursorOverrideManager::locator() {
    return *m_locator;
}
