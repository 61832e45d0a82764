#include "PlaneLocator.hpp"
#include "../hooks/DrmCalls.hpp"
#include "../debug/Log.hpp"

#include <algorithm>
#include <iterator>

#include <xf86drmMode.h>

CPlaneLocator::CPlaneLocator(SP<IDrmCalls> drm) : m_drm(drm) {
    ;
}

std::optional<SPlaneInfo> CPlaneLocator::readPlane(int fd, uint32_t planeId) {
    const auto PROPS = m_drm->planeProperties(fd, planeId);
    if (!PROPS)
        return std::nullopt;

    const auto TYPE = PROPS->find("type");
    if (TYPE == PROPS->end() || TYPE->second.value != DRM_PLANE_TYPE_CURSOR)
        return std::nullopt;

    const auto PROP = [&PROPS](const char* name) -> uint32_t {
        const auto IT = PROPS->find(name);
        return IT == PROPS->end() ? 0 : IT->second.id;
    };

    SPlaneInfo info;
    info.planeId   = planeId;
    info.fbIdProp  = PROP("FB_ID");
    info.srcWProp  = PROP("SRC_W");
    info.srcHProp  = PROP("SRC_H");
    info.crtcWProp = PROP("CRTC_W");
    info.crtcHProp = PROP("CRTC_H");
    info.crtcXProp = PROP("CRTC_X");
    info.crtcYProp = PROP("CRTC_Y");

    info.hotspotXProp = PROP("HOTSPOT_X");
    info.hotspotYProp = PROP("HOTSPOT_Y");

    // without FB_ID there is nothing to substitute
    if (!info.fbIdProp)
        return std::nullopt;

    info.possibleCrtcs = m_drm->planePossibleCrtcs(fd, planeId).value_or(0);

    return info;
}

CPlaneLocator::SDeviceCache& CPlaneLocator::scanDevice(int fd) {
    if (const auto IT = m_devices.find(fd); IT != m_devices.end())
        return IT->second;

    SDeviceCache cache;
    cache.crtcs = m_drm->crtcIds(fd);

    for (const auto ID : m_drm->planeIds(fd)) {
        if (auto info = readPlane(fd, ID); info)
            cache.planes.emplace_back(*info);
    }

    Debug::log(LOG, "CPlaneLocator: fd {} has {} crtcs and {} cursor planes", fd, cache.crtcs.size(), cache.planes.size());
    for (const auto& p : cache.planes) {
        Debug::log(LOG, "CPlaneLocator:  plane {} FB_ID {} possible crtcs {:#x}", p.planeId, p.fbIdProp, p.possibleCrtcs);
    }

    // negative results are cached too, probing is far too expensive for every cursor move
    return m_devices.emplace(fd, std::move(cache)).first->second;
}

std::optional<SPlaneInfo> CPlaneLocator::locate(int fd, uint32_t crtcId) {
    std::lock_guard<std::mutex> lg(m_mutex);

    const auto&                 CACHE = scanDevice(fd);

    const auto                  IT = std::ranges::find(CACHE.crtcs, crtcId);
    if (IT == CACHE.crtcs.end()) {
        // no crtc list, a single cursor plane is still unambiguous
        if (CACHE.crtcs.empty() && CACHE.planes.size() == 1)
            return CACHE.planes.front();
        return std::nullopt;
    }

    const auto INDEX = std::distance(CACHE.crtcs.begin(), IT);
    if (INDEX >= 32)
        return std::nullopt;

    const uint32_t BIT = 1u << INDEX;

    for (const auto& p : CACHE.planes) {
        if (p.possibleCrtcs & BIT)
            return p;
    }

    return std::nullopt;
}

std::optional<SPlaneInfo> CPlaneLocator::planeForObject(int fd, uint32_t objectId) {
    std::lock_guard<std::mutex> lg(m_mutex);

    const auto&                 CACHE = scanDevice(fd);

    for (const auto& p : CACHE.planes) {
        if (p.planeId == objectId)
            return p;
    }

    return std::nullopt;
}

bool CPlaneLocator::revalidate(int fd, uint32_t planeId) {
    std::lock_guard<std::mutex> lg(m_mutex);

    const auto                  IT = m_devices.find(fd);
    if (IT == m_devices.end())
        return false;

    const bool CACHED = std::ranges::any_of(IT->second.planes, [planeId](const auto& p) { return p.planeId == planeId; });
    if (!CACHED)
        return false;

    if (m_drm->planeProperties(fd, planeId))
        return true;

    Debug::log(WARN, "CPlaneLocator: plane {} on fd {} stopped answering, dropping the cache", planeId, fd);
    m_devices.erase(IT);
    return false;
}

void CPlaneLocator::invalidate(int fd) {
    std::lock_guard<std::mutex> lg(m_mutex);
    m_devices.erase(fd);
}

size_t CPlaneLocator::cachedPlanes(int fd) {
    std::lock_guard<std::mutex> lg(m_mutex);

    const auto                  IT = m_devices.find(fd);
    return IT == m_devices.end() ? 0 : IT->second.planes.size();
}
