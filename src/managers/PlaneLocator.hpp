#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "../helpers/memory/Memory.hpp"

class IDrmCalls;

struct SPlaneInfo {
    uint32_t planeId       = 0;
    uint32_t possibleCrtcs = 0;

    uint32_t fbIdProp  = 0;
    uint32_t srcWProp  = 0;
    uint32_t srcHProp  = 0;
    uint32_t crtcWProp = 0;
    uint32_t crtcHProp = 0;
    uint32_t crtcXProp = 0;
    uint32_t crtcYProp = 0;

    // only on drivers that take the hotspot as plane state
    uint32_t hotspotXProp = 0;
    uint32_t hotspotYProp = 0;
};

// Finds and caches the cursor planes of every device handle the host uses.
// Its mutex is never held while the render state lock is taken.
class CPlaneLocator {
  public:
    CPlaneLocator(SP<IDrmCalls> drm);

    // the cursor plane able to sit on crtcId
    std::optional<SPlaneInfo> locate(int fd, uint32_t crtcId);

    // objectId if it is a cursor plane of fd
    std::optional<SPlaneInfo> planeForObject(int fd, uint32_t objectId);

    // re-reads one plane's properties, drops the whole fd entry on failure
    bool                      revalidate(int fd, uint32_t planeId);

    void                      invalidate(int fd);
    size_t                    cachedPlanes(int fd);

  private:
    struct SDeviceCache {
        std::vector<uint32_t>   crtcs;
        std::vector<SPlaneInfo> planes;
    };

    SDeviceCache&                          scanDevice(int fd);
    std::optional<SPlaneInfo>              readPlane(int fd, uint32_t planeId);

    SP<IDrmCalls>                          m_drm;
    std::unordered_map<int, SDeviceCache>  m_devices;
    std::mutex                             m_mutex;
};
