#pragma once

#include <hooks/DrmCalls.hpp>
#include <config/ConfigWatcher.hpp>

#include <cerrno>
#include <cstring>
#include <map>
#include <unordered_map>
#include <vector>

#include <drm.h>
#include <drm_mode.h>
#include <xf86drmMode.h>

// One device with a primary plane (40) and a cursor plane (41) that can only sit on crtc 31.
class CFakeDrmCalls : public IDrmCalls {
  public:
    struct SCall {
        std::string name;
        int         fd = -1;
        uint32_t    crtcOrObject = 0, bo = 0, width = 0, height = 0;
        int64_t     x = 0, y = 0;
        uint32_t    prop  = 0;
        uint64_t    value = 0;
    };

    static constexpr uint32_t PRIMARY_PLANE = 40;
    static constexpr uint32_t CURSOR_PLANE  = 41;

    static constexpr uint32_t PROP_TYPE   = 1;
    static constexpr uint32_t PROP_FB_ID  = 100;
    static constexpr uint32_t PROP_SRC_W  = 101;
    static constexpr uint32_t PROP_SRC_H  = 102;
    static constexpr uint32_t PROP_CRTC_W = 103;
    static constexpr uint32_t PROP_CRTC_H = 104;
    static constexpr uint32_t PROP_CRTC_X = 105;
    static constexpr uint32_t PROP_CRTC_Y = 106;

    static constexpr uint32_t DUMB_HANDLE = 7;
    static constexpr uint32_t OUR_FB      = 42;

    CFakeDrmCalls() {
        crtcs  = {31, 32};
        planes = {PRIMARY_PLANE, CURSOR_PLANE};

        properties[PRIMARY_PLANE] = PropertyMap{{"type", {PROP_TYPE, DRM_PLANE_TYPE_PRIMARY}}, {"FB_ID", {PROP_FB_ID, 0}}};
        properties[CURSOR_PLANE]  = PropertyMap{
            {"type", {PROP_TYPE, DRM_PLANE_TYPE_CURSOR}},  {"FB_ID", {PROP_FB_ID, 0}},   {"SRC_W", {PROP_SRC_W, 0}},   {"SRC_H", {PROP_SRC_H, 0}},
            {"CRTC_W", {PROP_CRTC_W, 0}},                  {"CRTC_H", {PROP_CRTC_H, 0}}, {"CRTC_X", {PROP_CRTC_X, 0}}, {"CRTC_Y", {PROP_CRTC_Y, 0}},
        };

        possibleCrtcs[PRIMARY_PLANE] = 0b11;
        possibleCrtcs[CURSOR_PLANE]  = 0b01;
    }

    virtual int forwardIoctl(int fd, unsigned long request, void* arg) {
        ++forwardedIoctls;
        if (forwardErrno) {
            errno = *forwardErrno;
            return -1;
        }
        return handleIoctl(request, arg);
    }

    virtual int ioctl(int fd, unsigned long request, void* arg) {
        ++ownIoctls;
        return handleIoctl(request, arg);
    }

    int handleIoctl(unsigned long request, void* arg) {
        switch (request) {
            case DRM_IOCTL_MODE_CREATE_DUMB: {
                if (failCreateDumb)
                    return -1;
                auto* create   = (drm_mode_create_dumb*)arg;
                create->handle = DUMB_HANDLE;
                create->pitch  = create->width * 4;
                create->size   = (uint64_t)create->pitch * create->height;
                ++createdDumbs;
                return 0;
            }
            case DRM_IOCTL_MODE_MAP_DUMB: ((drm_mode_map_dumb*)arg)->offset = 0; return 0;
            case DRM_IOCTL_MODE_DESTROY_DUMB: ++destroyedDumbs; return 0;
            case DRM_IOCTL_MODE_CURSOR:
            case DRM_IOCTL_MODE_CURSOR2: {
                drm_mode_cursor2 cursor = {};
                std::memcpy(&cursor, arg, request == DRM_IOCTL_MODE_CURSOR2 ? sizeof(drm_mode_cursor2) : sizeof(drm_mode_cursor));
                cursorIoctls.push_back(cursor);
                return 0;
            }
            default: break;
        }

        return 0;
    }

    virtual void* mmap(size_t length, int fd, off_t offset) {
        mapping.assign(length, 0xAB);
        return mapping.data();
    }

    virtual int munmap(void* addr, size_t length) {
        return 0;
    }

    virtual int addFB2(int fd, uint32_t width, uint32_t height, uint32_t format, uint32_t handle, uint32_t pitch, uint32_t* fbId) {
        *fbId = OUR_FB;
        return 0;
    }

    virtual int rmFB(int fd, uint32_t fbId) {
        return 0;
    }

    virtual std::optional<uint64_t> getCap(int fd, uint64_t capability) {
        if (!cursorCap)
            return std::nullopt;
        return cursorCap;
    }

    virtual std::vector<uint32_t> crtcIds(int fd) {
        return crtcs;
    }

    virtual std::vector<uint32_t> planeIds(int fd) {
        ++planeEnumerations;
        return planes;
    }

    virtual std::optional<uint32_t> planePossibleCrtcs(int fd, uint32_t planeId) {
        if (!possibleCrtcs.contains(planeId))
            return std::nullopt;
        return possibleCrtcs[planeId];
    }

    virtual std::optional<PropertyMap> planeProperties(int fd, uint32_t planeId) {
        if (propertiesFail || !properties.contains(planeId))
            return std::nullopt;
        return properties[planeId];
    }

    virtual int setCursor(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height) {
        calls.push_back(SCall{.name = "setCursor", .fd = fd, .crtcOrObject = crtcId, .bo = bo, .width = width, .height = height});
        return 0;
    }

    virtual int setCursor2(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height, int32_t hotX, int32_t hotY) {
        calls.push_back(SCall{.name = "setCursor2", .fd = fd, .crtcOrObject = crtcId, .bo = bo, .width = width, .height = height, .x = hotX, .y = hotY});
        return 0;
    }

    virtual int moveCursor(int fd, uint32_t crtcId, int x, int y) {
        calls.push_back(SCall{.name = "moveCursor", .fd = fd, .crtcOrObject = crtcId, .x = x, .y = y});
        return 0;
    }

    virtual int atomicAddProperty(drmModeAtomicReqPtr req, uint32_t objectId, uint32_t propertyId, uint64_t value) {
        calls.push_back(SCall{.name = "atomicAddProperty", .crtcOrObject = objectId, .prop = propertyId, .value = value});
        if (rejectValue && value == *rejectValue)
            return -22;
        return 1;
    }

    const SCall& last() const {
        return calls.back();
    }

    std::vector<uint32_t>                       crtcs;
    std::vector<uint32_t>                       planes;
    std::unordered_map<uint32_t, PropertyMap>   properties;
    std::unordered_map<uint32_t, uint32_t>      possibleCrtcs;

    std::optional<uint64_t>                     cursorCap;
    std::optional<uint64_t>                     rejectValue;
    std::optional<int>                          forwardErrno;
    bool                                        failCreateDumb = false;
    bool                                        propertiesFail = false;

    std::vector<SCall>                          calls;
    std::vector<drm_mode_cursor2>               cursorIoctls;
    std::vector<uint8_t>                        mapping;
    int                                         createdDumbs = 0, destroyedDumbs = 0, planeEnumerations = 0;
    int                                         forwardedIoctls = 0, ownIoctls = 0;
};

// In-memory files, mtimes are bumped by hand.
class CFakeFileStat : public IFileStat {
  public:
    virtual std::optional<int64_t> mtime(const std::string& path) {
        if (!files.contains(path))
            return std::nullopt;
        return files[path].first;
    }

    virtual std::optional<std::string> read(const std::string& path) {
        ++reads[path];
        if (!files.contains(path))
            return std::nullopt;
        return files[path].second;
    }

    virtual bool write(const std::string& path, const std::string& content) {
        auto& f  = files[path];
        f.first  = ++clock;
        f.second = content;
        return true;
    }

    void touch(const std::string& path) {
        files[path].first = ++clock;
    }

    std::map<std::string, std::pair<int64_t, std::string>> files;
    std::map<std::string, int>                             reads;
    int64_t                                                clock = 1000;
};
