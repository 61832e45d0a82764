#include "DrmCalls.hpp"
#include "HookSystem.hpp"
#include "../debug/Log.hpp"

#include <cerrno>
#include <sys/mman.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <xf86drm.h>

CRealDrmCalls::CRealDrmCalls(CHookSystem& hooks) {
    const auto ORIGINAL = [&hooks]<typename T>(const char* symbol, T& out) {
        if (const auto* HOOK = hooks.getHook(symbol); HOOK && HOOK->m_active)
            out = HOOK->original<T>();
    };

    ORIGINAL("ioctl", m_ioctl);
    ORIGINAL("drmModeSetCursor", m_setCursor);
    ORIGINAL("drmModeSetCursor2", m_setCursor2);
    ORIGINAL("drmModeMoveCursor", m_moveCursor);
    ORIGINAL("drmModeGetPlane", m_getPlane);
    ORIGINAL("drmModeAtomicAddProperty", m_atomicAddProperty);
}

int CRealDrmCalls::forwardIoctl(int fd, unsigned long request, void* arg) {
    return m_ioctl ? m_ioctl(fd, request, arg) : (int)syscall(SYS_ioctl, fd, request, arg);
}

int CRealDrmCalls::ioctl(int fd, unsigned long request, void* arg) {
    // same retry loop as drmIoctl
    int ret = 0;
    do {
        ret = forwardIoctl(fd, request, arg);
    } while (ret == -1 && (errno == EINTR || errno == EAGAIN));

    return ret;
}

void* CRealDrmCalls::mmap(size_t length, int fd, off_t offset) {
    return ::mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, offset);
}

int CRealDrmCalls::munmap(void* addr, size_t length) {
    return ::munmap(addr, length);
}

int CRealDrmCalls::addFB2(int fd, uint32_t width, uint32_t height, uint32_t format, uint32_t handle, uint32_t pitch, uint32_t* fbId) {
    const uint32_t HANDLES[4] = {handle, 0, 0, 0};
    const uint32_t PITCHES[4] = {pitch, 0, 0, 0};
    const uint32_t OFFSETS[4] = {0, 0, 0, 0};

    return drmModeAddFB2(fd, width, height, format, HANDLES, PITCHES, OFFSETS, fbId, 0);
}

int CRealDrmCalls::rmFB(int fd, uint32_t fbId) {
    return drmModeRmFB(fd, fbId);
}

std::optional<uint64_t> CRealDrmCalls::getCap(int fd, uint64_t capability) {
    uint64_t value = 0;
    if (drmGetCap(fd, capability, &value) != 0)
        return std::nullopt;

    return value;
}

std::vector<uint32_t> CRealDrmCalls::crtcIds(int fd) {
    std::vector<uint32_t> result;

    auto*                 res = drmModeGetResources(fd);
    if (!res)
        return result;

    result.assign(res->crtcs, res->crtcs + res->count_crtcs);
    drmModeFreeResources(res);

    return result;
}

std::vector<uint32_t> CRealDrmCalls::planeIds(int fd) {
    std::vector<uint32_t> result;

    auto*                 res = drmModeGetPlaneResources(fd);
    if (!res)
        return result;

    result.assign(res->planes, res->planes + res->count_planes);
    drmModeFreePlaneResources(res);

    return result;
}

std::optional<uint32_t> CRealDrmCalls::planePossibleCrtcs(int fd, uint32_t planeId) {
    // through the real pointer, calling drmModeGetPlane by name would land in our own export
    if (!m_getPlane)
        return std::nullopt;

    auto* plane = m_getPlane(fd, planeId);
    if (!plane)
        return std::nullopt;

    const uint32_t POSSIBLE = plane->possible_crtcs;
    drmModeFreePlane(plane);

    return POSSIBLE;
}

std::optional<PropertyMap> CRealDrmCalls::planeProperties(int fd, uint32_t planeId) {
    auto* props = drmModeObjectGetProperties(fd, planeId, DRM_MODE_OBJECT_PLANE);
    if (!props)
        return std::nullopt;

    PropertyMap result;
    for (uint32_t i = 0; i < props->count_props; ++i) {
        auto* prop = drmModeGetProperty(fd, props->props[i]);
        if (!prop)
            continue;

        result[prop->name] = SObjectProperty{.id = prop->prop_id, .value = props->prop_values[i]};
        drmModeFreeProperty(prop);
    }

    drmModeFreeObjectProperties(props);

    return result;
}

int CRealDrmCalls::setCursor(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height) {
    if (!m_setCursor)
        return -ENOSYS;

    NHooks::CForwardGuard guard;
    return m_setCursor(fd, crtcId, bo, width, height);
}

int CRealDrmCalls::setCursor2(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height, int32_t hotX, int32_t hotY) {
    if (!m_setCursor2)
        return -ENOSYS;

    NHooks::CForwardGuard guard;
    return m_setCursor2(fd, crtcId, bo, width, height, hotX, hotY);
}

int CRealDrmCalls::moveCursor(int fd, uint32_t crtcId, int x, int y) {
    if (!m_moveCursor)
        return -ENOSYS;

    NHooks::CForwardGuard guard;
    return m_moveCursor(fd, crtcId, x, y);
}

int CRealDrmCalls::atomicAddProperty(drmModeAtomicReqPtr req, uint32_t objectId, uint32_t propertyId, uint64_t value) {
    if (!m_atomicAddProperty)
        return -ENOSYS;

    return m_atomicAddProperty(req, objectId, propertyId, value);
}
