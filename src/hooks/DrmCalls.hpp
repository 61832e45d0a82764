#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <vector>

#include <xf86drmMode.h>

struct SObjectProperty {
    uint32_t id    = 0;
    uint64_t value = 0;
};

using PropertyMap = std::unordered_map<std::string, SObjectProperty>;

// Everything we ask of the kernel display interface. The live implementation
// always reaches the real entry points, never our own exports. Tests fake this.
class IDrmCalls {
  public:
    virtual ~IDrmCalls() = default;

    // exactly one call into the next ioctl, errno left as it set it. For the host's requests.
    virtual int                        forwardIoctl(int fd, unsigned long request, void* arg)  = 0;
    // retries on EINTR and EAGAIN like drmIoctl. Only for requests we issue ourselves.
    virtual int                        ioctl(int fd, unsigned long request, void* arg)         = 0;
    virtual void*                      mmap(size_t length, int fd, off_t offset)               = 0;
    virtual int                        munmap(void* addr, size_t length)                       = 0;

    virtual int                        addFB2(int fd, uint32_t width, uint32_t height, uint32_t format, uint32_t handle, uint32_t pitch, uint32_t* fbId) = 0;
    virtual int                        rmFB(int fd, uint32_t fbId)                             = 0;

    virtual std::optional<uint64_t>    getCap(int fd, uint64_t capability)                     = 0;

    // crtc ids in kernel index order, the order possible_crtcs bits refer to
    virtual std::vector<uint32_t>      crtcIds(int fd)                                         = 0;
    virtual std::vector<uint32_t>      planeIds(int fd)                                        = 0;
    virtual std::optional<uint32_t>    planePossibleCrtcs(int fd, uint32_t planeId)            = 0;
    virtual std::optional<PropertyMap> planeProperties(int fd, uint32_t planeId)               = 0;

    // the intercepted entry points themselves
    virtual int setCursor(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height)                             = 0;
    virtual int setCursor2(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height, int32_t hotX, int32_t hotY) = 0;
    virtual int moveCursor(int fd, uint32_t crtcId, int x, int y)                                                            = 0;
    virtual int atomicAddProperty(drmModeAtomicReqPtr req, uint32_t objectId, uint32_t propertyId, uint64_t value)           = 0;
};

class CHookSystem;

class CRealDrmCalls : public IDrmCalls {
  public:
    CRealDrmCalls(CHookSystem& hooks);

    virtual int                        forwardIoctl(int fd, unsigned long request, void* arg);
    virtual int                        ioctl(int fd, unsigned long request, void* arg);
    virtual void*                      mmap(size_t length, int fd, off_t offset);
    virtual int                        munmap(void* addr, size_t length);

    virtual int                        addFB2(int fd, uint32_t width, uint32_t height, uint32_t format, uint32_t handle, uint32_t pitch, uint32_t* fbId);
    virtual int                        rmFB(int fd, uint32_t fbId);

    virtual std::optional<uint64_t>    getCap(int fd, uint64_t capability);

    virtual std::vector<uint32_t>      crtcIds(int fd);
    virtual std::vector<uint32_t>      planeIds(int fd);
    virtual std::optional<uint32_t>    planePossibleCrtcs(int fd, uint32_t planeId);
    virtual std::optional<PropertyMap> planeProperties(int fd, uint32_t planeId);

    virtual int                        setCursor(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height);
    virtual int                        setCursor2(int fd, uint32_t crtcId, uint32_t bo, uint32_t width, uint32_t height, int32_t hotX, int32_t hotY);
    virtual int                        moveCursor(int fd, uint32_t crtcId, int x, int y);
    virtual int                        atomicAddProperty(drmModeAtomicReqPtr req, uint32_t objectId, uint32_t propertyId, uint64_t value);

  private:
    using PFN_IOCTL        = int (*)(int, unsigned long, ...);
    using PFN_SETCURSOR    = int (*)(int, uint32_t, uint32_t, uint32_t, uint32_t);
    using PFN_SETCURSOR2   = int (*)(int, uint32_t, uint32_t, uint32_t, uint32_t, int32_t, int32_t);
    using PFN_MOVECURSOR   = int (*)(int, uint32_t, int, int);
    using PFN_GETPLANE     = drmModePlanePtr (*)(int, uint32_t);
    using PFN_ATOMICADDPROP = int (*)(drmModeAtomicReqPtr, uint32_t, uint32_t, uint64_t);

    PFN_IOCTL         m_ioctl             = nullptr;
    PFN_SETCURSOR     m_setCursor         = nullptr;
    PFN_SETCURSOR2    m_setCursor2        = nullptr;
    PFN_MOVECURSOR    m_moveCursor        = nullptr;
    PFN_GETPLANE      m_getPlane          = nullptr;
    PFN_ATOMICADDPROP m_atomicAddProperty = nullptr;
};
