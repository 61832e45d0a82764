#include "KernelBuffer.hpp"
#include "../hooks/DrmCalls.hpp"
#include "../debug/Log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <sys/mman.h>

#include <drm.h>
#include <drm_fourcc.h>
#include <drm_mode.h>

CKernelBuffer::CKernelBuffer(SP<IDrmCalls> drm) : m_drm(drm) {
    ;
}

CKernelBuffer::~CKernelBuffer() {
    release();
}

std::expected<void, std::string> CKernelBuffer::alloc(int fd, uint32_t size) {
    release();

    drm_mode_create_dumb create = {};
    create.width                = size;
    create.height               = size;
    create.bpp                  = 32;

    if (m_drm->ioctl(fd, DRM_IOCTL_MODE_CREATE_DUMB, &create) != 0)
        return std::unexpected(std::format("CREATE_DUMB failed: {}", strerror(errno)));

    m_fd     = fd;
    m_handle = create.handle;
    m_pitch  = create.pitch;
    m_length = create.size;
    m_size   = size;

    if (const auto RET = m_drm->addFB2(fd, size, size, DRM_FORMAT_ARGB8888, m_handle, m_pitch, &m_fbId); RET != 0) {
        release();
        return std::unexpected(std::format("ADDFB2 failed: {}", RET));
    }

    drm_mode_map_dumb map = {};
    map.handle            = m_handle;

    if (m_drm->ioctl(fd, DRM_IOCTL_MODE_MAP_DUMB, &map) != 0) {
        release();
        return std::unexpected(std::format("MAP_DUMB failed: {}", strerror(errno)));
    }

    m_map = m_drm->mmap(m_length, fd, (off_t)map.offset);
    if (m_map == MAP_FAILED || !m_map) {
        m_map = nullptr;
        release();
        return std::unexpected(std::format("mmap of the dumb buffer failed: {}", strerror(errno)));
    }

    std::memset(m_map, 0, m_length);

    Debug::log(LOG, "CKernelBuffer: allocated {}x{} on fd {}, handle {}, fb {}", size, size, fd, m_handle, m_fbId);

    return {};
}

void CKernelBuffer::release() {
    if (m_map)
        m_drm->munmap(m_map, m_length);

    if (m_fbId)
        m_drm->rmFB(m_fd, m_fbId);

    if (m_handle) {
        drm_mode_destroy_dumb destroy = {};
        destroy.handle                = m_handle;
        if (m_drm->ioctl(m_fd, DRM_IOCTL_MODE_DESTROY_DUMB, &destroy) != 0)
            Debug::log(WARN, "CKernelBuffer: DESTROY_DUMB on handle {} failed", m_handle);
    }

    m_map    = nullptr;
    m_fbId   = 0;
    m_handle = 0;
    m_pitch  = 0;
    m_length = 0;
    m_size   = 0;
    m_fd     = -1;
}

bool CKernelBuffer::isAllocated() const {
    return m_map && m_fbId;
}

bool CKernelBuffer::upload(const std::vector<uint32_t>& pixels, uint32_t size) {
    if (!isAllocated() || pixels.size() < (size_t)size * size)
        return false;

    const uint32_t ROWS  = std::min(size, m_size);
    const size_t   BYTES = std::min<size_t>((size_t)size * 4, m_pitch);

    for (uint32_t y = 0; y < ROWS; ++y) {
        std::memcpy((uint8_t*)m_map + (size_t)y * m_pitch, pixels.data() + (size_t)y * size, BYTES);
    }

    return true;
}

int CKernelBuffer::fd() const {
    return m_fd;
}

uint32_t CKernelBuffer::handle() const {
    return m_handle;
}

uint32_t CKernelBuffer::fbId() const {
    return m_fbId;
}

uint32_t CKernelBuffer::size() const {
    return m_size;
}
