#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "../helpers/memory/Memory.hpp"

class IDrmCalls;

// A mapped dumb buffer wrapped in an ARGB8888 framebuffer object, what the
// cursor plane scans out. One per device, kept across type and scale changes.
class CKernelBuffer {
  public:
    CKernelBuffer(SP<IDrmCalls> drm);
    ~CKernelBuffer();

    CKernelBuffer(const CKernelBuffer&)            = delete;
    CKernelBuffer& operator=(const CKernelBuffer&) = delete;

    std::expected<void, std::string> alloc(int fd, uint32_t size);
    void                             release();
    bool                             isAllocated() const;

    // copies size x size premultiplied pixels row by row into the mapping
    bool     upload(const std::vector<uint32_t>& pixels, uint32_t size);

    int      fd() const;
    uint32_t handle() const;
    uint32_t fbId() const;
    uint32_t size() const;

  private:
    SP<IDrmCalls> m_drm;

    int           m_fd     = -1;
    uint32_t      m_handle = 0;
    uint32_t      m_fbId   = 0;
    uint32_t      m_pitch  = 0;
    uint64_t      m_length = 0;
    uint32_t      m_size   = 0;
    void*         m_map    = nullptr;
};
