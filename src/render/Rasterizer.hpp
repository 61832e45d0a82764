#pragma once

#include <cstdint>
#include <vector>

#include <hyprutils/math/Vector2D.hpp>

#include "../helpers/Color.hpp"
#include "ShapeCatalog.hpp"

using namespace Hyprutils::Math;

using Polygon = std::vector<Vector2D>;

// per-pixel coverage in 0..1
struct SCoverageMask {
    SCoverageMask(int w, int h);

    int                width = 0, height = 0;
    std::vector<float> data;

    float              at(int x, int y) const;
};

// premultiplied ARGB8888, row-major, stride == width
class CPixelBuffer {
  public:
    CPixelBuffer(int w, int h);

    int                          width() const;
    int                          height() const;

    uint32_t*                    data();
    const uint32_t*              data() const;
    const std::vector<uint32_t>& pixels() const;

    void                         clear();

  private:
    int                   m_width = 0, m_height = 0;
    std::vector<uint32_t> m_pixels;
};

namespace NRasterizer {
    constexpr int SUBSCANLINES = 4;
    constexpr int CURVE_STEPS  = 8;

    // closed polygon from a contour, cubics flattened in CURVE_STEPS pieces
    Polygon       flatten(const SContour& contour);

    double        signedArea(const Polygon& poly);

    // even-odd scanline fill, sub-scanline sampling with exact horizontal coverage
    SCoverageMask fill(const std::vector<Polygon>& polys, int w, int h);

    // miter offset of every vertex along its outward normal, holes offset inwards
    std::vector<Polygon> expand(const std::vector<Polygon>& polys, double thickness);

    // max(0, outer - inner)
    SCoverageMask ring(const SCoverageMask& outer, const SCoverageMask& inner);

    // premultiplied "over" of color * coverage onto dst
    void composite(CPixelBuffer& dst, const SCoverageMask& mask, const CColor& color);

    // premultiplied "over" of src * opacity onto dst
    void compositeBuffer(CPixelBuffer& dst, const CPixelBuffer& src, double opacity);

    // dst = src * coverage + dst * (1 - coverage), channel by channel
    void blend(CPixelBuffer& dst, const CPixelBuffer& src, const SCoverageMask& mask);

    // separable box blur of all four channels
    CPixelBuffer boxBlur(const CPixelBuffer& src, int radius);

    // multiplies every premultiplied channel by alpha / 255
    void applyAlpha(CPixelBuffer& buf, uint8_t alpha);
    void applyAlpha(std::vector<uint32_t>& pixels, uint8_t alpha);
};
