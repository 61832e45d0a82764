#include "Rasterizer.hpp"

#include <algorithm>
#include <cmath>

SCoverageMask::SCoverageMask(int w, int h) : width(w), height(h), data((size_t)w * h, 0.F) {
    ;
}

float SCoverageMask::at(int x, int y) const {
    if (x < 0 || y < 0 || x >= width || y >= height)
        return 0.F;

    return data[(size_t)y * width + x];
}

CPixelBuffer::CPixelBuffer(int w, int h) : m_width(w), m_height(h), m_pixels((size_t)w * h, 0) {
    ;
}

int CPixelBuffer::width() const {
    return m_width;
}

int CPixelBuffer::height() const {
    return m_height;
}

uint32_t* CPixelBuffer::data() {
    return m_pixels.data();
}

const uint32_t* CPixelBuffer::data() const {
    return m_pixels.data();
}

const std::vector<uint32_t>& CPixelBuffer::pixels() const {
    return m_pixels;
}

void CPixelBuffer::clear() {
    std::ranges::fill(m_pixels, 0);
}

static Vector2D cubicAt(const Vector2D& p0, const Vector2D& c1, const Vector2D& c2, const Vector2D& p1, double t) {
    const double U = 1.0 - t;
    return p0 * (U * U * U) + c1 * (3.0 * U * U * t) + c2 * (3.0 * U * t * t) + p1 * (t * t * t);
}

Polygon NRasterizer::flatten(const SContour& contour) {
    Polygon  out;
    Vector2D cursor = contour.start;
    out.emplace_back(cursor);

    for (const auto& s : contour.segments) {
        if (s.type == SEGMENT_CUBIC) {
            for (int i = 1; i <= CURVE_STEPS; ++i) {
                out.emplace_back(cubicAt(cursor, s.control1, s.control2, s.to, (double)i / CURVE_STEPS));
            }
        } else
            out.emplace_back(s.to);

        cursor = s.to;
    }

    // closing point is implicit
    if (out.size() > 1 && out.back() == out.front())
        out.pop_back();

    return out;
}

double NRasterizer::signedArea(const Polygon& poly) {
    double area = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        const auto& A = poly[i];
        const auto& B = poly[(i + 1) % poly.size()];
        area += A.x * B.y - B.x * A.y;
    }
    return area / 2.0;
}

SCoverageMask NRasterizer::fill(const std::vector<Polygon>& polys, int w, int h) {
    SCoverageMask       mask(w, h);
    std::vector<double> crossings;

    double              minY = h, maxY = 0;
    for (const auto& p : polys) {
        for (const auto& v : p) {
            minY = std::min(minY, v.y);
            maxY = std::max(maxY, v.y);
        }
    }

    const int Y0 = std::clamp((int)std::floor(minY), 0, h);
    const int Y1 = std::clamp((int)std::ceil(maxY) + 1, 0, h);

    for (int y = Y0; y < Y1; ++y) {
        float* row = &mask.data[(size_t)y * w];

        for (int sub = 0; sub < SUBSCANLINES; ++sub) {
            const double SY = y + (sub + 0.5) / SUBSCANLINES;

            crossings.clear();
            for (const auto& p : polys) {
                for (size_t i = 0; i < p.size(); ++i) {
                    const auto& A = p[i];
                    const auto& B = p[(i + 1) % p.size()];

                    // half-open so shared vertices count once, horizontal edges never
                    if ((A.y <= SY && B.y > SY) || (B.y <= SY && A.y > SY))
                        crossings.emplace_back(A.x + (SY - A.y) * (B.x - A.x) / (B.y - A.y));
                }
            }

            std::ranges::sort(crossings);

            for (size_t i = 0; i + 1 < crossings.size(); i += 2) {
                const double X0 = std::clamp(crossings[i], 0.0, (double)w);
                const double X1 = std::clamp(crossings[i + 1], 0.0, (double)w);
                if (X1 <= X0)
                    continue;

                const int PX0 = (int)std::floor(X0);
                const int PX1 = std::min((int)std::ceil(X1), w);

                for (int px = PX0; px < PX1; ++px) {
                    const double COVER = std::min(X1, px + 1.0) - std::max(X0, (double)px);
                    if (COVER > 0)
                        row[px] += (float)(COVER / SUBSCANLINES);
                }
            }
        }

        for (int x = 0; x < w; ++x) {
            row[x] = std::min(row[x], 1.F);
        }
    }

    return mask;
}

static bool pointInPolygon(const Vector2D& pt, const Polygon& poly) {
    bool inside = false;
    for (size_t i = 0, j = poly.size() - 1; i < poly.size(); j = i++) {
        const auto& A = poly[i];
        const auto& B = poly[j];
        if ((A.y > pt.y) != (B.y > pt.y) && pt.x < (B.x - A.x) * (pt.y - A.y) / (B.y - A.y) + A.x)
            inside = !inside;
    }
    return inside;
}

std::vector<Polygon> NRasterizer::expand(const std::vector<Polygon>& polys, double thickness) {
    // long spikes at sharp corners are cut at this multiple of the thickness
    constexpr double     MITER_LIMIT = 4.0;

    std::vector<Polygon> out;
    out.reserve(polys.size());

    for (size_t pi = 0; pi < polys.size(); ++pi) {
        const auto& POLY = polys[pi];
        if (POLY.size() < 3) {
            out.emplace_back(POLY);
            continue;
        }

        // a contour nested an odd number of times is a hole and has to shrink
        int depth = 0;
        for (size_t oi = 0; oi < polys.size(); ++oi) {
            if (oi != pi && polys[oi].size() >= 3 && pointInPolygon(POLY.front(), polys[oi]))
                depth++;
        }

        const double AREA = signedArea(POLY);
        double       sign = AREA >= 0 ? 1.0 : -1.0;
        if (depth % 2 == 1)
            sign = -sign;

        auto normalOf = [sign](const Vector2D& a, const Vector2D& b) -> Vector2D {
            const auto   D   = b - a;
            const double LEN = std::sqrt(D.x * D.x + D.y * D.y);
            if (LEN <= 0.0)
                return {};
            return Vector2D{D.y / LEN, -D.x / LEN} * sign;
        };

        Polygon expanded;
        expanded.reserve(POLY.size());

        const size_t N = POLY.size();
        for (size_t i = 0; i < N; ++i) {
            const auto& PREV = POLY[(i + N - 1) % N];
            const auto& CUR  = POLY[i];
            const auto& NEXT = POLY[(i + 1) % N];

            const auto  N0 = normalOf(PREV, CUR);
            const auto  N1 = normalOf(CUR, NEXT);

            auto        miter = N0 + N1;
            double      len   = std::sqrt(miter.x * miter.x + miter.y * miter.y);

            if (len < 1e-6) {
                // 180 degree turn, push out along one side
                expanded.emplace_back(CUR + N1 * thickness);
                continue;
            }

            miter            = miter * (1.0 / len);
            const double DOT = miter.x * N1.x + miter.y * N1.y;
            const double D   = std::min(DOT > 1e-6 ? thickness / DOT : thickness * MITER_LIMIT, thickness * MITER_LIMIT);

            expanded.emplace_back(CUR + miter * D);
        }

        out.emplace_back(std::move(expanded));
    }

    return out;
}

SCoverageMask NRasterizer::ring(const SCoverageMask& outer, const SCoverageMask& inner) {
    SCoverageMask out(outer.width, outer.height);
    for (size_t i = 0; i < out.data.size() && i < inner.data.size(); ++i) {
        out.data[i] = std::clamp(outer.data[i] - inner.data[i], 0.F, 1.F);
    }
    return out;
}

static uint32_t channel(uint32_t px, int shift) {
    return (px >> shift) & 0xFF;
}

static uint32_t over(uint32_t dst, uint32_t srcA, uint32_t srcR, uint32_t srcG, uint32_t srcB) {
    const uint32_t INV = 255 - srcA;
    const auto     MIX = [INV](uint32_t s, uint32_t d) { return std::min<uint32_t>(255, s + (d * INV + 127) / 255); };

    return (MIX(srcA, channel(dst, 24)) << 24) | (MIX(srcR, channel(dst, 16)) << 16) | (MIX(srcG, channel(dst, 8)) << 8) | MIX(srcB, channel(dst, 0));
}

void NRasterizer::composite(CPixelBuffer& dst, const SCoverageMask& mask, const CColor& color) {
    const int W = std::min(dst.width(), mask.width);
    const int H = std::min(dst.height(), mask.height);

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const float COV = mask.data[(size_t)y * mask.width + x];
            if (COV <= 0.F)
                continue;

            const double A    = color.a * COV;
            const auto   TO8  = [](double v) { return (uint32_t)std::clamp(std::lround(v * 255.0), 0L, 255L); };
            auto&        px   = dst.data()[(size_t)y * dst.width() + x];
            px                = over(px, TO8(A), TO8(color.r * A), TO8(color.g * A), TO8(color.b * A));
        }
    }
}

void NRasterizer::compositeBuffer(CPixelBuffer& dst, const CPixelBuffer& src, double opacity) {
    const int    W  = std::min(dst.width(), src.width());
    const int    H  = std::min(dst.height(), src.height());
    const double OP = std::clamp(opacity, 0.0, 1.0);

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const uint32_t S = src.data()[(size_t)y * src.width() + x];
            if (S == 0)
                continue;

            const auto SCALE = [OP](uint32_t v) { return (uint32_t)std::lround(v * OP); };
            auto&      px    = dst.data()[(size_t)y * dst.width() + x];
            px               = over(px, SCALE(channel(S, 24)), SCALE(channel(S, 16)), SCALE(channel(S, 8)), SCALE(channel(S, 0)));
        }
    }
}

void NRasterizer::blend(CPixelBuffer& dst, const CPixelBuffer& src, const SCoverageMask& mask) {
    const int W = std::min({dst.width(), src.width(), mask.width});
    const int H = std::min({dst.height(), src.height(), mask.height});

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const float COV = mask.data[(size_t)y * mask.width + x];
            if (COV <= 0.F)
                continue;

            const uint32_t S  = src.data()[(size_t)y * src.width() + x];
            auto&          px = dst.data()[(size_t)y * dst.width() + x];
            uint32_t       out = 0;
            for (int c = 0; c < 4; ++c) {
                const double MIXED = channel(S, c * 8) * COV + channel(px, c * 8) * (1.0 - COV);
                out |= (uint32_t)std::clamp(std::lround(MIXED), 0L, 255L) << (c * 8);
            }
            px = out;
        }
    }
}

CPixelBuffer NRasterizer::boxBlur(const CPixelBuffer& src, int radius) {
    const int    W = src.width();
    const int    H = src.height();

    CPixelBuffer tmp(W, H), out(W, H);

    if (radius <= 0) {
        std::copy(src.data(), src.data() + (size_t)W * H, out.data());
        return out;
    }

    const int WINDOW = radius * 2 + 1;

    // horizontal, edges count as transparent
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            uint32_t sums[4] = {0, 0, 0, 0};
            for (int k = -radius; k <= radius; ++k) {
                const int SX = x + k;
                if (SX < 0 || SX >= W)
                    continue;
                const uint32_t P = src.data()[(size_t)y * W + SX];
                for (int c = 0; c < 4; ++c) {
                    sums[c] += channel(P, c * 8);
                }
            }
            uint32_t px = 0;
            for (int c = 0; c < 4; ++c) {
                px |= ((sums[c] + WINDOW / 2) / WINDOW) << (c * 8);
            }
            tmp.data()[(size_t)y * W + x] = px;
        }
    }

    // vertical
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            uint32_t sums[4] = {0, 0, 0, 0};
            for (int k = -radius; k <= radius; ++k) {
                const int SY = y + k;
                if (SY < 0 || SY >= H)
                    continue;
                const uint32_t P = tmp.data()[(size_t)SY * W + x];
                for (int c = 0; c < 4; ++c) {
                    sums[c] += channel(P, c * 8);
                }
            }
            uint32_t px = 0;
            for (int c = 0; c < 4; ++c) {
                px |= ((sums[c] + WINDOW / 2) / WINDOW) << (c * 8);
            }
            out.data()[(size_t)y * W + x] = px;
        }
    }

    return out;
}

static void multiplyAlpha(uint32_t* pixels, size_t count, uint8_t alpha) {
    if (alpha == 255)
        return;

    for (size_t i = 0; i < count; ++i) {
        const uint32_t P  = pixels[i];
        uint32_t       px = 0;
        for (int c = 0; c < 4; ++c) {
            px |= ((channel(P, c * 8) * alpha + 127) / 255) << (c * 8);
        }
        pixels[i] = px;
    }
}

void NRasterizer::applyAlpha(CPixelBuffer& buf, uint8_t alpha) {
    multiplyAlpha(buf.data(), (size_t)buf.width() * buf.height(), alpha);
}

void NRasterizer::applyAlpha(std::vector<uint32_t>& pixels, uint8_t alpha) {
    multiplyAlpha(pixels.data(), pixels.size(), alpha);
}
