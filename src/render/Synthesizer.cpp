#include "Synthesizer.hpp"
#include "Rasterizer.hpp"
#include "../debug/Log.hpp"
#include "../helpers/memory/Memory.hpp"
#include "../macros.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <optional>

#include <cairo/cairo.h>
#include <hyprutils/utils/ScopeGuard.hpp>
using namespace Hyprutils::Utils;

static CPixelBuffer renderLayers(const SShapeDefinition& shape, float outlineOverride, int frost) {
    CPixelBuffer base(CURSOR_BUFFER_SIZE, CURSOR_BUFFER_SIZE);

    for (const auto& layer : shape.layers) {
        std::vector<Polygon> polys;
        for (const auto& c : layer.contours) {
            auto poly = NRasterizer::flatten(c);
            if (poly.size() >= 3)
                polys.emplace_back(std::move(poly));
        }

        if (polys.empty())
            continue;

        const auto                   FILL = NRasterizer::fill(polys, CURSOR_BUFFER_SIZE, CURSOR_BUFFER_SIZE);

        std::optional<SCoverageMask> ring;
        if (layer.stroke) {
            const double THICKNESS = outlineOverride > 0.F ? outlineOverride : layer.stroke->width;
            if (THICKNESS > 0.0)
                ring = NRasterizer::ring(NRasterizer::fill(NRasterizer::expand(polys, THICKNESS), CURSOR_BUFFER_SIZE, CURSOR_BUFFER_SIZE), FILL);
        }

        if (layer.passthrough) {
            // glass over what the layers below painted
            const int RADIUS = (int)std::lround(layer.blur * std::clamp(frost, 0, 100) / 100.0);
            if (RADIUS > 0)
                NRasterizer::blend(base, NRasterizer::boxBlur(base, RADIUS), FILL);

            CColor tint = layer.fill;
            tint.a *= 0.5;
            NRasterizer::composite(base, FILL, tint);
        } else if (const int RADIUS = (int)std::lround(layer.blur); RADIUS > 0) {
            CPixelBuffer own(CURSOR_BUFFER_SIZE, CURSOR_BUFFER_SIZE);
            NRasterizer::composite(own, FILL, layer.fill);
            if (ring && layer.blurStroke)
                NRasterizer::composite(own, *ring, layer.stroke->color);

            NRasterizer::compositeBuffer(base, NRasterizer::boxBlur(own, RADIUS), 1.0);

            if (ring && !layer.blurStroke)
                NRasterizer::composite(base, *ring, layer.stroke->color);
            continue;
        } else
            NRasterizer::composite(base, FILL, layer.fill);

        if (ring)
            NRasterizer::composite(base, *ring, layer.stroke->color);
    }

    return base;
}

static std::expected<CPixelBuffer, std::string> resample(const CPixelBuffer& src, float scale) {
    CPixelBuffer out(CURSOR_BUFFER_SIZE, CURSOR_BUFFER_SIZE);

    const int    STRIDE = cairo_format_stride_for_width(CAIRO_FORMAT_ARGB32, CURSOR_BUFFER_SIZE);
    if (STRIDE != CURSOR_BUFFER_SIZE * 4)
        return std::unexpected(std::format("unexpected cairo stride {}", STRIDE));

    // cairo won't write to the source, the cast is only for its api
    auto* const SRCSURFACE = cairo_image_surface_create_for_data(rc<unsigned char*>(const_cast<uint32_t*>(src.data())), CAIRO_FORMAT_ARGB32, src.width(), src.height(), STRIDE);
    auto* const DSTSURFACE = cairo_image_surface_create_for_data(rc<unsigned char*>(out.data()), CAIRO_FORMAT_ARGB32, out.width(), out.height(), STRIDE);
    auto* const CAIRO      = cairo_create(DSTSURFACE);

    CScopeGuard x([&] {
        cairo_destroy(CAIRO);
        cairo_surface_destroy(DSTSURFACE);
        cairo_surface_destroy(SRCSURFACE);
    });

    if (cairo_surface_status(SRCSURFACE) != CAIRO_STATUS_SUCCESS || cairo_surface_status(DSTSURFACE) != CAIRO_STATUS_SUCCESS || cairo_status(CAIRO) != CAIRO_STATUS_SUCCESS)
        return std::unexpected("cairo: couldn't create surfaces");

    cairo_scale(CAIRO, scale, scale);
    cairo_set_source_surface(CAIRO, SRCSURFACE, 0, 0);
    cairo_pattern_set_filter(cairo_get_source(CAIRO), scale >= 1.F ? CAIRO_FILTER_BILINEAR : CAIRO_FILTER_GOOD);
    cairo_set_operator(CAIRO, CAIRO_OPERATOR_SOURCE);
    cairo_paint(CAIRO);
    cairo_surface_flush(DSTSURFACE);

    if (cairo_status(CAIRO) != CAIRO_STATUS_SUCCESS)
        return std::unexpected(std::format("cairo: {}", cairo_status_to_string(cairo_status(CAIRO))));

    return out;
}

uint32_t CSynthesizer::displaySizeFor(const SShapeDefinition& shape, float scale, uint32_t maxDisplaySize) {
    const auto     EXTENT = shape.extent() * scale;
    const uint32_t NEEDED = (uint32_t)std::ceil(std::max(EXTENT.x, EXTENT.y));

    uint32_t       size = CURSOR_BUFFER_SIZE;
    for (const auto S : CURSOR_DISPLAY_SIZES) {
        if (S >= NEEDED) {
            size = S;
            break;
        }
    }

    // devices report their own limit, never go below the smallest legacy size
    return std::max(CURSOR_DISPLAY_SIZES[0], std::min(size, maxDisplaySize));
}

std::expected<SSynthesisResult, std::string> CSynthesizer::synthesize(const SShapeDefinition& shape, const SSynthesisParams& params) const {
    const float SCALE = std::clamp(params.scale, 0.5F, 10.F);

    auto        image = renderLayers(shape, params.outline, params.frost);

    if (params.frost > 0) {
        const double K       = std::clamp(params.frost, 0, 100) / 100.0;
        const auto   BLURRED = NRasterizer::boxBlur(image, 1 + (int)std::lround(3.0 * K));
        NRasterizer::compositeBuffer(image, BLURRED, 0.5 * K);
    }

    auto scaled = resample(image, SCALE);
    if (!scaled)
        return std::unexpected(scaled.error());

    NRasterizer::applyAlpha(*scaled, params.alpha);

    RASSERT(scaled->pixels().size() == (size_t)CURSOR_BUFFER_SIZE * CURSOR_BUFFER_SIZE, "resampled cursor has {} pixels", scaled->pixels().size());

    SSynthesisResult result;
    result.pixels      = scaled->pixels();
    result.hotspot     = Vector2D{std::round(shape.hotspot.x * SCALE), std::round(shape.hotspot.y * SCALE)};
    result.displaySize = displaySizeFor(shape, SCALE, params.maxDisplaySize);

    Debug::log(TRACE, "CSynthesizer: {} at {:.2f}, hotspot {}x{}, display {}", cursorTypeToString(shape.type), SCALE, result.hotspot.x, result.hotspot.y, result.displaySize);

    return result;
}
