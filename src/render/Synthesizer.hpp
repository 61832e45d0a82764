#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include <hyprutils/math/Vector2D.hpp>

#include "ShapeCatalog.hpp"

using namespace Hyprutils::Math;

// side of the square kernel buffer and of every intermediate image
constexpr int      CURSOR_BUFFER_SIZE = 256;
constexpr uint32_t CURSOR_DISPLAY_SIZES[] = {64, 128, 256};

struct SSynthesisParams {
    float    scale   = 1.5F;
    float    outline = 0.F; // 0 keeps each layer's own stroke width
    int      frost   = 0;   // 0..100
    uint8_t  alpha   = 255;
    uint32_t maxDisplaySize = CURSOR_BUFFER_SIZE;
};

struct SSynthesisResult {
    std::vector<uint32_t> pixels; // premultiplied ARGB8888, CURSOR_BUFFER_SIZE square
    Vector2D              hotspot;
    uint32_t              displaySize = 64;
};

class CSynthesizer {
  public:
    std::expected<SSynthesisResult, std::string> synthesize(const SShapeDefinition& shape, const SSynthesisParams& params) const;

    // smallest supported plane size the scaled shape fits in, capped by what the device allows
    static uint32_t displaySizeFor(const SShapeDefinition& shape, float scale, uint32_t maxDisplaySize);
};
