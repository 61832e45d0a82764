#pragma once

#include <cstdint>

// straight (non-premultiplied) rgba in 0..1
class CColor {
  public:
    CColor();
    CColor(float r, float g, float b, float a);
    CColor(uint64_t);

    //
    bool operator==(const CColor& c2) const {
        return c2.r == r && c2.g == g && c2.b == b && c2.a == a;
    }

    double r = 0, g = 0, b = 0, a = 0;
};

//NOLINTNEXTLINE
namespace Colors {
    static const CColor WHITE = CColor(1.F, 1.F, 1.F, 1.F);
    static const CColor BLACK = CColor(0.F, 0.F, 0.F, 1.F);
};
