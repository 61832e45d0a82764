#pragma once

#include <array>
#include <optional>
#include <vector>

#include <hyprutils/math/Vector2D.hpp>

#include "../helpers/Color.hpp"
#include "../state/CursorState.hpp"

using namespace Hyprutils::Math;

// keeps strokes and the tip anti-aliasing off the image edge
constexpr double SHAPE_MARGIN = 3.0;

enum eSegmentType : uint8_t {
    SEGMENT_LINE = 0,
    SEGMENT_CUBIC,
};

// a segment continues from the previous segment's end point
struct SPathSegment {
    eSegmentType type = SEGMENT_LINE;
    Vector2D     to;
    Vector2D     control1, control2; // cubic only
};

// a closed contour, implicitly joined back to start
struct SContour {
    Vector2D                  start;
    std::vector<SPathSegment> segments;
};

struct SShapeStroke {
    float  width = 0.F;
    CColor color;
};

struct SShapeLayer {
    std::vector<SContour>       contours; // even-odd across all contours
    CColor                      fill;
    std::optional<SShapeStroke> stroke;

    // box blur radius in pixels, applied to the fill and, with blurStroke, the stroke
    float                       blur       = 0.F;
    bool                        blurStroke = false;

    // glass: frosts what is underneath (blur scaled by the frost setting), then tints it with half the fill alpha
    bool                        passthrough = false;
};

// Coordinates are pixels at scale 1, origin at pixel 0,0 of the cursor image.
// Layers paint back to front.
struct SShapeDefinition {
    eCursorType              type = CURSOR_DEFAULT;
    std::vector<SShapeLayer> layers;
    Vector2D                 hotspot;

    // max x/y reached by any layer incl. its stroke, used to pick the display size
    Vector2D extent() const;
};

class CShapeCatalog {
  public:
    CShapeCatalog();

    const SShapeDefinition& get(eCursorType type) const;

  private:
    std::array<SShapeDefinition, CURSOR_TYPE_COUNT> m_shapes;
};

// static for the process, built on first use
const CShapeCatalog& shapeCatalog();
