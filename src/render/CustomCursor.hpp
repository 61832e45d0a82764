#pragma once

#include <expected>
#include <string>

#include "ShapeCatalog.hpp"

// User designed cursors, as written by the cursor designer.
//
// Version 1 is a single outlined polygon:
//   {"points": [[x, y], ...], "fill": "#AARRGGBB", "outline": ..., "shadow": ..., "shadowOffset": 1, "scale": 1.5, "rotation": 0}
//
// Version 2 ("version": 2) carries a list of layers, painted in order:
//   {"layers": [{"points": [{"x": 0, "y": 0}, {"x": 4, "y": 9, "type": "curve", "cx1": .., "cy1": .., "cx2": .., "cy2": ..}],
//                "fill": "#RRGGBB", "fillAlpha": 100, "outline": ..., "outlineAlpha": 100, "outlineWidth": 1,
//                "shadow": ..., "shadowOffset": 1, "blur": 0, "blurOutline": false, "passthroughTo": -1}],
//    "scale": 1.5, "rotation": 0}
//
// The first point of the first layer is the hotspot. Rotation is in degrees around it.
// "scale" is relative to the 1.5 the designer works at, the runtime cursor scale still applies on top.
namespace NCustomCursor {
    constexpr const char* DEFAULT_PATH = "/tmp/constellation_cursor_custom";

    // the designer's own scale, a file scale of this maps to 1
    constexpr double DESIGN_SCALE = 1.5;

    std::expected<SShapeDefinition, std::string> parse(const std::string& content);
};
