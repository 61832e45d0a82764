#include "CustomCursor.hpp"
#include "../debug/Log.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <functional>
#include <limits>
#include <numbers>
#include <optional>
#include <string_view>

#include <glaze/glaze.hpp>

namespace {
    struct SDesignPoint {
        Vector2D pos;
        bool     curve = false;
        Vector2D control1, control2;
    };

    struct SDesignLayer {
        std::vector<SDesignPoint> points;
        uint32_t                  fill         = 0xFFFFFFFF;
        uint32_t                  outline      = 0xFF000000;
        float                     outlineWidth = 1.F;
        uint32_t                  shadow       = 0x80000000;
        float                     shadowOffset = 1.F;
        float                     blur         = 0.F;
        bool                      blurOutline  = false;
        bool                      passthrough  = false;
    };
}

static std::optional<double> numberOf(glz::generic& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_number())
        return std::nullopt;

    const double VALUE = obj[key].get_number();
    if (!std::isfinite(VALUE))
        return std::nullopt;

    return VALUE;
}

static std::optional<bool> boolOf(glz::generic& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_boolean())
        return std::nullopt;

    return obj[key].get_boolean();
}

// "#RRGGBB" is opaque, "#AARRGGBB" carries its own alpha
static std::optional<uint32_t> colorOf(glz::generic& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string())
        return std::nullopt;

    std::string_view str = obj[key].get_string();
    if (!str.starts_with('#'))
        return std::nullopt;

    str.remove_prefix(1);
    if (str.size() != 6 && str.size() != 8)
        return std::nullopt;

    uint32_t value = 0;
    const auto [PTR, EC] = std::from_chars(str.data(), str.data() + str.size(), value, 16);
    if (EC != std::errc{} || PTR != str.data() + str.size())
        return std::nullopt;

    return str.size() == 6 ? (0xFF000000 | value) : value;
}

// percentage alpha replaces whatever alpha the color had
static uint32_t withPercentAlpha(uint32_t color, double percent) {
    const auto A = (uint32_t)std::clamp(percent / 100.0 * 255.0, 0.0, 255.0);
    return (A << 24) | (color & 0x00FFFFFF);
}

static std::optional<SDesignPoint> pointOf(glz::generic& p) {
    // v1 writes [x, y]
    if (p.is_array()) {
        auto& arr = p.get_array();
        if (arr.size() < 2 || !arr[0].is_number() || !arr[1].is_number())
            return std::nullopt;
        return SDesignPoint{.pos = {arr[0].get_number(), arr[1].get_number()}};
    }

    const auto X = numberOf(p, "x");
    const auto Y = numberOf(p, "y");
    if (!X || !Y)
        return std::nullopt;

    SDesignPoint point{.pos = {*X, *Y}};

    if (p.contains("type") && p["type"].is_string() && p["type"].get_string() == "curve") {
        point.curve    = true;
        point.control1 = {numberOf(p, "cx1").value_or(*X), numberOf(p, "cy1").value_or(*Y)};
        point.control2 = {numberOf(p, "cx2").value_or(*X), numberOf(p, "cy2").value_or(*Y)};
    }

    return point;
}

static std::vector<SDesignPoint> pointsOf(glz::generic& obj) {
    std::vector<SDesignPoint> points;

    if (!obj.is_object() || !obj.contains("points") || !obj["points"].is_array())
        return points;

    for (auto& p : obj["points"].get_array()) {
        if (auto point = pointOf(p); point)
            points.emplace_back(*point);
    }

    return points;
}

static SDesignLayer layerOf(glz::generic& obj) {
    SDesignLayer layer;
    layer.points       = pointsOf(obj);
    layer.fill         = withPercentAlpha(colorOf(obj, "fill").value_or(0xFFFFFFFF), numberOf(obj, "fillAlpha").value_or(100.0));
    layer.outline      = withPercentAlpha(colorOf(obj, "outline").value_or(0xFF000000), numberOf(obj, "outlineAlpha").value_or(100.0));
    layer.shadow       = colorOf(obj, "shadow").value_or(0x80000000);
    layer.outlineWidth = (float)numberOf(obj, "outlineWidth").value_or(1.0);
    layer.shadowOffset = (float)numberOf(obj, "shadowOffset").value_or(1.0);
    layer.blur         = (float)std::max(0.0, numberOf(obj, "blur").value_or(0.0));
    layer.blurOutline  = boolOf(obj, "blurOutline").value_or(false);

    // older files only have the flag
    if (const auto TARGET = numberOf(obj, "passthroughTo"); TARGET)
        layer.passthrough = *TARGET >= 0;
    else
        layer.passthrough = boolOf(obj, "passthrough").value_or(false);

    return layer;
}

static SDesignLayer layerOfV1(glz::generic& obj) {
    SDesignLayer layer;
    layer.points       = pointsOf(obj);
    layer.fill         = colorOf(obj, "fill").value_or(0xFFFFFFFF);
    layer.outline      = colorOf(obj, "outline").value_or(0xFF000000);
    layer.shadow       = colorOf(obj, "shadow").value_or(0x80000000);
    layer.shadowOffset = (float)numberOf(obj, "shadowOffset").value_or(1.0);
    return layer;
}

static SContour contourOf(const std::vector<SDesignPoint>& points, const std::function<Vector2D(const Vector2D&)>& place) {
    SContour c;
    c.start = place(points.front().pos);

    for (size_t i = 1; i < points.size(); ++i) {
        const auto& P = points[i];
        if (P.curve)
            c.segments.emplace_back(SPathSegment{.type = SEGMENT_CUBIC, .to = place(P.pos), .control1 = place(P.control1), .control2 = place(P.control2)});
        else
            c.segments.emplace_back(SPathSegment{.type = SEGMENT_LINE, .to = place(P.pos)});
    }

    return c;
}

static SContour shifted(SContour c, double by) {
    const Vector2D OFFSET{by, by};
    c.start = c.start + OFFSET;
    for (auto& s : c.segments) {
        s.to       = s.to + OFFSET;
        s.control1 = s.control1 + OFFSET;
        s.control2 = s.control2 + OFFSET;
    }
    return c;
}

std::expected<SShapeDefinition, std::string> NCustomCursor::parse(const std::string& content) {
    auto json = glz::read_json<glz::generic>(content);
    if (!json)
        return std::unexpected(std::format("bad json: {}", glz::format_error(json.error(), content)));

    if (!json->is_object())
        return std::unexpected("top level is not an object");

    const int                 VERSION = (int)numberOf(*json, "version").value_or(1.0);
    std::vector<SDesignLayer> layers;

    if (VERSION >= 2) {
        if (json->contains("layers") && (*json)["layers"].is_array()) {
            for (auto& l : (*json)["layers"].get_array()) {
                auto layer = layerOf(l);
                if (!layer.points.empty())
                    layers.emplace_back(std::move(layer));
            }
        }
    } else if (auto layer = layerOfV1(*json); !layer.points.empty())
        layers.emplace_back(std::move(layer));

    if (layers.empty())
        return std::unexpected(std::format("v{} cursor without any points", VERSION));

    const double   SCALE    = std::clamp(numberOf(*json, "scale").value_or(DESIGN_SCALE), 0.1, 10.0) / DESIGN_SCALE;
    const double   ROTATION = numberOf(*json, "rotation").value_or(0.0) * std::numbers::pi / 180.0;
    const Vector2D HOTSPOT  = layers.front().points.front().pos;

    // around the hotspot, which ends up at the origin
    const auto TRANSFORM = [&](const Vector2D& p) {
        const Vector2D D = (p - HOTSPOT) * SCALE;
        return Vector2D{D.x * std::cos(ROTATION) - D.y * std::sin(ROTATION), D.x * std::sin(ROTATION) + D.y * std::cos(ROTATION)};
    };

    Vector2D min{std::numeric_limits<double>::max(), std::numeric_limits<double>::max()};
    for (const auto& l : layers) {
        for (const auto& p : l.points) {
            const auto T = TRANSFORM(p.pos);
            min          = Vector2D{std::min(min.x, T.x), std::min(min.y, T.y)};
        }
    }

    // everything into positive space, past the margin
    const Vector2D ORIGIN = Vector2D{SHAPE_MARGIN, SHAPE_MARGIN} - min;
    const auto     PLACE  = [&](const Vector2D& p) { return TRANSFORM(p) + ORIGIN; };

    SShapeDefinition def;
    def.type    = CURSOR_DEFAULT;
    def.hotspot = ORIGIN;

    for (const auto& l : layers) {
        if (l.points.size() < 3)
            continue;

        const auto CONTOUR = contourOf(l.points, PLACE);

        std::optional<SShapeStroke> stroke;
        if (l.outlineWidth > 0.F && (l.outline >> 24) > 0)
            stroke = SShapeStroke{.width = l.outlineWidth, .color = CColor{(uint64_t)l.outline}};

        if (l.passthrough) {
            def.layers.emplace_back(SShapeLayer{.contours = {CONTOUR}, .fill = CColor{(uint64_t)l.fill}, .stroke = stroke, .blur = l.blur, .blurStroke = l.blurOutline, .passthrough = true});
            continue;
        }

        if (l.shadowOffset > 0.F && (l.shadow >> 24) > 0)
            def.layers.emplace_back(SShapeLayer{.contours = {shifted(CONTOUR, l.shadowOffset)}, .fill = CColor{(uint64_t)l.shadow}, .blur = l.blur});

        def.layers.emplace_back(SShapeLayer{.contours = {CONTOUR}, .fill = CColor{(uint64_t)l.fill}, .stroke = stroke, .blur = l.blur, .blurStroke = l.blurOutline});
    }

    if (def.layers.empty())
        return std::unexpected("no layer has enough points for an area");

    Debug::log(LOG, "NCustomCursor: v{} cursor with {} layers, hotspot {}x{}", VERSION, def.layers.size(), def.hotspot.x, def.hotspot.y);

    return def;
}
