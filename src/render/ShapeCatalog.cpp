#include "ShapeCatalog.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

static SContour polygon(const std::vector<Vector2D>& points, double scale = 1.0) {
    SContour c;
    c.start = points.front() * scale + Vector2D{SHAPE_MARGIN, SHAPE_MARGIN};
    for (size_t i = 1; i < points.size(); ++i) {
        c.segments.emplace_back(SPathSegment{.type = SEGMENT_LINE, .to = points[i] * scale + Vector2D{SHAPE_MARGIN, SHAPE_MARGIN}});
    }
    return c;
}

static SContour circle(const Vector2D& center, double radius, int steps = 32) {
    std::vector<Vector2D> points;
    for (int i = 0; i < steps; ++i) {
        const double ANGLE = (double)i * 2.0 * std::numbers::pi / (double)steps;
        points.emplace_back(center + Vector2D{radius * std::cos(ANGLE), radius * std::sin(ANGLE)});
    }
    return polygon(points);
}

static SContour offsetContour(const SContour& c, const Vector2D& offset) {
    SContour out = c;
    out.start    = out.start + offset;
    for (auto& s : out.segments) {
        s.to       = s.to + offset;
        s.control1 = s.control1 + offset;
        s.control2 = s.control2 + offset;
    }
    return out;
}

static SShapeLayer shadowOf(const std::vector<SContour>& contours, const CColor& color, double offset) {
    SShapeLayer layer;
    for (const auto& c : contours) {
        layer.contours.emplace_back(offsetContour(c, {offset, offset}));
    }
    layer.fill = color;
    return layer;
}

// the shadow, white body and black edge most built-in shapes share
static SShapeDefinition classicShape(eCursorType type, const std::vector<SContour>& contours, const Vector2D& hotspot) {
    SShapeDefinition def;
    def.type = type;
    def.layers.emplace_back(shadowOf(contours, CColor{0x80000000}, 1.0));
    def.layers.emplace_back(SShapeLayer{.contours = contours, .fill = Colors::WHITE, .stroke = SShapeStroke{.width = 1.F, .color = Colors::BLACK}});
    def.hotspot = hotspot + Vector2D{SHAPE_MARGIN, SHAPE_MARGIN};
    return def;
}

static SShapeDefinition makeArrow() {
    // the tail edge is a gentle curve rather than two straight cuts
    SContour body = polygon({{0, 0}, {3, 18}, {10, 17.5}});
    body.segments.emplace_back(SPathSegment{.type     = SEGMENT_CUBIC,
                                            .to       = Vector2D{14.5, 10} + Vector2D{SHAPE_MARGIN, SHAPE_MARGIN},
                                            .control1 = Vector2D{12, 17} + Vector2D{SHAPE_MARGIN, SHAPE_MARGIN},
                                            .control2 = Vector2D{13.5, 13} + Vector2D{SHAPE_MARGIN, SHAPE_MARGIN}});

    SShapeDefinition def;
    def.type = CURSOR_DEFAULT;
    def.layers.emplace_back(shadowOf({body}, CColor{0x54000000}, 3.0));
    def.layers.emplace_back(SShapeLayer{.contours = {body}, .fill = CColor{0xE8011023}, .stroke = SShapeStroke{.width = 2.F, .color = CColor{0xFF948F8F}}});
    def.hotspot = {SHAPE_MARGIN, SHAPE_MARGIN};
    return def;
}

static SShapeDefinition makePointer() {
    return classicShape(CURSOR_POINTER, {polygon({{0, 0}, {0, 16}, {4, 12}, {6, 18}, {9, 17}, {7, 11}, {12, 11}})}, {0, 0});
}

static SShapeDefinition makeText() {
    return classicShape(CURSOR_TEXT,
                        {polygon({{1, 0}, {7, 0}, {7, 2}, {5, 2}, {5, 18}, {7, 18}, {7, 20}, {1, 20}, {1, 18}, {3, 18}, {3, 2}, {1, 2}})}, {4, 10});
}

static SShapeDefinition makeCrosshair() {
    constexpr double SCALE = 0.8;
    return classicShape(CURSOR_CROSSHAIR,
                        {polygon({{8, 0},   {8, 6},   {6, 6},   {6, 8},   {0, 8},   {0, 10},  {6, 10},  {6, 12},  {8, 12},  {8, 18},
                                  {10, 18}, {10, 12}, {12, 12}, {12, 10}, {18, 10}, {18, 8},  {12, 8},  {12, 6},  {10, 6},  {10, 0}},
                                 SCALE)},
                        Vector2D{9, 9} * SCALE);
}

static SShapeDefinition makeWait() {
    return classicShape(CURSOR_WAIT, {polygon({{0, 0}, {12, 0}, {12, 3}, {6, 9}, {12, 15}, {12, 18}, {0, 18}, {0, 15}, {6, 9}, {0, 3}})}, {6, 9});
}

static SShapeDefinition makeGrab() {
    constexpr double SCALE = 0.87;
    return classicShape(CURSOR_GRAB,
                        {polygon({{6, 0},   {6, 8},   {8, 8},   {8, 3},   {10, 3},  {10, 8},  {12, 8},  {12, 5},  {14, 5},  {14, 8},
                                  {16, 8},  {16, 7},  {18, 7},  {18, 16}, {12, 20}, {4, 20},  {0, 16},  {0, 12},  {4, 12},  {4, 0}},
                                 SCALE)},
                        Vector2D{9, 10} * SCALE);
}

static SShapeDefinition makeGrabbing() {
    constexpr double SCALE = 0.87;
    // grab with the fingers curled in
    return classicShape(CURSOR_GRABBING,
                        {polygon({{4, 6}, {6, 5}, {8, 6}, {10, 5}, {12, 6}, {14, 5}, {16, 6}, {18, 7}, {18, 16}, {12, 20}, {4, 20}, {0, 16}, {0, 12}, {4, 10}},
                                 SCALE)},
                        Vector2D{9, 12} * SCALE);
}

static SShapeDefinition makeForbidden() {
    const CColor     RED{0xFFFF0000};
    const Vector2D   CENTER{9, 9};

    // ring as two circles under even-odd, slash as its own layer
    std::vector<SContour> ring  = {circle(CENTER, 9.0), circle(CENTER, 7.0)};
    std::vector<SContour> slash = {polygon({CENTER + Vector2D{-6, -5}, CENTER + Vector2D{-5, -6}, CENTER + Vector2D{6, 5}, CENTER + Vector2D{5, 6}})};

    SShapeDefinition      def;
    def.type = CURSOR_FORBIDDEN;
    def.layers.emplace_back(shadowOf(ring, CColor{0x80000000}, 1.0));
    def.layers.emplace_back(SShapeLayer{.contours = ring, .fill = RED});
    def.layers.emplace_back(SShapeLayer{.contours = slash, .fill = RED});
    def.hotspot = CENTER + Vector2D{SHAPE_MARGIN, SHAPE_MARGIN};
    return def;
}

Vector2D SShapeDefinition::extent() const {
    Vector2D max;

    for (const auto& l : layers) {
        const double PAD = l.stroke ? l.stroke->width : 0.0;
        for (const auto& c : l.contours) {
            auto grow = [&](const Vector2D& p) { max = Vector2D{std::max(max.x, p.x + PAD), std::max(max.y, p.y + PAD)}; };
            grow(c.start);
            for (const auto& s : c.segments) {
                grow(s.to);
                if (s.type == SEGMENT_CUBIC) {
                    grow(s.control1);
                    grow(s.control2);
                }
            }
        }
    }

    return max;
}

CShapeCatalog::CShapeCatalog() {
    m_shapes[CURSOR_DEFAULT]   = makeArrow();
    m_shapes[CURSOR_POINTER]   = makePointer();
    m_shapes[CURSOR_TEXT]      = makeText();
    m_shapes[CURSOR_CROSSHAIR] = makeCrosshair();
    m_shapes[CURSOR_WAIT]      = makeWait();
    m_shapes[CURSOR_GRAB]      = makeGrab();
    m_shapes[CURSOR_GRABBING]  = makeGrabbing();
    m_shapes[CURSOR_FORBIDDEN] = makeForbidden();
}

const SShapeDefinition& CShapeCatalog::get(eCursorType type) const {
    if (type >= CURSOR_TYPE_COUNT)
        return m_shapes[CURSOR_DEFAULT];

    return m_shapes[type];
}

const CShapeCatalog& shapeCatalog() {
    static const CShapeCatalog CATALOG;
    return CATALOG;
}
