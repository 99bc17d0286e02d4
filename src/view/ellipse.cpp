#include "kestrel/view/ellipse.hpp"
#include "kestrel/render/render_context.hpp"
#include "kestrel/image/bitmap.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace kestrel {

namespace {
constexpr double PI = 3.14159265358979323846;
constexpr int MIN_SEGMENTS = 12;
constexpr int MAX_SEGMENTS = 128;
} // namespace

Ellipse::Ellipse(double radiusX, double radiusY, RGBA color)
    : RectBase(radiusX * 2.0, radiusY * 2.0)
    , color_(color) {
}

int Ellipse::segmentCount() const {
    double perimeter = PI * (std::abs(radiusX()) + std::abs(radiusY()));
    return std::clamp(static_cast<int>(std::ceil(perimeter / 4.0)), MIN_SEGMENTS, MAX_SEGMENTS);
}

void Ellipse::renderInternal(RenderContext& ctx) {
    Texture white = renderTexture(ctx);
    Matrix m = globalMatrix();
    RGBA color = color_ * renderColorMul();

    double rx = radiusX();
    double ry = radiusY();
    double cx = rx - anchorX() * width();
    double cy = ry - anchorY() * height();
    float u = (white.x0() + white.x1()) * 0.5f;
    float v = (white.y0() + white.y1()) * 0.5f;

    int segments = segmentCount();
    std::vector<TexturedVertex> vertices;
    std::vector<uint16_t> indices;
    vertices.reserve(static_cast<size_t>(segments) + 1);
    indices.reserve(static_cast<size_t>(segments) * 3);

    // Fan center, then the outline
    vertices.emplace_back(static_cast<float>(m.transformX(cx, cy)), static_cast<float>(m.transformY(cx, cy)), u, v, color);
    for (int i = 0; i < segments; i++) {
        double angle = 2.0 * PI * i / segments;
        double px = cx + std::cos(angle) * rx;
        double py = cy + std::sin(angle) * ry;
        vertices.emplace_back(static_cast<float>(m.transformX(px, py)), static_cast<float>(m.transformY(px, py)), u, v, color);
    }
    for (int i = 0; i < segments; i++) {
        indices.push_back(0);
        indices.push_back(static_cast<uint16_t>(1 + i));
        indices.push_back(static_cast<uint16_t>(1 + (i + 1) % segments));
    }

    ctx.useBatcher([&](BatchBuilder2D& batch) {
        batch.drawVertices(vertices, indices, white.agTexture(), blending(), smoothing());
    });
}

} // namespace kestrel
