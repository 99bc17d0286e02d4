#pragma once

#include "kestrel/view/rect_base.hpp"

namespace kestrel {

/**
 * @brief Filled ellipse inscribed in a 2·radiusX by 2·radiusY rectangle
 *
 * Rendered as a triangle fan in the fill color, multiplied by the view's
 * render color.
 */
class Ellipse : public RectBase {
public:
    Ellipse(double radiusX = 16.0, double radiusY = 16.0, RGBA color = Colors::WHITE);

    const char* typeName() const override { return "Ellipse"; }

    double radiusX() const { return width() / 2.0; }
    double radiusY() const { return height() / 2.0; }
    void setRadiusX(double radius) { setWidth(radius * 2.0); }
    void setRadiusY(double radius) { setHeight(radius * 2.0); }

    RGBA color() const { return color_; }
    void setColor(RGBA color) { color_ = color; }

    /// Segments of the fan outline for the current size
    int segmentCount() const;

protected:
    void renderInternal(RenderContext& ctx) override;

private:
    RGBA color_;
};

} // namespace kestrel
