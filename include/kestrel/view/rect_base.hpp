#pragma once

#include "kestrel/ag/ag.hpp"
#include "kestrel/view/view.hpp"
#include "kestrel/render/texture.hpp"

namespace kestrel {

/**
 * @brief View with a size and an anchor, rendered as one textured quad
 *
 * The anchor is a fraction of the size: (0.5, 0.5) centers the quad on the
 * view position.
 */
class RectBase : public View {
public:
    RectBase(double width = 100.0, double height = 100.0, double anchorX = 0.0, double anchorY = 0.0);

    const char* typeName() const override { return "RectBase"; }

    double width() const override { return width_; }
    double height() const override { return height_; }
    void setWidth(double width) override { width_ = width; }
    void setHeight(double height) override { height_ = height; }

    double anchorX() const { return anchorX_; }
    double anchorY() const { return anchorY_; }
    void setAnchorX(double anchor) { anchorX_ = anchor; }
    void setAnchorY(double anchor) { anchorY_ = anchor; }

    RectBase& anchor(double ax, double ay) {
        anchorX_ = ax;
        anchorY_ = ay;
        return *this;
    }

    AGBlending blending() const { return blending_; }
    void setBlending(AGBlending blending) { blending_ = blending; }

    bool smoothing() const { return smoothing_; }
    void setSmoothing(bool smoothing) { smoothing_ = smoothing; }

protected:
    void renderInternal(RenderContext& ctx) override;

    /// Texture stretched over the rectangle; white by default
    virtual Texture renderTexture(RenderContext& ctx);

private:
    double width_;
    double height_;
    double anchorX_;
    double anchorY_;
    AGBlending blending_ = AGBlending::Normal;
    bool smoothing_ = true;
};

/**
 * @brief Rectangle filled with a solid color
 *
 * The color is the view's colorMul applied to a white texture.
 */
class SolidRect : public RectBase {
public:
    SolidRect(double width, double height, RGBA color = Colors::WHITE);

    const char* typeName() const override { return "SolidRect"; }

    RGBA color() const { return colorMul(); }
    void setColor(RGBA color) { setColorMul(color); }
};

} // namespace kestrel
