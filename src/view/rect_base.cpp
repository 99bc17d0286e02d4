#include "kestrel/view/rect_base.hpp"
#include "kestrel/render/render_context.hpp"
#include "kestrel/image/bitmap.hpp"

namespace kestrel {

RectBase::RectBase(double width, double height, double anchorX, double anchorY)
    : width_(width)
    , height_(height)
    , anchorX_(anchorX)
    , anchorY_(anchorY) {
}

Texture RectBase::renderTexture(RenderContext& ctx) {
    return ctx.getTex(Bitmaps::white());
}

void RectBase::renderInternal(RenderContext& ctx) {
    Texture texture = renderTexture(ctx);
    Matrix m = globalMatrix();
    RGBA color = renderColorMul();
    ctx.useBatcher([&](BatchBuilder2D& batch) {
        batch.drawQuad(texture,
            static_cast<float>(-anchorX_ * width_), static_cast<float>(-anchorY_ * height_),
            static_cast<float>(width_), static_cast<float>(height_),
            m, color, blending_, smoothing_);
    });
}

SolidRect::SolidRect(double width, double height, RGBA color)
    : RectBase(width, height) {
    setColorMul(color);
}

} // namespace kestrel
