#include "kestrel/render/render_context_2d.hpp"
#include "kestrel/render/batch_builder_2d.hpp"
#include "kestrel/render/ag_bitmap_texture_manager.hpp"
#include "kestrel/image/bitmap.hpp"

namespace kestrel {

RenderContext2D::RenderContext2D(BatchBuilder2D& batch, AgBitmapTextureManager& textureManager)
    : batch_(batch)
    , textureManager_(textureManager) {
}

RenderContext2D& RenderContext2D::translate(double x, double y) {
    Matrix t(1.0, 0.0, 0.0, 1.0, x, y);
    m_.premultiply(t);
    return *this;
}

RenderContext2D& RenderContext2D::scale(double sx, double sy) {
    Matrix s(sx, 0.0, 0.0, sy, 0.0, 0.0);
    m_.premultiply(s);
    return *this;
}

RenderContext2D& RenderContext2D::rotate(double radians) {
    Matrix r;
    r.rotate(radians);
    m_.premultiply(r);
    return *this;
}

void RenderContext2D::rect(double x, double y, double width, double height, RGBA color) {
    Texture white = textureManager_.getTexture(Bitmaps::white());
    batch_.drawQuad(white,
        static_cast<float>(x), static_cast<float>(y),
        static_cast<float>(width), static_cast<float>(height),
        m_, color * multiplyColor_, blending_);
}

void RenderContext2D::imageScale(const Texture& texture, double x, double y, double width, double height) {
    batch_.drawQuad(texture,
        static_cast<float>(x), static_cast<float>(y),
        static_cast<float>(width), static_cast<float>(height),
        m_, multiplyColor_, blending_);
}

} // namespace kestrel
