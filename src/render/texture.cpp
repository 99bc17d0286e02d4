#include "kestrel/render/texture.hpp"
#include "kestrel/ag/ag.hpp"

#include <algorithm>

namespace kestrel {

Texture::Texture(const TextureBase& base)
    : Texture(base, 0, 0, base.width, base.height) {
}

Texture::Texture(const TextureBase& base, int left, int top, int right, int bottom)
    : base_(base)
    , left_(left)
    , top_(top)
    , right_(right)
    , bottom_(bottom) {
}

Texture::Texture(AGFrameBuffer& frameBuffer)
    : Texture(TextureBase{&frameBuffer.tex(), frameBuffer.width(), frameBuffer.height()}) {
}

float Texture::x0() const {
    return base_.width > 0 ? static_cast<float>(left_) / base_.width : 0.0f;
}

float Texture::y0() const {
    return base_.height > 0 ? static_cast<float>(top_) / base_.height : 0.0f;
}

float Texture::x1() const {
    return base_.width > 0 ? static_cast<float>(right_) / base_.width : 0.0f;
}

float Texture::y1() const {
    return base_.height > 0 ? static_cast<float>(bottom_) / base_.height : 0.0f;
}

Texture Texture::slice(int x, int y, int width, int height) const {
    int left = left_ + std::clamp(x, 0, this->width());
    int top = top_ + std::clamp(y, 0, this->height());
    int right = std::clamp(left_ + x + width, left, right_);
    int bottom = std::clamp(top_ + y + height, top, bottom_);
    return Texture(base_, left, top, right, bottom);
}

} // namespace kestrel
