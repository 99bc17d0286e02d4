#pragma once

#include "kestrel/core/types.hpp"

namespace kestrel {

/**
 * @brief A whole AG texture with its size
 *
 * Does not own the texture; AgBitmapTextureManager or an AGFrameBuffer does.
 */
struct TextureBase {
    AGTexture* base = nullptr;
    int width = 0;
    int height = 0;
};

/**
 * @brief A region of a TextureBase with normalized texture coordinates
 */
class Texture {
public:
    explicit Texture(const TextureBase& base);
    Texture(const TextureBase& base, int left, int top, int right, int bottom);

    /// Whole color texture of a framebuffer
    explicit Texture(AGFrameBuffer& frameBuffer);

    const TextureBase& base() const { return base_; }
    AGTexture* agTexture() const { return base_.base; }

    int x() const { return left_; }
    int y() const { return top_; }
    int width() const { return right_ - left_; }
    int height() const { return bottom_ - top_; }

    float x0() const;
    float y0() const;
    float x1() const;
    float y1() const;

    /// Sub-region relative to this one, clipped to it
    Texture slice(int x, int y, int width, int height) const;

private:
    TextureBase base_;
    int left_;
    int top_;
    int right_;
    int bottom_;
};

} // namespace kestrel
