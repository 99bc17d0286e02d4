#pragma once

#include "kestrel/ag/ag.hpp"
#include "kestrel/core/finally.hpp"
#include "kestrel/image/color.hpp"
#include "kestrel/math/matrix.hpp"
#include "kestrel/render/texture.hpp"

namespace kestrel {

class BatchBuilder2D;
class AgBitmapTextureManager;

/**
 * @brief Immediate-mode 2D drawing with a current transform
 *
 * Shapes are drawn through the batcher using the current matrix,
 * multiply color and blend mode.
 *
 * Usage:
 * @code
 * ctx.useCtx2d([](RenderContext2D& c2d) {
 *     c2d.keepTransform([&] {
 *         c2d.translate(100, 50);
 *         c2d.rotate(0.5);
 *         c2d.rect(0, 0, 20, 20, Colors::RED);
 *     });
 * });
 * @endcode
 */
class RenderContext2D {
public:
    RenderContext2D(BatchBuilder2D& batch, AgBitmapTextureManager& textureManager);

    BatchBuilder2D& batch() const { return batch_; }

    Matrix& matrix() { return m_; }
    const Matrix& matrix() const { return m_; }

    RGBA multiplyColor() const { return multiplyColor_; }
    void setMultiplyColor(RGBA color) { multiplyColor_ = color; }

    AGBlending blending() const { return blending_; }
    void setBlending(AGBlending blending) { blending_ = blending; }

    /// Run @p block and restore the transform afterwards
    template<typename F>
    auto keepTransform(F&& block) {
        return m_.keepMatrix(std::forward<F>(block));
    }

    /// Run @p block and restore transform, color and blending afterwards
    template<typename F>
    auto keep(F&& block) {
        RGBA savedColor = multiplyColor_;
        AGBlending savedBlending = blending_;
        return tryFinally([&]() { return keepTransform(block); }, [&] {
            multiplyColor_ = savedColor;
            blending_ = savedBlending;
        });
    }

    RenderContext2D& translate(double x, double y);
    RenderContext2D& scale(double sx, double sy);
    RenderContext2D& scale(double s) { return scale(s, s); }
    RenderContext2D& rotate(double radians);

    /// Solid rectangle in @p color (times the multiply color)
    void rect(double x, double y, double width, double height, RGBA color);

    /// Draw @p texture stretched to (x, y, width, height)
    void imageScale(const Texture& texture, double x, double y, double width, double height);

private:
    BatchBuilder2D& batch_;
    AgBitmapTextureManager& textureManager_;
    Matrix m_;
    RGBA multiplyColor_ = Colors::WHITE;
    AGBlending blending_ = AGBlending::Normal;
};

} // namespace kestrel
