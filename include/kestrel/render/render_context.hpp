#pragma once

#include "kestrel/core/types.hpp"
#include "kestrel/core/finally.hpp"
#include "kestrel/core/pool.hpp"
#include "kestrel/core/signal.hpp"
#include "kestrel/ag/ag.hpp"
#include "kestrel/ag/uniforms.hpp"
#include "kestrel/image/bitmap.hpp"
#include "kestrel/image/color.hpp"
#include "kestrel/math/geom.hpp"
#include "kestrel/math/matrix.hpp"
#include "kestrel/render/ag_auto_free_manager.hpp"
#include "kestrel/render/ag_bitmap_texture_manager.hpp"
#include "kestrel/render/ag_buffer_manager.hpp"
#include "kestrel/render/batch_builder_2d.hpp"
#include "kestrel/render/render_context_2d.hpp"
#include "kestrel/render/stats.hpp"
#include "kestrel/render/texture.hpp"

#include <vector>

namespace kestrel {

/**
 * @brief Tunables of a RenderContext
 */
struct RenderContextConfig {
    /// Quads buffered by the batcher before it flushes on its own
    int batchMaxQuads = BatchBuilder2D::DEFAULT_BATCH_QUADS;

    /// Flip the projection vertically when rendering to a texture
    bool flipRenderTexture = true;

    /// Whether stencil-based masks are enabled
    bool masksEnabled = true;

    int textureGcIntervalFrames = 60;
    int bufferGcIntervalFrames = 60;
    int autoFreeGcIntervalFrames = 60;

    /// Objects created up front in each temporary object pool
    size_t poolPreallocate = 8;
};

/**
 * @brief Everything needed to render one frame through an AG
 *
 * Holds the projection/view state and the standard uniforms, the 2D
 * batcher, the GPU resource managers and pools of temporary math objects.
 *
 * Code that talks to the AG directly must call flush() first so pending
 * batched vertices are drawn in order.
 *
 * Usage:
 * @code
 * LogAG ag;
 * RenderContext ctx(ag);
 *
 * ctx.useBatcher([&](BatchBuilder2D& batch) {
 *     batch.drawQuad(ctx.getTex(slice), 0, 0, 32, 32);
 * });
 *
 * ctx.renderToTexture(64, 64,
 *     [&](AGFrameBuffer&) { ... },
 *     [&](const Texture& tex) { ... });
 *
 * ctx.afterRender();  // flush, flip, collect unused resources
 * @endcode
 */
class RenderContext : public Closeable {
public:
    explicit RenderContext(AG& ag, RenderContextConfig config = {}, Views* views = nullptr);
    ~RenderContext() override;

    RenderContext(const RenderContext&) = delete;
    RenderContext& operator=(const RenderContext&) = delete;

    AG& ag() const { return ag_; }

    /// Owning Views, or nullptr for a standalone context
    Views* views() const { return views_; }

    Stats& stats() { return stats_; }
    const Stats& stats() const { return stats_; }

    const RenderContextConfig& config() const { return config_; }

    // =========================================================================
    // Projection and view state
    // =========================================================================

    Matrix& projectionMatrixTransform() { return projectionMatrixTransform_; }
    Matrix& projectionMatrixTransformInv() { return projectionMatrixTransformInv_; }
    const Matrix3D& projMat() const { return projMat_; }
    Matrix3D& viewMat() { return viewMat_; }
    Matrix& viewMat2D() { return viewMat2D_; }

    AGUniformValues& uniforms() { return uniforms_; }
    const AGUniformValues& uniforms() const { return uniforms_; }

    bool flipRenderTexture() const { return flipRenderTexture_; }
    void setFlipRenderTexture(bool flip) { flipRenderTexture_ = flip; }

    /// Recompute u_ProjMat for the current render buffer and store u_ProjMat/u_ViewMat
    void updateStandardUniforms();

    /**
     * @brief Run @p block with the projection transform set to @p m
     *
     * Flushes before and after; the previous transform is restored even
     * when @p block throws.
     */
    template<typename F>
    auto setTemporalProjectionMatrixTransform(const Matrix& m, F&& block) {
        return projectionMatrixTransform_.keepMatrix([&]() {
            flush();
            projectionMatrixTransform_.copyFrom(m);
            return tryFinally([&]() { return block(); }, [&] { flush(); });
        });
    }

    /// Run @p callback with both view matrices set to @p matrix
    template<typename F>
    void setViewMatrixTemp(const Matrix& matrix, F&& callback) {
        matrix3DPool_.use([&](Matrix3D& temp) {
            matrixPool_.use([&](Matrix& temp2d) {
                flush();
                temp = viewMat_;
                temp2d.copyFrom(viewMat2D_);
                viewMat2D_.copyFrom(matrix);
                matrix.toMatrix3D(viewMat_);
                tryFinally([&] { callback(); }, [&] {
                    flush();
                    viewMat_ = temp;
                    viewMat2D_.copyFrom(temp2d);
                });
            });
        });
    }

    /**
     * @brief Run @p callback and restore @p uniform to its current value afterwards
     * @param doFlush Flush before and after @p callback
     */
    template<typename F>
    void keepUniform(const Uniform& uniform, bool doFlush, F&& callback) {
        keepUniforms(std::vector<Uniform>{uniform}, doFlush, std::forward<F>(callback));
    }

    template<typename F>
    void keepUniforms(const std::vector<Uniform>& list, bool doFlush, F&& callback) {
        uniformsPool_.use([&](AGUniformValues& saved) {
            for (const auto& uniform : list) {
                if (auto value = uniforms_.get(uniform)) {
                    saved.set(uniform, *value);
                }
            }
            if (doFlush) {
                flush();
            }
            tryFinally([&] { callback(uniforms_); }, [&] {
                if (doFlush) {
                    flush();
                }
                for (const auto& uniform : list) {
                    if (auto value = saved.get(uniform)) {
                        uniforms_.set(uniform, *value);
                    } else {
                        uniforms_.remove(uniform);
                    }
                }
            });
        });
    }

    /**
     * @brief Run @p callback with @p values merged into the uniforms
     *
     * A null or empty @p values just runs @p callback. Otherwise the batch
     * is flushed around @p callback and every uniform is restored afterwards.
     */
    template<typename F>
    void setTemporalUniforms(const AGUniformValues* values, F&& callback) {
        tempOldUniformsPool_.use([&](AGUniformValues& old) {
            bool apply = values != nullptr && values->isNotEmpty();
            if (apply) {
                flush();
                old.setTo(uniforms_);
                uniforms_.put(*values);
            }
            tryFinally([&] { callback(uniforms_); }, [&] {
                if (apply) {
                    flush();
                    uniforms_.setTo(old);
                }
            });
        });
    }

    // =========================================================================
    // Resource managers
    // =========================================================================

    AgAutoFreeManager& agAutoFreeManager() { return agAutoFreeManager_; }
    AgBitmapTextureManager& agBitmapTextureManager() { return agBitmapTextureManager_; }
    AgBufferManager& agBufferManager() { return agBufferManager_; }

    /// Handlers invoked by flush(); batchers register here
    Signal<>& flushers() { return flushers_; }

    /// Texture region for @p slice, uploaded and cached as needed
    Texture getTex(const BmpSlice& slice) { return agBitmapTextureManager_.getTexture(slice); }

    /// Whole texture for @p bitmap, uploaded and cached as needed
    TextureBase getTex(const BitmapRef& bitmap) { return agBitmapTextureManager_.getTextureBase(bitmap); }

    AGBuffer& getBuffer(const AgCachedBufferRef& buffer) { return agBufferManager_.getBuffer(buffer); }

    /// Keep @p closeable alive while it is referenced every GC interval
    void refGcCloseable(CloseableRef closeable) { agAutoFreeManager_.reference(std::move(closeable)); }

    // =========================================================================
    // Debug state
    // =========================================================================

    View* debugAnnotateView() const { return debugAnnotateView_; }

    /// Set the annotated view, invalidating both the previous and the new one
    void setDebugAnnotateView(View* view);

    double debugExtraFontScale = 1.0;
    RGBA debugExtraFontColor = Colors::WHITE;
    int stencilIndex = 0;
    bool masksEnabled = true;

    /// max(1, round(pixelRatio * debugExtraFontScale))
    double debugOverlayScale() const;

    // =========================================================================
    // Batching
    // =========================================================================

    BatchBuilder2D& batch() { return batch_; }
    RenderContext2D& ctx2d() { return ctx2d_; }

    Pool<AGBuffer>& dynamicVertexBufferPool() { return dynamicVertexBufferPool_; }
    Pool<AGVertexData>& dynamicVertexDataPool() { return dynamicVertexDataPool_; }
    Pool<AGBuffer>& dynamicIndexBufferPool() { return dynamicIndexBufferPool_; }

    /// Run @p block with the default batcher
    template<typename F>
    void useBatcher(F&& block) {
        useBatcher(batch_, std::forward<F>(block));
    }

    /// Run @p block with @p batcher, flushing first if another batcher was active
    template<typename T, typename F>
    void useBatcher(T& batcher, F&& block) {
        if (currentBatcher_ != static_cast<const void*>(&batcher)) {
            flush();
            currentBatcher_ = &batcher;
        }
        block(batcher);
    }

    template<typename F>
    void useCtx2d(F&& block) {
        useBatcher(batch_, [&](BatchBuilder2D&) { block(ctx2d_); });
    }

    // =========================================================================
    // Temporary object pools
    // =========================================================================

    Pool<Matrix>& matrixPool() { return matrixPool_; }
    Pool<Matrix3D>& matrix3DPool() { return matrix3DPool_; }
    Pool<Point>& pointPool() { return pointPool_; }
    Pool<Rectangle>& rectPool() { return rectPool_; }

    MarginInt tempMargin;
    const Matrix identityMatrix;

    // =========================================================================
    // Frame operations
    // =========================================================================

    /// Draw everything pending in every batcher
    void flush();

    /// Present the frame
    void finish();

    /**
     * @brief Render into @p frameBuffer
     *
     * The batcher scissor is limited to the framebuffer while @p render
     * runs; the previous scissor and render buffer are restored afterwards.
     */
    template<typename F>
    void renderToFrameBuffer(AGFrameBuffer& frameBuffer, bool clear, F&& render) {
        flush();
        ag_.setRenderBufferTemporally(frameBuffer, [&] {
            useBatcher([&](BatchBuilder2D& batch) {
                std::optional<AGScissor> oldScissor = batch.scissor();
                batch.setScissor(AGScissor{0, 0, frameBuffer.width(), frameBuffer.height()});
                tryFinally([&] {
                    if (clear) {
                        ag_.clear(Colors::TRANSPARENT_BLACK);
                    }
                    render(frameBuffer);
                    flush();
                }, [&] { batch.setScissor(oldScissor); });
            });
        });
    }

    template<typename F>
    void renderToFrameBuffer(AGFrameBuffer& frameBuffer, F&& render) {
        renderToFrameBuffer(frameBuffer, true, std::forward<F>(render));
    }

    /**
     * @brief Render into a temporary texture and hand it to @p use
     *
     * The texture is only valid inside @p use. Keep the pixels with
     * renderToBitmap() instead.
     */
    template<typename R, typename U>
    void renderToTexture(int width, int height, R&& render, U&& use,
                         bool hasDepth = false, bool hasStencil = true, int msamples = 1) {
        flush();
        ag_.tempAllocateFrameBuffer(width, height, hasDepth, hasStencil, msamples, [&](AGFrameBuffer& fb) {
            renderToFrameBuffer(fb, true, [&](AGFrameBuffer& target) { render(target); });
            use(Texture(fb).slice(0, 0, width, height));
            flush();
        });
    }

    /// Render @p callback into @p bmp and return it
    template<typename F>
    Bitmap32& renderToBitmap(Bitmap32& bmp, F&& callback,
                             bool hasDepth = false, bool hasStencil = false, int msamples = 1) {
        flush();
        ag_.renderToBitmap(bmp, hasDepth, hasStencil, msamples, [&] {
            callback();
            flush();
        });
        return bmp;
    }

    template<typename F>
    Bitmap32 renderToBitmap(int width, int height, F&& callback,
                            bool hasDepth = false, bool hasStencil = false, int msamples = 1) {
        Bitmap32 bmp(width, height);
        renderToBitmap(bmp, std::forward<F>(callback), hasDepth, hasStencil, msamples);
        return bmp;
    }

    /// End of frame: flush, flip and let the managers collect garbage
    void afterRender();

    /// Free every managed resource; safe to call more than once
    void close() override;

private:
    AG& ag_;
    RenderContextConfig config_;
    Views* views_;
    Stats stats_;
    bool closed_ = false;

    Matrix projectionMatrixTransform_;
    Matrix projectionMatrixTransformInv_;
    Matrix3D projMat_{1.0f};
    Matrix3D viewMat_{1.0f};
    Matrix viewMat2D_;
    bool flipRenderTexture_;
    Rectangle tempRect_;
    Matrix3D tempMat3d_{1.0f};
    AGUniformValues uniforms_;

    Pool<AGUniformValues> uniformsPool_;
    Pool<AGUniformValues> tempOldUniformsPool_;

    AgAutoFreeManager agAutoFreeManager_;
    AgBitmapTextureManager agBitmapTextureManager_;
    AgBufferManager agBufferManager_;
    Signal<> flushers_;

    View* debugAnnotateView_ = nullptr;

    Pool<AGBuffer> dynamicVertexBufferPool_;
    Pool<AGVertexData> dynamicVertexDataPool_;
    Pool<AGBuffer> dynamicIndexBufferPool_;

    Pool<Matrix> matrixPool_;
    Pool<Matrix3D> matrix3DPool_;
    Pool<Point> pointPool_;
    Pool<Rectangle> rectPool_;

    const void* currentBatcher_ = nullptr;

    BatchBuilder2D batch_;
    RenderContext2D ctx2d_;
};

/**
 * @brief Run @p block with a fresh RenderContext on @p ag, flush, and return @p ag
 */
template<typename AGT, typename F>
AGT& testRenderContext(AGT& ag, F&& block) {
    RenderContext ctx(ag);
    block(ctx);
    ctx.flush();
    return ag;
}

} // namespace kestrel
