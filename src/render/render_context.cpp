#include "kestrel/render/render_context.hpp"
#include "kestrel/render/shaders.hpp"
#include "kestrel/view/views.hpp"
#include "kestrel/core/logging.hpp"

#include <algorithm>
#include <cmath>

namespace kestrel {

RenderContext::RenderContext(AG& ag, RenderContextConfig config, Views* views)
    : masksEnabled(config.masksEnabled)
    , ag_(ag)
    , config_(config)
    , views_(views)
    , flipRenderTexture_(config.flipRenderTexture)
    , uniformsPool_([](AGUniformValues& values) { values.clear(); }, 0,
                    [] { return std::make_unique<AGUniformValues>(); })
    , tempOldUniformsPool_([](AGUniformValues& values) { values.clear(); }, 0,
                           [] { return std::make_unique<AGUniformValues>(); })
    , agAutoFreeManager_(config.autoFreeGcIntervalFrames)
    , agBitmapTextureManager_(ag, config.textureGcIntervalFrames, &stats_)
    , agBufferManager_(ag, config.bufferGcIntervalFrames)
    , dynamicVertexBufferPool_([&ag] { return ag.createBuffer(AGBufferKind::Vertex); })
    , dynamicVertexDataPool_([&ag] { return ag.createVertexData(DefaultShaders::LAYOUT_DEFAULT); })
    , dynamicIndexBufferPool_([&ag] { return ag.createBuffer(AGBufferKind::Index); })
    , matrixPool_([](Matrix& m) { m.identity(); }, config.poolPreallocate,
                  [] { return std::make_unique<Matrix>(); })
    , matrix3DPool_([](Matrix3D& m) { m = Matrix3D(1.0f); }, config.poolPreallocate,
                    [] { return std::make_unique<Matrix3D>(1.0f); })
    , pointPool_([](Point& p) { p.setTo(0.0, 0.0); }, config.poolPreallocate,
                 [] { return std::make_unique<Point>(); })
    , rectPool_([](Rectangle& r) { r.setTo(0.0, 0.0, 0.0, 0.0); }, config.poolPreallocate,
                [] { return std::make_unique<Rectangle>(); })
    , batch_(*this, config.batchMaxQuads)
    , ctx2d_(batch_, agBitmapTextureManager_) {
    uniforms_.set(DefaultShaders::u_ProjMat, projMat_);
    uniforms_.set(DefaultShaders::u_ViewMat, viewMat_);

    agBitmapTextureManager_.setBeforeFree([this] { flush(); });

    KESTREL_DEBUG(LogCategory::Render, "RenderContext created (batchMaxQuads=" +
        std::to_string(config.batchMaxQuads) + ")");
}

RenderContext::~RenderContext() {
    close();
}

void RenderContext::updateStandardUniforms() {
    float width = static_cast<float>(ag_.currentWidth());
    float height = static_cast<float>(ag_.currentHeight());

    if (flipRenderTexture_ && ag_.isRenderingToTexture()) {
        setToOrtho(projMat_, tempRect_.setBounds(0.0, height, width, 0.0), -1.0f, 1.0f);
    } else {
        setToOrtho(projMat_, tempRect_.setBounds(0.0, 0.0, width, height), -1.0f, 1.0f);
        projMat_ = projMat_ * projectionMatrixTransform_.toMatrix3D(tempMat3d_);
    }

    uniforms_.set(DefaultShaders::u_ProjMat, projMat_);
    uniforms_.set(DefaultShaders::u_ViewMat, viewMat_);
}

void RenderContext::setDebugAnnotateView(View* view) {
    if (views_) {
        views_->invalidatedView(debugAnnotateView_);
    }
    debugAnnotateView_ = view;
    if (views_) {
        views_->invalidatedView(debugAnnotateView_);
    }
}

double RenderContext::debugOverlayScale() const {
    return std::max(1.0, std::round(ag_.computedPixelRatio() * debugExtraFontScale));
}

void RenderContext::flush() {
    currentBatcher_ = nullptr;
    flushers_();
}

void RenderContext::finish() {
    ag_.flip();
}

void RenderContext::afterRender() {
    flush();
    finish();
    agAutoFreeManager_.afterRender();
    agBitmapTextureManager_.afterRender();
    agBufferManager_.afterRender();
}

void RenderContext::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    flush();
    agBitmapTextureManager_.close();
    agBitmapTextureManager_.setBeforeFree(nullptr);
    agAutoFreeManager_.close();
    agBufferManager_.close();
}

} // namespace kestrel
