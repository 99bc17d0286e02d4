#include "kestrel/render/batch_builder_2d.hpp"
#include "kestrel/render/render_context.hpp"
#include "kestrel/render/shaders.hpp"
#include "kestrel/core/finally.hpp"

#include <stdexcept>

namespace kestrel {

namespace {
const uint16_t QUAD_INDICES[] = {0, 1, 2, 3, 0, 2};
} // namespace

BatchBuilder2D::BatchBuilder2D(RenderContext& ctx, int maxQuads)
    : ctx_(ctx)
    , maxQuads_(maxQuads) {
    if (maxQuads <= 0 || maxQuads * 4 > 0x10000) {
        throw std::invalid_argument("BatchBuilder2D: maxQuads must be in 1.." + std::to_string(0x10000 / 4));
    }
    vertices_.reserve(static_cast<size_t>(maxVertices()));
    indices_.reserve(static_cast<size_t>(maxIndices()));
    flusherId_ = ctx_.flushers().add([this] { flush(); });
}

BatchBuilder2D::~BatchBuilder2D() {
    ctx_.flushers().remove(flusherId_);
}

void BatchBuilder2D::setState(AGTexture* texture, AGBlending blending, bool smoothing) {
    if (texture != currentTexture_ || blending != currentBlending_ || smoothing != currentSmoothing_) {
        flush();
        currentTexture_ = texture;
        currentBlending_ = blending;
        currentSmoothing_ = smoothing;
    }
}

void BatchBuilder2D::ensure(int indices, int vertices) {
    if (indices > maxIndices() || vertices > maxVertices()) {
        throw std::invalid_argument("BatchBuilder2D: " + std::to_string(vertices) + " vertices / " +
            std::to_string(indices) + " indices exceed the batch capacity");
    }
    if (indexCount() + indices > maxIndices() || vertexCount() + vertices > maxVertices()) {
        flush();
    }
}

void BatchBuilder2D::setScissor(const std::optional<AGScissor>& scissor) {
    if (scissor != scissor_) {
        flush();
        scissor_ = scissor;
    }
}

void BatchBuilder2D::drawQuad(const Texture& texture, float x, float y, float width, float height,
                              const Matrix& matrix, RGBA colorMul, AGBlending blending, bool smoothing) {
    setState(texture.agTexture(), blending, smoothing);
    ensure(6, 4);

    float x0 = x;
    float y0 = y;
    float x1 = x + width;
    float y1 = y + height;

    auto tx = [&](float px, float py) { return static_cast<float>(matrix.transformX(px, py)); };
    auto ty = [&](float px, float py) { return static_cast<float>(matrix.transformY(px, py)); };

    auto base = static_cast<uint16_t>(vertices_.size());
    vertices_.emplace_back(tx(x0, y0), ty(x0, y0), texture.x0(), texture.y0(), colorMul);
    vertices_.emplace_back(tx(x1, y0), ty(x1, y0), texture.x1(), texture.y0(), colorMul);
    vertices_.emplace_back(tx(x1, y1), ty(x1, y1), texture.x1(), texture.y1(), colorMul);
    vertices_.emplace_back(tx(x0, y1), ty(x0, y1), texture.x0(), texture.y1(), colorMul);

    for (uint16_t index : QUAD_INDICES) {
        indices_.push_back(static_cast<uint16_t>(base + index));
    }
}

void BatchBuilder2D::drawVertices(const std::vector<TexturedVertex>& vertices, const std::vector<uint16_t>& indices,
                                  AGTexture* texture, AGBlending blending, bool smoothing) {
    if (indices.size() % 3 != 0) {
        throw std::invalid_argument("BatchBuilder2D::drawVertices: index count must be a multiple of 3");
    }
    for (uint16_t index : indices) {
        if (index >= vertices.size()) {
            throw std::invalid_argument("BatchBuilder2D::drawVertices: index " + std::to_string(index) +
                " out of range");
        }
    }

    setState(texture, blending, smoothing);
    ensure(static_cast<int>(indices.size()), static_cast<int>(vertices.size()));

    auto base = static_cast<uint16_t>(vertices_.size());
    vertices_.insert(vertices_.end(), vertices.begin(), vertices.end());
    for (uint16_t index : indices) {
        indices_.push_back(static_cast<uint16_t>(base + index));
    }
}

void BatchBuilder2D::flush() {
    if (vertices_.empty()) {
        return;
    }

    tryFinally([&] {
        ctx_.updateStandardUniforms();

        ctx_.dynamicVertexDataPool().use([&](AGVertexData& vertexData) {
            ctx_.dynamicIndexBufferPool().use([&](AGBuffer& indexBuffer) {
                vertexData.buffer().upload(vertices_);
                indexBuffer.upload(indices_);

                batchUniforms_.setTo(ctx_.uniforms());
                batchUniforms_.set(DefaultShaders::u_Tex, AGTextureUnit{currentTexture_, currentSmoothing_});

                AGBatch batch;
                batch.vertexData = &vertexData;
                batch.indices = &indexBuffer;
                batch.program = &DefaultShaders::PROGRAM_DEFAULT;
                batch.drawType = AGDrawType::Triangles;
                batch.vertexCount = indexCount();
                batch.offset = 0;
                batch.blending = currentBlending_;
                batch.uniforms = &batchUniforms_;
                batch.scissor = scissor_;

                ctx_.ag().draw(batch);
                ctx_.stats().addDraw(vertexCount());
            });
        });
    }, [&] {
        vertices_.clear();
        indices_.clear();
    });
}

} // namespace kestrel
