#pragma once

#include "kestrel/ag/ag.hpp"
#include "kestrel/ag/uniforms.hpp"
#include "kestrel/image/color.hpp"
#include "kestrel/math/matrix.hpp"
#include "kestrel/render/texture.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace kestrel {

class RenderContext;

/**
 * @brief Vertex of the default 2D layout
 */
struct TexturedVertex {
    float x = 0.0f;
    float y = 0.0f;
    float u = 0.0f;
    float v = 0.0f;
    uint32_t colorMul = 0xFFFFFFFFu;  // packed RGBA

    TexturedVertex() = default;
    TexturedVertex(float x_, float y_, float u_, float v_, RGBA color)
        : x(x_), y(y_), u(u_), v(v_), colorMul(color.packed()) {}
};

static_assert(sizeof(TexturedVertex) == 20, "TexturedVertex must match LAYOUT_DEFAULT");

/**
 * @brief Accumulates textured quads and triangles into as few draws as possible
 *
 * Vertices are buffered until the texture, blending, smoothing or scissor
 * changes, the buffer is full, or the owning RenderContext flushes.
 *
 * Usage:
 * @code
 * ctx.useBatcher([&](BatchBuilder2D& batch) {
 *     batch.drawQuad(ctx.getTex(slice), 10, 10, 64, 64, matrix);
 * });
 * @endcode
 */
class BatchBuilder2D {
public:
    static constexpr int DEFAULT_BATCH_QUADS = 4096;

    explicit BatchBuilder2D(RenderContext& ctx, int maxQuads = DEFAULT_BATCH_QUADS);
    ~BatchBuilder2D();

    BatchBuilder2D(const BatchBuilder2D&) = delete;
    BatchBuilder2D& operator=(const BatchBuilder2D&) = delete;

    RenderContext& ctx() const { return ctx_; }

    int maxQuads() const { return maxQuads_; }
    int maxVertices() const { return maxQuads_ * 4; }
    int maxIndices() const { return maxQuads_ * 6; }

    /// Pending vertices and indices
    int vertexCount() const { return static_cast<int>(vertices_.size()); }
    int indexCount() const { return static_cast<int>(indices_.size()); }

    /**
     * @brief Add a quad covering (x, y, width, height) transformed by @p matrix
     */
    void drawQuad(const Texture& texture, float x, float y, float width, float height,
                  const Matrix& matrix = Matrix(), RGBA colorMul = Colors::WHITE,
                  AGBlending blending = AGBlending::Normal, bool smoothing = true);

    /**
     * @brief Add a triangle list; indices are relative to @p vertices
     * @throws std::invalid_argument if the list can never fit in one batch
     */
    void drawVertices(const std::vector<TexturedVertex>& vertices, const std::vector<uint16_t>& indices,
                      AGTexture* texture, AGBlending blending = AGBlending::Normal, bool smoothing = true);

    const std::optional<AGScissor>& scissor() const { return scissor_; }

    /// Change the scissor, flushing first if it differs
    void setScissor(const std::optional<AGScissor>& scissor);

    /// Draw every pending vertex
    void flush();

private:
    void setState(AGTexture* texture, AGBlending blending, bool smoothing);
    void ensure(int indices, int vertices);

    RenderContext& ctx_;
    int maxQuads_;
    size_t flusherId_;

    std::vector<TexturedVertex> vertices_;
    std::vector<uint16_t> indices_;

    AGTexture* currentTexture_ = nullptr;
    AGBlending currentBlending_ = AGBlending::Normal;
    bool currentSmoothing_ = true;
    std::optional<AGScissor> scissor_;

    AGUniformValues batchUniforms_;
};

} // namespace kestrel
