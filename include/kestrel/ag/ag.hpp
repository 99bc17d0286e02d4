#pragma once

#include "kestrel/core/types.hpp"
#include "kestrel/core/finally.hpp"
#include "kestrel/ag/uniforms.hpp"
#include "kestrel/image/bitmap.hpp"
#include "kestrel/image/color.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

class AG;

enum class AGObjectKind {
    Buffer,
    Texture,
    FrameBuffer,
    VertexData
};

enum class AGBufferKind {
    Vertex,
    Index,
    Uniform
};

enum class AGDrawType {
    Triangles,
    TriangleStrip,
    TriangleFan,
    Lines,
    Points
};

enum class AGBlending {
    None,
    Normal,
    Add,
    Multiply,
    Screen
};

const char* toString(AGObjectKind kind);
const char* toString(AGDrawType type);
const char* toString(AGBlending blending);

/**
 * @brief Scissor rectangle in render-buffer pixels
 */
struct AGScissor {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const AGScissor& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const AGScissor& o) const { return !(*this == o); }

    std::string toString() const;
};

/**
 * @brief Capabilities reported by a backend
 */
struct AGFeatures {
    bool isInstancedSupported = false;
    bool isFloatTextureSupported = false;
    bool isStencilSupported = true;
    int maxTextureSize = 4096;
};

/**
 * @brief Base for every GPU resource created by an AG
 *
 * Resources must not outlive the AG that created them. close() is
 * idempotent; the destructor closes the resource if still open.
 */
class AGObject : public Closeable {
public:
    ~AGObject() override;

    AGObject(const AGObject&) = delete;
    AGObject& operator=(const AGObject&) = delete;

    uint32_t id() const { return id_; }
    AGObjectKind kind() const { return kind_; }
    AG& ag() const { return *ag_; }
    bool isClosed() const { return closed_; }

    void close() override;

    /// "Buffer[3]", "Texture[7]", ...
    std::string label() const;

protected:
    AGObject(AG& ag, AGObjectKind kind);

private:
    AG* ag_;
    AGObjectKind kind_;
    uint32_t id_;
    bool closed_ = false;
};

/**
 * @brief GPU buffer (vertices, indices or uniforms)
 */
class AGBuffer : public AGObject {
public:
    AGBufferKind bufferKind() const { return bufferKind_; }

    /// Replace the buffer contents
    void upload(const void* data, size_t bytes);

    template<typename T>
    void upload(const std::vector<T>& items) {
        upload(items.data(), items.size() * sizeof(T));
    }

    size_t size() const { return data_.size(); }
    const std::vector<uint8_t>& data() const { return data_; }

    /// Number of uploads performed
    uint64_t version() const { return version_; }

private:
    friend class AG;
    AGBuffer(AG& ag, AGBufferKind kind);

    AGBufferKind bufferKind_;
    std::vector<uint8_t> data_;
    uint64_t version_ = 0;
};

/**
 * @brief GPU texture
 */
class AGTexture : public AGObject {
public:
    /// Upload pixels; the texture takes the bitmap's size
    void upload(const Bitmap32& bitmap, bool mipmaps = false);

    int width() const { return width_; }
    int height() const { return height_; }
    bool premultiplied() const { return premultiplied_; }
    bool mipmaps() const { return mipmaps_; }

    /// True when this texture is the color attachment of a framebuffer
    bool isFbo() const { return isFbo_; }

    uint64_t uploadCount() const { return uploadCount_; }

private:
    friend class AG;
    friend class AGFrameBuffer;
    AGTexture(AG& ag, bool premultiplied);

    int width_ = 0;
    int height_ = 0;
    bool premultiplied_ = true;
    bool mipmaps_ = false;
    bool isFbo_ = false;
    uint64_t uploadCount_ = 0;
};

/**
 * @brief Off-screen render buffer with an owned color texture
 */
class AGFrameBuffer : public AGObject {
public:
    ~AGFrameBuffer() override;

    void setSize(int width, int height);
    void setExtra(bool hasDepth, bool hasStencil, int msamples);

    int width() const { return width_; }
    int height() const { return height_; }
    bool hasDepth() const { return hasDepth_; }
    bool hasStencil() const { return hasStencil_; }
    int msamples() const { return msamples_; }

    AGTexture& tex() const { return *tex_; }

    void close() override;

private:
    friend class AG;
    AGFrameBuffer(AG& ag, AGTexturePtr tex);

    AGTexturePtr tex_;
    int width_ = 0;
    int height_ = 0;
    bool hasDepth_ = false;
    bool hasStencil_ = true;
    int msamples_ = 1;
};

/**
 * @brief Vertex attribute description
 */
struct AGVertexAttribute {
    enum class Type { Float, UByteNormalized };

    std::string name;
    int components = 1;
    Type type = Type::Float;

    int byteSize() const { return components * (type == Type::Float ? 4 : 1); }
};

struct AGVertexLayout {
    std::vector<AGVertexAttribute> attributes;

    int stride() const {
        int total = 0;
        for (const auto& attr : attributes) {
            total += attr.byteSize();
        }
        return total;
    }
};

/**
 * @brief Vertex buffer plus the layout describing it
 */
class AGVertexData : public AGObject {
public:
    ~AGVertexData() override;

    const AGVertexLayout& layout() const { return layout_; }
    void setLayout(AGVertexLayout layout) { layout_ = std::move(layout); }

    AGBuffer& buffer() const { return *buffer_; }

    void close() override;

private:
    friend class AG;
    AGVertexData(AG& ag, AGBufferPtr buffer, AGVertexLayout layout);

    AGBufferPtr buffer_;
    AGVertexLayout layout_;
};

/**
 * @brief Shader program identity and the uniforms it reads
 */
struct AGProgram {
    std::string name;
    std::vector<Uniform> uniforms;
};

/**
 * @brief One draw command
 */
struct AGBatch {
    const AGVertexData* vertexData = nullptr;
    const AGBuffer* indices = nullptr;
    const AGProgram* program = nullptr;
    AGDrawType drawType = AGDrawType::Triangles;
    int vertexCount = 0;   // Number of indices (or vertices without an index buffer)
    int offset = 0;
    AGBlending blending = AGBlending::Normal;
    const AGUniformValues* uniforms = nullptr;
    std::optional<AGScissor> scissor;
};

struct AGClear {
    RGBA color = Colors::TRANSPARENT_BLACK;
    float depth = 1.0f;
    int stencil = 0;
    bool clearColor = true;
    bool clearDepth = true;
    bool clearStencil = true;
};

/**
 * @brief Accelerated Graphics: the backend-neutral GPU interface
 *
 * AG owns resource identity, render-buffer binding and the temporary
 * framebuffer pool. Backends implement the protected on*() hooks.
 *
 * Usage:
 * @code
 * LogAG ag(800, 600);
 * auto tex = ag.createTexture();
 * tex->upload(*bitmap);
 *
 * ag.tempAllocateFrameBuffer(128, 128, false, true, 1, [&](AGFrameBuffer& fb) {
 *     ag.setRenderBufferTemporally(fb, [&] {
 *         ag.clear({Colors::RED});
 *     });
 * });
 * @endcode
 */
class AG {
public:
    virtual ~AG();

    AG(const AG&) = delete;
    AG& operator=(const AG&) = delete;

    // =========================================================================
    // Resource creation
    // =========================================================================

    AGBufferPtr createBuffer(AGBufferKind kind = AGBufferKind::Vertex);
    AGTexturePtr createTexture(bool premultiplied = true);
    AGFrameBufferPtr createFrameBuffer();
    AGVertexDataPtr createVertexData(AGVertexLayout layout = {});

    // =========================================================================
    // Commands
    // =========================================================================

    void draw(const AGBatch& batch);
    void clear(const AGClear& clear = {});
    void clear(RGBA color) { clear(AGClear{color}); }
    void flip();

    /// Read the current render buffer into @p out (sized to the buffer)
    void readColor(Bitmap32& out);

    // =========================================================================
    // Render buffers
    // =========================================================================

    /// Bind @p frameBuffer, or the main buffer for nullptr
    void setRenderBuffer(AGFrameBuffer* frameBuffer);
    AGFrameBuffer* currentRenderBuffer() const { return currentRenderBuffer_; }

    /// Bind @p frameBuffer while @p block runs, then restore the previous binding
    template<typename F>
    auto setRenderBufferTemporally(AGFrameBuffer& frameBuffer, F&& block) {
        AGFrameBuffer* old = currentRenderBuffer_;
        setRenderBuffer(&frameBuffer);
        return tryFinally([&]() { return block(); }, [&] { setRenderBuffer(old); });
    }

    bool isRenderingToTexture() const { return currentRenderBuffer_ != nullptr; }
    int currentWidth() const;
    int currentHeight() const;

    void setMainSize(int width, int height);
    int mainWidth() const { return mainWidth_; }
    int mainHeight() const { return mainHeight_; }

    double devicePixelRatio() const { return devicePixelRatio_; }
    void setDevicePixelRatio(double ratio) { devicePixelRatio_ = ratio; }
    double computedPixelRatio() const { return devicePixelRatio_; }

    const AGFeatures& features() const { return features_; }

    /**
     * @brief Borrow a pooled framebuffer sized @p width x @p height
     *
     * The framebuffer returns to the pool after @p block, even on exceptions.
     */
    template<typename F>
    void tempAllocateFrameBuffer(int width, int height, bool hasDepth, bool hasStencil,
                                 int msamples, F&& block) {
        AGFrameBufferPtr fb = acquireFrameBuffer(width, height, hasDepth, hasStencil, msamples);
        AGFrameBuffer& ref = *fb;
        tryFinally([&] { block(ref); }, [&] { releaseFrameBuffer(std::move(fb)); });
    }

    /**
     * @brief Render into a temporary framebuffer sized like @p bmp and read it back
     */
    template<typename F>
    void renderToBitmap(Bitmap32& bmp, bool hasDepth, bool hasStencil, int msamples, F&& block);

    // =========================================================================
    // Diagnostics
    // =========================================================================

    /// Resources created and not yet closed
    size_t liveObjectCount() const { return liveObjects_; }

    /// Framebuffers parked in the temporary pool
    size_t pooledFrameBufferCount() const { return frameBufferPool_.size(); }

protected:
    explicit AG(AGFeatures features = {}, int mainWidth = 640, int mainHeight = 480);

    /// Close pooled framebuffers; backends call this from their destructor
    void releaseTemporaryFrameBuffers();

    // Backend hooks
    virtual void onCreated(AGObject& object) = 0;
    virtual void onClosed(AGObject& object) = 0;
    virtual void onBufferUpload(AGBuffer& buffer) = 0;
    virtual void onTextureUpload(AGTexture& texture, const Bitmap32* bitmap) = 0;
    virtual void onDraw(const AGBatch& batch) = 0;
    virtual void onClear(const AGClear& clear) = 0;
    virtual void onFlip() = 0;
    virtual void onBindRenderBuffer(AGFrameBuffer* frameBuffer) = 0;
    virtual void onReadColor(Bitmap32& out) = 0;

private:
    friend class AGObject;
    friend class AGBuffer;
    friend class AGTexture;
    friend class AGFrameBuffer;

    uint32_t registerObject();
    void objectClosed(AGObject& object);

    AGFrameBufferPtr acquireFrameBuffer(int width, int height, bool hasDepth,
                                        bool hasStencil, int msamples);
    void releaseFrameBuffer(AGFrameBufferPtr frameBuffer);

    AGFeatures features_;
    int mainWidth_;
    int mainHeight_;
    double devicePixelRatio_ = 1.0;
    AGFrameBuffer* currentRenderBuffer_ = nullptr;

    std::vector<AGFrameBufferPtr> frameBufferPool_;
    uint32_t nextId_ = 1;
    size_t liveObjects_ = 0;
    bool shuttingDown_ = false;
};

template<typename F>
void AG::renderToBitmap(Bitmap32& bmp, bool hasDepth, bool hasStencil, int msamples, F&& block) {
    tempAllocateFrameBuffer(bmp.width(), bmp.height(), hasDepth, hasStencil, msamples,
        [&](AGFrameBuffer& fb) {
            setRenderBufferTemporally(fb, [&] {
                block();
                readColor(bmp);
            });
        });
}

} // namespace kestrel
