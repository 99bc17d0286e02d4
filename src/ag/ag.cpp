#include "kestrel/ag/ag.hpp"
#include "kestrel/core/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace kestrel {

const char* toString(AGObjectKind kind) {
    switch (kind) {
        case AGObjectKind::Buffer:      return "Buffer";
        case AGObjectKind::Texture:     return "Texture";
        case AGObjectKind::FrameBuffer: return "FrameBuffer";
        case AGObjectKind::VertexData:  return "VertexData";
        default:                        return "Object";
    }
}

const char* toString(AGDrawType type) {
    switch (type) {
        case AGDrawType::Triangles:     return "TRIANGLES";
        case AGDrawType::TriangleStrip: return "TRIANGLE_STRIP";
        case AGDrawType::TriangleFan:   return "TRIANGLE_FAN";
        case AGDrawType::Lines:         return "LINES";
        case AGDrawType::Points:        return "POINTS";
        default:                        return "UNKNOWN";
    }
}

const char* toString(AGBlending blending) {
    switch (blending) {
        case AGBlending::None:     return "NONE";
        case AGBlending::Normal:   return "NORMAL";
        case AGBlending::Add:      return "ADD";
        case AGBlending::Multiply: return "MULTIPLY";
        case AGBlending::Screen:   return "SCREEN";
        default:                   return "UNKNOWN";
    }
}

std::string AGScissor::toString() const {
    return "Scissor(" + std::to_string(x) + ", " + std::to_string(y) + ", " +
           std::to_string(width) + ", " + std::to_string(height) + ")";
}

// ============================================================================
// AGObject
// ============================================================================

AGObject::AGObject(AG& ag, AGObjectKind kind)
    : ag_(&ag)
    , kind_(kind)
    , id_(ag.registerObject()) {
}

AGObject::~AGObject() {
    if (!closed_) {
        closed_ = true;
        ag_->objectClosed(*this);
    }
}

void AGObject::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    ag_->objectClosed(*this);
}

std::string AGObject::label() const {
    return std::string(toString(kind_)) + "[" + std::to_string(id_) + "]";
}

// ============================================================================
// AGBuffer
// ============================================================================

AGBuffer::AGBuffer(AG& ag, AGBufferKind kind)
    : AGObject(ag, AGObjectKind::Buffer)
    , bufferKind_(kind) {
}

void AGBuffer::upload(const void* data, size_t bytes) {
    if (isClosed()) {
        throw std::runtime_error("Cannot upload to closed " + label());
    }
    const auto* begin = static_cast<const uint8_t*>(data);
    if (bytes > 0 && begin == nullptr) {
        throw std::invalid_argument("AGBuffer::upload: null data with non-zero size");
    }
    data_.assign(begin, begin + bytes);
    version_++;
    ag().onBufferUpload(*this);
}

// ============================================================================
// AGTexture
// ============================================================================

AGTexture::AGTexture(AG& ag, bool premultiplied)
    : AGObject(ag, AGObjectKind::Texture)
    , premultiplied_(premultiplied) {
}

void AGTexture::upload(const Bitmap32& bitmap, bool mipmaps) {
    if (isClosed()) {
        throw std::runtime_error("Cannot upload to closed " + label());
    }
    width_ = bitmap.width();
    height_ = bitmap.height();
    mipmaps_ = mipmaps;
    uploadCount_++;
    ag().onTextureUpload(*this, &bitmap);
}

// ============================================================================
// AGFrameBuffer
// ============================================================================

AGFrameBuffer::AGFrameBuffer(AG& ag, AGTexturePtr tex)
    : AGObject(ag, AGObjectKind::FrameBuffer)
    , tex_(std::move(tex)) {
    tex_->isFbo_ = true;
}

AGFrameBuffer::~AGFrameBuffer() {
    close();
}

void AGFrameBuffer::setSize(int width, int height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("AGFrameBuffer::setSize: negative size");
    }
    if (width == width_ && height == height_) {
        return;
    }
    width_ = width;
    height_ = height;
    tex_->width_ = width;
    tex_->height_ = height;
}

void AGFrameBuffer::setExtra(bool hasDepth, bool hasStencil, int msamples) {
    hasDepth_ = hasDepth;
    hasStencil_ = hasStencil;
    msamples_ = std::max(1, msamples);
}

void AGFrameBuffer::close() {
    if (isClosed()) {
        return;
    }
    if (ag().currentRenderBuffer() == this) {
        ag().setRenderBuffer(nullptr);
    }
    tex_->close();
    AGObject::close();
}

// ============================================================================
// AGVertexData
// ============================================================================

AGVertexData::AGVertexData(AG& ag, AGBufferPtr buffer, AGVertexLayout layout)
    : AGObject(ag, AGObjectKind::VertexData)
    , buffer_(std::move(buffer))
    , layout_(std::move(layout)) {
}

AGVertexData::~AGVertexData() {
    close();
}

void AGVertexData::close() {
    if (isClosed()) {
        return;
    }
    buffer_->close();
    AGObject::close();
}

// ============================================================================
// AG
// ============================================================================

AG::AG(AGFeatures features, int mainWidth, int mainHeight)
    : features_(features)
    , mainWidth_(mainWidth)
    , mainHeight_(mainHeight) {
}

AG::~AG() {
    shuttingDown_ = true;
    currentRenderBuffer_ = nullptr;
    frameBufferPool_.clear();
    if (liveObjects_ > 0) {
        KESTREL_WARN(LogCategory::Graphics,
            "AG destroyed with " + std::to_string(liveObjects_) + " live objects");
    }
}

uint32_t AG::registerObject() {
    liveObjects_++;
    return nextId_++;
}

void AG::objectClosed(AGObject& object) {
    if (liveObjects_ > 0) {
        liveObjects_--;
    }
    if (!shuttingDown_) {
        onClosed(object);
    }
}

AGBufferPtr AG::createBuffer(AGBufferKind kind) {
    AGBufferPtr buffer(new AGBuffer(*this, kind));
    onCreated(*buffer);
    return buffer;
}

AGTexturePtr AG::createTexture(bool premultiplied) {
    AGTexturePtr texture(new AGTexture(*this, premultiplied));
    onCreated(*texture);
    return texture;
}

AGFrameBufferPtr AG::createFrameBuffer() {
    AGFrameBufferPtr frameBuffer(new AGFrameBuffer(*this, createTexture(true)));
    onCreated(*frameBuffer);
    return frameBuffer;
}

AGVertexDataPtr AG::createVertexData(AGVertexLayout layout) {
    AGVertexDataPtr vertexData(new AGVertexData(*this, createBuffer(AGBufferKind::Vertex), std::move(layout)));
    onCreated(*vertexData);
    return vertexData;
}

void AG::draw(const AGBatch& batch) {
    if (batch.vertexCount <= 0) {
        return;
    }
    onDraw(batch);
}

void AG::clear(const AGClear& clear) {
    onClear(clear);
}

void AG::flip() {
    onFlip();
}

void AG::readColor(Bitmap32& out) {
    onReadColor(out);
}

void AG::setRenderBuffer(AGFrameBuffer* frameBuffer) {
    if (frameBuffer == currentRenderBuffer_) {
        return;
    }
    currentRenderBuffer_ = frameBuffer;
    onBindRenderBuffer(frameBuffer);
}

int AG::currentWidth() const {
    return currentRenderBuffer_ ? currentRenderBuffer_->width() : mainWidth_;
}

int AG::currentHeight() const {
    return currentRenderBuffer_ ? currentRenderBuffer_->height() : mainHeight_;
}

void AG::setMainSize(int width, int height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("AG::setMainSize: negative size");
    }
    mainWidth_ = width;
    mainHeight_ = height;
}

AGFrameBufferPtr AG::acquireFrameBuffer(int width, int height, bool hasDepth,
                                        bool hasStencil, int msamples) {
    AGFrameBufferPtr fb;
    if (frameBufferPool_.empty()) {
        fb = createFrameBuffer();
    } else {
        fb = std::move(frameBufferPool_.back());
        frameBufferPool_.pop_back();
    }
    fb->setSize(width, height);
    fb->setExtra(hasDepth, hasStencil, msamples);
    return fb;
}

void AG::releaseFrameBuffer(AGFrameBufferPtr frameBuffer) {
    if (frameBuffer && !frameBuffer->isClosed()) {
        frameBufferPool_.push_back(std::move(frameBuffer));
    }
}

void AG::releaseTemporaryFrameBuffers() {
    frameBufferPool_.clear();
}

} // namespace kestrel
