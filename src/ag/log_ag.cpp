#include "kestrel/ag/log_ag.hpp"
#include "kestrel/core/logging.hpp"

#include <sstream>

namespace kestrel {

namespace {

std::string boolString(bool value) {
    return value ? "true" : "false";
}

std::string floatString(float value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

} // namespace

LogAG::LogAG(int width, int height)
    : AG(AGFeatures{}, width, height) {
}

LogAG::~LogAG() {
    // Pooled framebuffers are closed while the hooks still belong to LogAG
    releaseTemporaryFrameBuffers();
}

std::string LogAG::logAsString() const {
    std::string out;
    for (size_t i = 0; i < log_.size(); i++) {
        if (i > 0) {
            out += '\n';
        }
        out += log_[i];
    }
    return out;
}

void LogAG::clearLog() {
    log_.clear();
    draws_.clear();
}

void LogAG::record(std::string line) {
    if (echo_) {
        KESTREL_TRACE(LogCategory::Graphics, line);
    }
    log_.push_back(std::move(line));
}

void LogAG::onCreated(AGObject& object) {
    record("create" + std::string(toString(object.kind())) + "():" + std::to_string(object.id()));
}

void LogAG::onClosed(AGObject& object) {
    if (object.kind() == AGObjectKind::FrameBuffer) {
        clearColors_.erase(object.id());
    }
    record(object.label() + ".close()");
}

void LogAG::onBufferUpload(AGBuffer& buffer) {
    record(buffer.label() + ".upload(" + std::to_string(buffer.size()) + " bytes)");
}

void LogAG::onTextureUpload(AGTexture& texture, const Bitmap32* bitmap) {
    (void)bitmap;
    record(texture.label() + ".upload(" + std::to_string(texture.width()) + "x" +
           std::to_string(texture.height()) + ", mipmaps=" + boolString(texture.mipmaps()) + ")");
}

void LogAG::onDraw(const AGBatch& batch) {
    DrawRecord draw;
    draw.program = batch.program ? batch.program->name : "none";
    draw.drawType = batch.drawType;
    draw.vertexCount = batch.vertexCount;
    draw.offset = batch.offset;
    draw.blending = batch.blending;
    draw.scissor = batch.scissor;
    draw.renderBufferId = currentRenderBuffer() ? currentRenderBuffer()->id() : 0;
    if (batch.uniforms) {
        draw.uniforms.setTo(*batch.uniforms);
        if (AGTexture* tex = batch.uniforms->firstTexture()) {
            draw.textureId = tex->id();
        }
    }
    if (batch.vertexData) {
        draw.vertices = batch.vertexData->buffer().data();
    }
    if (batch.indices) {
        draw.indices = batch.indices->data();
    }

    std::string line = "draw(program=" + draw.program +
        ", type=" + toString(draw.drawType) +
        ", vertexCount=" + std::to_string(draw.vertexCount) +
        ", offset=" + std::to_string(draw.offset) +
        ", blending=" + toString(draw.blending) +
        ", tex=" + (draw.textureId ? "Texture[" + std::to_string(draw.textureId) + "]" : std::string("none")) +
        ", scissor=" + (draw.scissor ? draw.scissor->toString() : std::string("none"));
    if (logUniforms_ && batch.uniforms) {
        line += ", uniforms=" + batch.uniforms->toString();
    }
    line += ")";

    draws_.push_back(std::move(draw));
    record(std::move(line));
}

void LogAG::onClear(const AGClear& clear) {
    uint32_t target = currentRenderBuffer() ? currentRenderBuffer()->id() : 0;
    if (clear.clearColor) {
        clearColors_[target] = clear.color;
    }
    std::string line = "clear(";
    line += clear.clearColor ? "color=" + clear.color.hexString() : std::string("color=keep");
    line += clear.clearDepth ? ", depth=" + floatString(clear.depth) : std::string(", depth=keep");
    line += clear.clearStencil ? ", stencil=" + std::to_string(clear.stencil) : std::string(", stencil=keep");
    line += ")";
    record(std::move(line));
}

void LogAG::onFlip() {
    record("flip()");
}

void LogAG::onBindRenderBuffer(AGFrameBuffer* frameBuffer) {
    if (frameBuffer) {
        record("setRenderBuffer(" + frameBuffer->label() + " " +
               std::to_string(frameBuffer->width()) + "x" + std::to_string(frameBuffer->height()) + ")");
    } else {
        record("setRenderBuffer(main)");
    }
}

void LogAG::onReadColor(Bitmap32& out) {
    uint32_t target = currentRenderBuffer() ? currentRenderBuffer()->id() : 0;
    auto it = clearColors_.find(target);
    out.fill(it != clearColors_.end() ? it->second : Colors::TRANSPARENT_BLACK);
    record("readColor(" + std::to_string(out.width()) + "x" + std::to_string(out.height()) + ")");
}

} // namespace kestrel
