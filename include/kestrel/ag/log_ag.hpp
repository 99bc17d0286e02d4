#pragma once

#include "kestrel/ag/ag.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kestrel {

/**
 * @brief Headless AG backend that records every command as a text line
 *
 * LogAG keeps no GPU state. Reading back a render buffer yields the
 * color it was last cleared to. Draw commands are additionally kept as
 * structured records so tests can inspect uniforms and vertex data.
 *
 * Usage:
 * @code
 * LogAG ag(320, 240);
 * testRenderContext(ag, [](RenderContext& ctx) {
 *     ctx.useBatcher([&](BatchBuilder2D& batch) {
 *         batch.drawQuad(ctx.getTex(Bitmaps::white()), 0, 0, 10, 10);
 *     });
 * });
 * std::cout << ag.logAsString();
 * @endcode
 */
class LogAG : public AG {
public:
    struct DrawRecord {
        std::string program;
        AGDrawType drawType = AGDrawType::Triangles;
        int vertexCount = 0;
        int offset = 0;
        AGBlending blending = AGBlending::Normal;
        uint32_t textureId = 0;     // 0 when no texture is bound
        uint32_t renderBufferId = 0; // 0 for the main buffer
        std::optional<AGScissor> scissor;
        AGUniformValues uniforms;
        std::vector<uint8_t> vertices;
        std::vector<uint8_t> indices;
    };

    explicit LogAG(int width = 640, int height = 480);
    ~LogAG() override;

    const std::vector<std::string>& log() const { return log_; }

    /// All lines joined with '\n'
    std::string logAsString() const;

    void clearLog();

    const std::vector<DrawRecord>& draws() const { return draws_; }
    size_t drawCount() const { return draws_.size(); }

    /// Also append uniform values to each draw line
    void setLogUniforms(bool enable) { logUniforms_ = enable; }

    /// Forward every recorded line to the Logger at Trace level
    void setEchoToLogger(bool enable) { echo_ = enable; }

protected:
    void onCreated(AGObject& object) override;
    void onClosed(AGObject& object) override;
    void onBufferUpload(AGBuffer& buffer) override;
    void onTextureUpload(AGTexture& texture, const Bitmap32* bitmap) override;
    void onDraw(const AGBatch& batch) override;
    void onClear(const AGClear& clear) override;
    void onFlip() override;
    void onBindRenderBuffer(AGFrameBuffer* frameBuffer) override;
    void onReadColor(Bitmap32& out) override;

private:
    void record(std::string line);

    std::vector<std::string> log_;
    std::vector<DrawRecord> draws_;
    std::map<uint32_t, RGBA> clearColors_;  // keyed by framebuffer id, 0 = main
    bool logUniforms_ = false;
    bool echo_ = false;
};

} // namespace kestrel
