#include "kestrel/render/stats.hpp"

namespace kestrel {

void Stats::startFrame() {
    drawCalls = 0;
    vertices = 0;
    batches = 0;
    textureUploads = 0;
    frames++;
}

void Stats::addDraw(int vertexCount) {
    drawCalls++;
    batches++;
    vertices += vertexCount;
    totalDrawCalls++;
    totalVertices += static_cast<uint64_t>(vertexCount);
}

std::string Stats::toString() const {
    return "Stats(frame=" + std::to_string(frames) +
        ", drawCalls=" + std::to_string(drawCalls) +
        ", vertices=" + std::to_string(vertices) +
        ", batches=" + std::to_string(batches) +
        ", textureUploads=" + std::to_string(textureUploads) + ")";
}

} // namespace kestrel
