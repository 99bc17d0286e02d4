#pragma once

#include <cstdint>
#include <string>

namespace kestrel {

/**
 * @brief Per-frame rendering counters
 */
struct Stats {
    // Reset by startFrame()
    int drawCalls = 0;
    int vertices = 0;
    int batches = 0;
    int textureUploads = 0;

    // Running totals
    uint64_t frames = 0;
    uint64_t totalDrawCalls = 0;
    uint64_t totalVertices = 0;

    void startFrame();

    void addDraw(int vertexCount);

    std::string toString() const;
};

} // namespace kestrel
