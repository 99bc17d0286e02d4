#pragma once

#include <memory>

namespace kestrel {

// Forward declarations
class AG;
class AGBuffer;
class AGTexture;
class AGFrameBuffer;
class AGVertexData;
class Bitmap32;
class RenderContext;
class BatchBuilder2D;
class View;
class Container;
class Views;
class Font;
class KTreeSerializer;

// Unique pointer typedefs for owned resources
using AGBufferPtr = std::unique_ptr<AGBuffer>;
using AGTexturePtr = std::unique_ptr<AGTexture>;
using AGFrameBufferPtr = std::unique_ptr<AGFrameBuffer>;
using AGVertexDataPtr = std::unique_ptr<AGVertexData>;
using ViewPtr = std::unique_ptr<View>;

// Shared pointer typedefs for shared resources
using BitmapRef = std::shared_ptr<Bitmap32>;
using FontRef = std::shared_ptr<Font>;

/**
 * @brief Anything that owns a resource that must be released explicitly
 */
class Closeable {
public:
    virtual ~Closeable() = default;
    virtual void close() = 0;
};

using CloseableRef = std::shared_ptr<Closeable>;

} // namespace kestrel
