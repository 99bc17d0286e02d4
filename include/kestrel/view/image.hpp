#pragma once

#include "kestrel/image/bitmap.hpp"
#include "kestrel/view/rect_base.hpp"

#include <optional>
#include <string>

namespace kestrel {

class VfsFile;

/**
 * @brief Rectangle textured with a bitmap slice
 *
 * sourceImage() remembers the VFS path the bitmap was loaded from so the
 * view can be serialized back to a KTree.
 */
class Image : public RectBase {
public:
    explicit Image(BmpSlice bitmap, double anchorX = 0.0, double anchorY = 0.0);
    explicit Image(BitmapRef bitmap, double anchorX = 0.0, double anchorY = 0.0);

    const char* typeName() const override { return "Image"; }

    const BmpSlice& bitmap() const { return bitmap_; }

    /// Replace the bitmap and resize the view to it
    void setBitmap(BmpSlice bitmap);

    const std::optional<std::string>& sourceImage() const { return sourceImage_; }
    void setSourceImage(std::optional<std::string> path) { sourceImage_ = std::move(path); }

    /**
     * @brief Load @p path from @p vfs and use it as the bitmap
     *
     * An empty path only clears sourceImage(). A file that cannot be read
     * or decoded is logged and leaves a transparent bitmap.
     */
    void forceLoadSourceImage(const VfsFile& vfs, const std::optional<std::string>& path);

protected:
    Texture renderTexture(RenderContext& ctx) override;

private:
    BmpSlice bitmap_;
    std::optional<std::string> sourceImage_;
};

} // namespace kestrel
