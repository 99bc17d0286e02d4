#include "kestrel/view/image.hpp"
#include "kestrel/render/render_context.hpp"
#include "kestrel/core/vfs.hpp"
#include "kestrel/core/logging.hpp"

#include <exception>

namespace kestrel {

Image::Image(BmpSlice bitmap, double anchorX, double anchorY)
    : RectBase(bitmap.width(), bitmap.height(), anchorX, anchorY)
    , bitmap_(std::move(bitmap)) {
}

Image::Image(BitmapRef bitmap, double anchorX, double anchorY)
    : Image(BmpSlice(std::move(bitmap)), anchorX, anchorY) {
}

void Image::setBitmap(BmpSlice bitmap) {
    bitmap_ = std::move(bitmap);
    setWidth(bitmap_.width());
    setHeight(bitmap_.height());
}

void Image::forceLoadSourceImage(const VfsFile& vfs, const std::optional<std::string>& path) {
    if (!path || path->empty()) {
        sourceImage_.reset();
        return;
    }

    sourceImage_ = path;
    VfsFile file = vfs[*path];
    try {
        setBitmap(BmpSlice(decodeBitmap(file.readBytes(), file.path())));
    } catch (const std::exception& e) {
        KESTREL_WARN(LogCategory::Scene,
            "Failed to load image '" + *path + "': " + e.what());
        setBitmap(Bitmaps::transparent());
    }
}

Texture Image::renderTexture(RenderContext& ctx) {
    return ctx.getTex(bitmap_);
}

} // namespace kestrel
