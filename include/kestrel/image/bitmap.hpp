#pragma once

#include "kestrel/core/types.hpp"
#include "kestrel/image/color.hpp"
#include "kestrel/math/geom.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kestrel {

/**
 * @brief CPU-side RGBA image
 *
 * Every mutation bumps contentVersion(); texture managers compare it with
 * the version they last uploaded to decide whether to re-upload.
 */
class Bitmap32 {
public:
    Bitmap32(int width, int height, RGBA fill = Colors::TRANSPARENT_BLACK,
             bool premultiplied = false);

    /// Create a shared bitmap (the form texture managers track)
    static BitmapRef create(int width, int height, RGBA fill = Colors::TRANSPARENT_BLACK,
                            bool premultiplied = false);

    int width() const { return width_; }
    int height() const { return height_; }
    bool premultiplied() const { return premultiplied_; }

    RGBA get(int x, int y) const;
    void set(int x, int y, RGBA color);
    void fill(RGBA color);

    /// Copy @p src into this bitmap at (dx, dy), clipping at the edges
    void put(const Bitmap32& src, int dx, int dy);

    const std::vector<RGBA>& data() const { return data_; }

    /// Writable pixel storage; callers must markDirty() afterwards
    std::vector<RGBA>& mutableData() { return data_; }

    uint64_t contentVersion() const { return contentVersion_; }
    void markDirty() { contentVersion_++; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    bool operator==(const Bitmap32& other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }

private:
    int width_;
    int height_;
    bool premultiplied_;
    std::vector<RGBA> data_;
    uint64_t contentVersion_ = 0;
};

/**
 * @brief A region of a shared bitmap
 *
 * Texture coordinates are normalized against the owning bitmap size.
 */
class BmpSlice {
public:
    explicit BmpSlice(BitmapRef bmp);
    BmpSlice(BitmapRef bmp, RectangleInt bounds, std::string name = {});

    const BitmapRef& bmp() const { return bmp_; }
    const RectangleInt& bounds() const { return bounds_; }
    const std::string& name() const { return name_; }

    int width() const { return bounds_.width; }
    int height() const { return bounds_.height; }

    float tlX() const;
    float tlY() const;
    float brX() const;
    float brY() const;

    /// Sub-region relative to this slice, clipped to it
    BmpSlice slice(int x, int y, int width, int height) const;

    /// Copy the region into a standalone bitmap
    Bitmap32 extract() const;

private:
    BitmapRef bmp_;
    RectangleInt bounds_;
    std::string name_;
};

namespace Bitmaps {

/// Shared 1x1 transparent slice
const BmpSlice& transparent();

/// Shared 1x1 white slice, used for untextured (solid color) quads
const BmpSlice& white();

} // namespace Bitmaps

/**
 * @brief Decode an encoded image (PNG, JPEG, BMP, TGA, PNM, ...)
 * @throws std::runtime_error if the data cannot be decoded
 */
BitmapRef decodeBitmap(const std::vector<uint8_t>& bytes, const std::string& nameForErrors = "<memory>");

} // namespace kestrel
