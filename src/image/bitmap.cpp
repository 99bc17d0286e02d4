#include "kestrel/image/bitmap.hpp"
#include "kestrel/core/logging.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include <algorithm>
#include <stdexcept>

namespace kestrel {

// ============================================================================
// Bitmap32
// ============================================================================

Bitmap32::Bitmap32(int width, int height, RGBA fill, bool premultiplied)
    : width_(width)
    , height_(height)
    , premultiplied_(premultiplied) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("Bitmap32: negative size " +
            std::to_string(width) + "x" + std::to_string(height));
    }
    data_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), fill);
}

BitmapRef Bitmap32::create(int width, int height, RGBA fill, bool premultiplied) {
    return std::make_shared<Bitmap32>(width, height, fill, premultiplied);
}

RGBA Bitmap32::get(int x, int y) const {
    if (!inBounds(x, y)) {
        return Colors::TRANSPARENT_BLACK;
    }
    return data_[static_cast<size_t>(y) * width_ + x];
}

void Bitmap32::set(int x, int y, RGBA color) {
    if (!inBounds(x, y)) {
        return;
    }
    data_[static_cast<size_t>(y) * width_ + x] = color;
    markDirty();
}

void Bitmap32::fill(RGBA color) {
    std::fill(data_.begin(), data_.end(), color);
    markDirty();
}

void Bitmap32::put(const Bitmap32& src, int dx, int dy) {
    for (int y = 0; y < src.height(); y++) {
        for (int x = 0; x < src.width(); x++) {
            if (inBounds(dx + x, dy + y)) {
                data_[static_cast<size_t>(dy + y) * width_ + (dx + x)] = src.get(x, y);
            }
        }
    }
    markDirty();
}

// ============================================================================
// BmpSlice
// ============================================================================

BmpSlice::BmpSlice(BitmapRef bmp)
    : bmp_(std::move(bmp)) {
    if (!bmp_) {
        throw std::invalid_argument("BmpSlice: bitmap cannot be null");
    }
    bounds_ = {0, 0, bmp_->width(), bmp_->height()};
}

BmpSlice::BmpSlice(BitmapRef bmp, RectangleInt bounds, std::string name)
    : bmp_(std::move(bmp))
    , bounds_(bounds)
    , name_(std::move(name)) {
    if (!bmp_) {
        throw std::invalid_argument("BmpSlice: bitmap cannot be null");
    }
}

float BmpSlice::tlX() const {
    return bmp_->width() > 0 ? static_cast<float>(bounds_.x) / bmp_->width() : 0.0f;
}

float BmpSlice::tlY() const {
    return bmp_->height() > 0 ? static_cast<float>(bounds_.y) / bmp_->height() : 0.0f;
}

float BmpSlice::brX() const {
    return bmp_->width() > 0 ? static_cast<float>(bounds_.x + bounds_.width) / bmp_->width() : 0.0f;
}

float BmpSlice::brY() const {
    return bmp_->height() > 0 ? static_cast<float>(bounds_.y + bounds_.height) / bmp_->height() : 0.0f;
}

BmpSlice BmpSlice::slice(int x, int y, int width, int height) const {
    int left = std::clamp(x, 0, bounds_.width);
    int top = std::clamp(y, 0, bounds_.height);
    int right = std::clamp(x + width, left, bounds_.width);
    int bottom = std::clamp(y + height, top, bounds_.height);
    return BmpSlice(bmp_, {bounds_.x + left, bounds_.y + top, right - left, bottom - top}, name_);
}

Bitmap32 BmpSlice::extract() const {
    Bitmap32 out(bounds_.width, bounds_.height, Colors::TRANSPARENT_BLACK, bmp_->premultiplied());
    for (int y = 0; y < bounds_.height; y++) {
        for (int x = 0; x < bounds_.width; x++) {
            out.set(x, y, bmp_->get(bounds_.x + x, bounds_.y + y));
        }
    }
    return out;
}

namespace Bitmaps {

const BmpSlice& transparent() {
    static const BmpSlice slice(Bitmap32::create(1, 1, Colors::TRANSPARENT_BLACK), {0, 0, 1, 1}, "transparent");
    return slice;
}

const BmpSlice& white() {
    static const BmpSlice slice(Bitmap32::create(1, 1, Colors::WHITE), {0, 0, 1, 1}, "white");
    return slice;
}

} // namespace Bitmaps

// ============================================================================
// Decoding
// ============================================================================

BitmapRef decodeBitmap(const std::vector<uint8_t>& bytes, const std::string& nameForErrors) {
    if (bytes.empty()) {
        throw std::runtime_error("Failed to decode image " + nameForErrors + ": empty data");
    }

    int width, height, channels;
    stbi_uc* pixels = stbi_load_from_memory(
        bytes.data(), static_cast<int>(bytes.size()),
        &width, &height, &channels, STBI_rgb_alpha);

    if (!pixels) {
        throw std::runtime_error("Failed to decode image " + nameForErrors + ": " +
            std::string(stbi_failure_reason() ? stbi_failure_reason() : "unknown error"));
    }

    auto bitmap = Bitmap32::create(width, height);
    auto& data = bitmap->mutableData();
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = RGBA(pixels[i * 4 + 0], pixels[i * 4 + 1], pixels[i * 4 + 2], pixels[i * 4 + 3]);
    }
    bitmap->markDirty();
    stbi_image_free(pixels);

    KESTREL_DEBUG(LogCategory::Resource, "Decoded image " + nameForErrors +
        " (" + std::to_string(width) + "x" + std::to_string(height) + ")");

    return bitmap;
}

} // namespace kestrel
