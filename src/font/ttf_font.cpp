#include "kestrel/font/ttf_font.hpp"
#include "kestrel/core/logging.hpp"
#include "kestrel/image/bitmap.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace kestrel {

namespace {

std::string ftErrorMessage(FT_Error error) {
    const char* text = FT_Error_String(error);
    std::string message = "FreeType error " + std::to_string(error);
    if (text) {
        message += std::string(" (") + text + ")";
    }
    return message;
}

void checkFt(FT_Error error, const std::string& what) {
    if (error) {
        throw std::runtime_error(what + ": " + ftErrorMessage(error));
    }
}

uint8_t coverageAt(const FT_Bitmap& bitmap, int x, int y) {
    const unsigned char* row = bitmap.buffer + y * bitmap.pitch;
    switch (bitmap.pixel_mode) {
        case FT_PIXEL_MODE_MONO:
            return (row[x >> 3] & (0x80 >> (x & 7))) ? 255 : 0;
        case FT_PIXEL_MODE_GRAY:
            return row[x];
        case FT_PIXEL_MODE_BGRA:
            return row[x * 4 + 3];
        default:
            return 0;
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

std::shared_ptr<TtfFont> TtfFont::fromFile(const std::string& path, std::optional<std::string> name) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open font file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return std::shared_ptr<TtfFont>(new TtfFont(std::move(bytes), path, std::move(name)));
}

std::shared_ptr<TtfFont> TtfFont::fromBytes(std::vector<uint8_t> bytes, std::optional<std::string> name) {
    return std::shared_ptr<TtfFont>(new TtfFont(std::move(bytes), "<memory>", std::move(name)));
}

TtfFont::TtfFont(std::vector<uint8_t> bytes, const std::string& pathForErrors, std::optional<std::string> name)
    : bytes_(std::move(bytes))
    , source_(pathForErrors) {
    if (bytes_.empty()) {
        throw std::runtime_error("Failed to load font " + source_ + ": no data");
    }

    checkFt(FT_Init_FreeType(&library_), "Failed to initialize FreeType");

    FT_Error error = FT_New_Memory_Face(library_, bytes_.data(), static_cast<FT_Long>(bytes_.size()), 0, &face_);
    if (error) {
        FT_Done_FreeType(library_);
        library_ = nullptr;
        throw std::runtime_error("Failed to load font " + source_ + ": " + ftErrorMessage(error));
    }
    FT_Select_Charmap(face_, FT_ENCODING_UNICODE);

    familyName_ = face_->family_name ? face_->family_name : "";
    styleName_ = face_->style_name ? face_->style_name : "";
    name_ = name ? *name : familyName_;

    KESTREL_DEBUG(LogCategory::Font, "Loaded font '" + name_ + "' (" + familyName_ + " " + styleName_ +
        ") from " + source_);
}

TtfFont::~TtfFont() {
    if (face_) {
        FT_Done_Face(face_);
    }
    if (library_) {
        FT_Done_FreeType(library_);
    }
}

int TtfFont::numGlyphs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(face_->num_glyphs);
}

void TtfFont::setSize(double size) {
    if (!(size > 0.0)) {
        throw std::invalid_argument("TtfFont: font size must be positive");
    }
    if (FT_IS_SCALABLE(face_)) {
        checkFt(FT_Set_Char_Size(face_, 0, static_cast<FT_F26Dot6>(std::lround(size * 64.0)), 72, 72),
                "Failed to set size of font " + name_);
        return;
    }

    // Bitmap-only faces: pick the closest strike
    int best = 0;
    for (int i = 1; i < face_->num_fixed_sizes; i++) {
        if (std::abs(face_->available_sizes[i].height - size) <
            std::abs(face_->available_sizes[best].height - size)) {
            best = i;
        }
    }
    checkFt(FT_Select_Size(face_, best), "Failed to select size of font " + name_);
}

// ============================================================================
// Metrics
// ============================================================================

FontMetrics TtfFont::getFontMetrics(double size) {
    std::lock_guard<std::mutex> lock(mutex_);
    setSize(size);

    FontMetrics metrics;
    metrics.size = size;
    if (FT_IS_SCALABLE(face_) && face_->units_per_EM > 0) {
        double scale = size / face_->units_per_EM;
        metrics.ascent = face_->ascender * scale;
        metrics.descent = face_->descender * scale;
        metrics.lineGap = std::max(0.0, face_->height * scale - (metrics.ascent - metrics.descent));
    } else {
        const FT_Size_Metrics& sm = face_->size->metrics;
        metrics.ascent = sm.ascender / 64.0;
        metrics.descent = sm.descender / 64.0;
        metrics.lineGap = std::max(0.0, sm.height / 64.0 - (metrics.ascent - metrics.descent));
    }
    metrics.lineHeight = metrics.ascent - metrics.descent + metrics.lineGap;
    return metrics;
}

GlyphMetrics TtfFont::getGlyphMetrics(double size, int codePoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    setSize(size);

    GlyphMetrics metrics;
    metrics.size = size;
    metrics.codePoint = codePoint;

    FT_UInt index = FT_Get_Char_Index(face_, static_cast<FT_ULong>(codePoint));
    if (index == 0) {
        return metrics;
    }

    checkFt(FT_Load_Glyph(face_, index, FT_LOAD_DEFAULT),
            "Failed to load glyph " + std::to_string(codePoint) + " of font " + name_);

    const FT_Glyph_Metrics& gm = face_->glyph->metrics;
    metrics.existing = true;
    metrics.xadvance = face_->glyph->advance.x / 64.0;
    metrics.bounds.setTo(gm.horiBearingX / 64.0, -gm.horiBearingY / 64.0,
                         gm.width / 64.0, gm.height / 64.0);
    return metrics;
}

// ============================================================================
// Rasterization
// ============================================================================

BitmapRef TtfFont::renderGlyph(double size, int codePoint, RGBA color) {
    std::lock_guard<std::mutex> lock(mutex_);
    setSize(size);

    FT_UInt index = FT_Get_Char_Index(face_, static_cast<FT_ULong>(codePoint));
    if (index == 0) {
        return nullptr;
    }

    checkFt(FT_Load_Glyph(face_, index, FT_LOAD_RENDER),
            "Failed to render glyph " + std::to_string(codePoint) + " of font " + name_);

    const FT_Bitmap& src = face_->glyph->bitmap;
    int width = static_cast<int>(src.width);
    int height = static_cast<int>(src.rows);

    BitmapRef out = Bitmap32::create(width, height);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            uint8_t coverage = coverageAt(src, x, y);
            if (coverage) {
                out->set(x, y, color.withA(static_cast<uint8_t>(color.a() * coverage / 255)));
            }
        }
    }
    return out;
}

} // namespace kestrel
