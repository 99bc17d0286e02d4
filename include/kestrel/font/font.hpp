#pragma once

#include "kestrel/core/types.hpp"
#include "kestrel/image/color.hpp"
#include "kestrel/math/geom.hpp"

#include <string>

namespace kestrel {

/**
 * @brief Vertical metrics of a font at a pixel size
 *
 * Distances are in pixels with y growing up from the baseline, so descent
 * is usually negative.
 */
struct FontMetrics {
    double size = 0.0;
    double ascent = 0.0;
    double descent = 0.0;
    double lineGap = 0.0;

    /// ascent - descent + lineGap
    double lineHeight = 0.0;
};

/**
 * @brief Horizontal metrics and bounds of one glyph at a pixel size
 */
struct GlyphMetrics {
    double size = 0.0;
    int codePoint = 0;

    /// False when the font has no glyph for codePoint
    bool existing = false;

    /// Pen advance after drawing the glyph
    double xadvance = 0.0;

    /// Ink bounds relative to the pen position, y growing down
    Rectangle bounds;
};

/**
 * @brief Source of glyph metrics and glyph bitmaps
 */
class Font {
public:
    virtual ~Font() = default;

    virtual const std::string& name() const = 0;

    virtual FontMetrics getFontMetrics(double size) = 0;

    virtual GlyphMetrics getGlyphMetrics(double size, int codePoint) = 0;

    /**
     * @brief Rasterize one glyph, coverage multiplied into @p color
     * @return nullptr when the font has no glyph for @p codePoint
     */
    virtual BitmapRef renderGlyph(double size, int codePoint, RGBA color = Colors::WHITE) = 0;
};

} // namespace kestrel
