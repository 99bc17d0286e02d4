#pragma once

#include "kestrel/font/font.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// FreeType handles, kept out of the public headers
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;

namespace kestrel {

/**
 * @brief TrueType/OpenType font loaded with FreeType
 *
 * Each font owns its own FT_Library; calls are serialized by an internal
 * mutex so a font can be shared between threads.
 *
 * Usage:
 * @code
 * auto font = TtfFont::fromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
 * FontMetrics m = font->getFontMetrics(16.0);
 * BitmapRef glyph = font->renderGlyph(16.0, 'A', Colors::BLACK);
 * @endcode
 */
class TtfFont : public Font {
public:
    /// @throws std::runtime_error if FreeType cannot open the file
    static std::shared_ptr<TtfFont> fromFile(const std::string& path,
                                             std::optional<std::string> name = std::nullopt);

    /// @throws std::runtime_error if FreeType cannot parse @p bytes
    static std::shared_ptr<TtfFont> fromBytes(std::vector<uint8_t> bytes,
                                              std::optional<std::string> name = std::nullopt);

    ~TtfFont() override;

    TtfFont(const TtfFont&) = delete;
    TtfFont& operator=(const TtfFont&) = delete;

    /// The given name, or the face's family name
    const std::string& name() const override { return name_; }

    const std::string& familyName() const { return familyName_; }
    const std::string& styleName() const { return styleName_; }
    int numGlyphs() const;

    FontMetrics getFontMetrics(double size) override;
    GlyphMetrics getGlyphMetrics(double size, int codePoint) override;
    BitmapRef renderGlyph(double size, int codePoint, RGBA color = Colors::WHITE) override;

private:
    TtfFont(std::vector<uint8_t> bytes, const std::string& pathForErrors, std::optional<std::string> name);

    void setSize(double size);

    mutable std::mutex mutex_;
    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;

    // FreeType reads memory faces in place
    std::vector<uint8_t> bytes_;

    std::string name_;
    std::string familyName_;
    std::string styleName_;
    std::string source_;
};

} // namespace kestrel
