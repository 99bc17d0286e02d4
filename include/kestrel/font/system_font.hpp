#pragma once

#include "kestrel/font/ttf_font.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kestrel {

/**
 * @brief Installed font looked up by name through fontconfig
 *
 * Nothing is resolved or loaded until the first metrics or glyph request,
 * so creating one is cheap and name() never touches the disk.
 */
class SystemFont : public Font {
public:
    explicit SystemFont(std::string name);

    const std::string& name() const override { return name_; }

    FontMetrics getFontMetrics(double size) override;
    GlyphMetrics getGlyphMetrics(double size, int codePoint) override;
    BitmapRef renderGlyph(double size, int codePoint, RGBA color = Colors::WHITE) override;

    bool isLoaded() const;

    /// File fontconfig picks for @p name; throws std::runtime_error if none
    static std::string resolveFile(const std::string& name);

    /// Sorted family names of every installed font
    static std::vector<std::string> listFontNames();

private:
    /// @throws std::runtime_error if the name cannot be resolved or loaded
    TtfFont& font();

    std::string name_;
    mutable std::mutex mutex_;
    std::shared_ptr<TtfFont> font_;
};

} // namespace kestrel
