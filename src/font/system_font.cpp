#include "kestrel/font/system_font.hpp"
#include "kestrel/core/logging.hpp"

#include <fontconfig/fontconfig.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace kestrel {

namespace {

struct FcPatternDeleter {
    void operator()(FcPattern* pattern) const { FcPatternDestroy(pattern); }
};

struct FcObjectSetDeleter {
    void operator()(FcObjectSet* set) const { FcObjectSetDestroy(set); }
};

struct FcFontSetDeleter {
    void operator()(FcFontSet* set) const { FcFontSetDestroy(set); }
};

using FcPatternPtr = std::unique_ptr<FcPattern, FcPatternDeleter>;
using FcObjectSetPtr = std::unique_ptr<FcObjectSet, FcObjectSetDeleter>;
using FcFontSetPtr = std::unique_ptr<FcFontSet, FcFontSetDeleter>;

void ensureFontconfig() {
    if (!FcInit()) {
        throw std::runtime_error("Failed to initialize fontconfig");
    }
}

} // namespace

SystemFont::SystemFont(std::string name)
    : name_(std::move(name)) {
}

bool SystemFont::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return font_ != nullptr;
}

TtfFont& SystemFont::font() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!font_) {
        std::string file = resolveFile(name_);
        font_ = TtfFont::fromFile(file, name_);
        KESTREL_INFO(LogCategory::Font, "System font '" + name_ + "' resolved to " + file);
    }
    return *font_;
}

FontMetrics SystemFont::getFontMetrics(double size) {
    return font().getFontMetrics(size);
}

GlyphMetrics SystemFont::getGlyphMetrics(double size, int codePoint) {
    return font().getGlyphMetrics(size, codePoint);
}

BitmapRef SystemFont::renderGlyph(double size, int codePoint, RGBA color) {
    return font().renderGlyph(size, codePoint, color);
}

std::string SystemFont::resolveFile(const std::string& name) {
    ensureFontconfig();

    FcPatternPtr pattern(FcNameParse(reinterpret_cast<const FcChar8*>(name.c_str())));
    if (!pattern) {
        throw std::runtime_error("Invalid font name: '" + name + "'");
    }
    FcConfigSubstitute(nullptr, pattern.get(), FcMatchPattern);
    FcDefaultSubstitute(pattern.get());

    FcResult result = FcResultNoMatch;
    FcPatternPtr match(FcFontMatch(nullptr, pattern.get(), &result));
    if (!match || result != FcResultMatch) {
        throw std::runtime_error("No system font matches '" + name + "'");
    }

    FcChar8* file = nullptr;
    if (FcPatternGetString(match.get(), FC_FILE, 0, &file) != FcResultMatch || !file) {
        throw std::runtime_error("System font '" + name + "' has no file");
    }
    return std::string(reinterpret_cast<const char*>(file));
}

std::vector<std::string> SystemFont::listFontNames() {
    ensureFontconfig();

    FcPatternPtr pattern(FcPatternCreate());
    FcObjectSetPtr objects(FcObjectSetBuild(FC_FAMILY, static_cast<char*>(nullptr)));
    if (!pattern || !objects) {
        throw std::runtime_error("fontconfig: out of memory");
    }

    FcFontSetPtr fonts(FcFontList(nullptr, pattern.get(), objects.get()));
    std::set<std::string> names;
    if (fonts) {
        for (int i = 0; i < fonts->nfont; i++) {
            FcChar8* family = nullptr;
            for (int n = 0; FcPatternGetString(fonts->fonts[i], FC_FAMILY, n, &family) == FcResultMatch; n++) {
                names.insert(reinterpret_cast<const char*>(family));
            }
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

} // namespace kestrel
