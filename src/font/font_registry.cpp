#include "kestrel/font/font_registry.hpp"
#include "kestrel/font/system_font.hpp"
#include "kestrel/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace kestrel {

std::shared_ptr<DefaultFontRegistry> FontRegistry::create() {
    return std::make_shared<DefaultFontRegistry>();
}

std::optional<std::string> DefaultFontRegistry::normalizeName(const std::optional<std::string>& name) {
    if (!name) {
        return std::nullopt;
    }
    std::string out = *name;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), notSpace));
    out.erase(std::find_if(out.rbegin(), out.rend(), notSpace).base(), out.end());
    return out;
}

FontRef DefaultFontRegistry::registerFont(FontRef font, const std::optional<std::string>& name) {
    if (!font) {
        throw std::invalid_argument("DefaultFontRegistry::registerFont: font is null");
    }
    std::string key = *normalizeName(name ? name : std::optional<std::string>(font->name()));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registeredFonts_[key] = font;
        systemFonts_.erase(key);
    }
    KESTREL_DEBUG(LogCategory::Font, "Registered font '" + font->name() + "' as '" + key + "'");
    return font;
}

FontRef DefaultFontRegistry::unregisterFont(const std::string& name) {
    std::string key = *normalizeName(name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registeredFonts_.find(key);
    if (it == registeredFonts_.end()) {
        return nullptr;
    }
    FontRef font = std::move(it->second);
    registeredFonts_.erase(it);
    return font;
}

FontRef DefaultFontRegistry::get(const std::optional<std::string>& name) {
    std::optional<std::string> key = normalizeName(name);

    std::lock_guard<std::mutex> lock(mutex_);
    if (key) {
        auto it = registeredFonts_.find(*key);
        if (it != registeredFonts_.end()) {
            return it->second;
        }
    }

    std::string cacheKey = key.value_or("default");
    auto cached = systemFonts_.find(cacheKey);
    if (cached != systemFonts_.end()) {
        return cached->second;
    }
    // Named after the first spelling requested
    FontRef font = std::make_shared<SystemFont>(name ? *name : std::string("default"));
    systemFonts_.emplace(cacheKey, font);
    return font;
}

bool DefaultFontRegistry::isRegistered(const std::string& name) const {
    std::string key = *normalizeName(name);
    std::lock_guard<std::mutex> lock(mutex_);
    return registeredFonts_.count(key) != 0;
}

size_t DefaultFontRegistry::registeredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registeredFonts_.size();
}

size_t DefaultFontRegistry::systemFontCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return systemFonts_.size();
}

// ============================================================================
// Per-thread system registry
// ============================================================================

DefaultFontRegistry& systemFontRegistry() {
    thread_local std::shared_ptr<DefaultFontRegistry> registry;
    if (!registry) {
        registry = FontRegistry::create();
        registry->registerFont(std::make_shared<SystemFont>("sans-serif"), std::string("sans-serif"));
    }
    return *registry;
}

FontRef registerFont(FontRef font, const std::optional<std::string>& name) {
    return systemFontRegistry().registerFont(std::move(font), name);
}

} // namespace kestrel
