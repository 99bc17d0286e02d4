#pragma once

#include "kestrel/core/finally.hpp"
#include "kestrel/core/types.hpp"
#include "kestrel/font/font.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kestrel {

class DefaultFontRegistry;

/**
 * @brief Resolves font names to fonts
 */
class FontRegistry {
public:
    virtual ~FontRegistry() = default;

    /// Font for @p name; std::nullopt asks for the default font
    virtual FontRef get(const std::optional<std::string>& name) = 0;

    static std::shared_ptr<DefaultFontRegistry> create();
};

/**
 * @brief Name -> font map with a SystemFont fallback
 *
 * Names are compared after normalizeName(). Unknown names resolve to a
 * SystemFont of that name, created once and then reused.
 *
 * Usage:
 * @code
 * auto registry = FontRegistry::create();
 * registry->registerFont(TtfFont::fromFile("ui.ttf"), "UI");
 * FontRef ui = registry->get(std::string("ui"));
 *
 * registry->registerTemporarily(otherFont, "ui", [&] {
 *     // "ui" resolves to otherFont here
 * });
 * @endcode
 */
class DefaultFontRegistry : public FontRegistry {
public:
    DefaultFontRegistry() = default;

    DefaultFontRegistry(const DefaultFontRegistry&) = delete;
    DefaultFontRegistry& operator=(const DefaultFontRegistry&) = delete;

    /// Lowercase and trim; std::nullopt stays std::nullopt
    static std::optional<std::string> normalizeName(const std::optional<std::string>& name);

    /// Register @p font under @p name (default: font->name()); returns @p font
    FontRef registerFont(FontRef font, const std::optional<std::string>& name = std::nullopt);

    /// Remove the font registered under @p name; returns it, or nullptr
    FontRef unregisterFont(const std::string& name);

    /// Run @p block with @p font registered under @p name, unregistering it afterwards
    template<typename F>
    auto registerTemporarily(FontRef font, const std::optional<std::string>& name, F&& block) {
        std::string key = name ? *name : font->name();
        registerFont(std::move(font), key);
        return tryFinally([&]() { return block(); }, [&] { unregisterFont(key); });
    }

    FontRef get(const std::optional<std::string>& name) override;

    bool isRegistered(const std::string& name) const;
    size_t registeredCount() const;

    /// Fallback system fonts cached by normalized name
    size_t systemFontCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, FontRef> registeredFonts_;
    std::map<std::string, FontRef> systemFonts_;
};

/**
 * @brief Registry of the calling thread
 *
 * Created on first use with the default system font registered as
 * "sans-serif".
 */
DefaultFontRegistry& systemFontRegistry();

/// Register @p font in the calling thread's systemFontRegistry()
FontRef registerFont(FontRef font, const std::optional<std::string>& name = std::nullopt);

template<typename F>
auto registerTemporarily(FontRef font, const std::optional<std::string>& name, F&& block) {
    return systemFontRegistry().registerTemporarily(std::move(font), name, std::forward<F>(block));
}

} // namespace kestrel
