/**
 * @file test_fonts.cpp
 * @brief Font tests - registry semantics, system fallback and FreeType loading
 *
 * FreeType checks run against DejaVu Sans when it is installed and are
 * reported as skipped otherwise.
 */

#include <kestrel/kestrel.hpp>

#include <cassert>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace kestrel;

namespace {

const char* DEJAVU_SANS = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

bool fileExists(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return file.good();
}

/// Font with fixed metrics and no glyphs
class FakeFont : public Font {
public:
    explicit FakeFont(std::string name) : name_(std::move(name)) {}

    const std::string& name() const override { return name_; }

    FontMetrics getFontMetrics(double size) override {
        FontMetrics metrics;
        metrics.size = size;
        metrics.ascent = size * 0.8;
        metrics.descent = -size * 0.2;
        metrics.lineHeight = size;
        return metrics;
    }

    GlyphMetrics getGlyphMetrics(double size, int codePoint) override {
        GlyphMetrics metrics;
        metrics.size = size;
        metrics.codePoint = codePoint;
        return metrics;
    }

    BitmapRef renderGlyph(double, int, RGBA) override { return nullptr; }

private:
    std::string name_;
};

} // namespace

// ============================================================================
// Registry
// ============================================================================

void test_normalize_name() {
    std::cout << "Testing: Font name normalization... ";

    assert(DefaultFontRegistry::normalizeName(std::string("  Sans Serif ")) ==
           std::optional<std::string>("sans serif"));
    assert(DefaultFontRegistry::normalizeName(std::string("MONO")) == std::optional<std::string>("mono"));
    assert(!DefaultFontRegistry::normalizeName(std::nullopt));

    std::cout << "PASSED\n";
}

void test_register_and_unregister() {
    std::cout << "Testing: Register and unregister fonts... ";

    auto registry = FontRegistry::create();
    auto ui = std::make_shared<FakeFont>("UI Font");

    FontRef returned = registry->registerFont(ui);
    assert(returned == ui);
    assert(registry->isRegistered("ui font"));
    assert(registry->get(std::string("  UI FONT")) == ui);

    auto alias = std::make_shared<FakeFont>("Other");
    registry->registerFont(alias, std::string("Title"));
    assert(registry->get(std::string("title")) == alias);
    assert(registry->registeredCount() == 2);

    // Re-registering a name replaces the font
    registry->registerFont(ui, std::string("TITLE"));
    assert(registry->get(std::string("title")) == ui);
    assert(registry->registeredCount() == 2);

    assert(registry->unregisterFont(" Title ") == ui);
    assert(!registry->isRegistered("title"));
    assert(registry->unregisterFont("title") == nullptr);

    bool thrown = false;
    try {
        registry->registerFont(nullptr);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED\n";
}

void test_register_temporarily() {
    std::cout << "Testing: Temporary registration is undone on exit... ";

    auto registry = FontRegistry::create();
    auto temp = std::make_shared<FakeFont>("Temp");

    int result = registry->registerTemporarily(temp, std::string("Scratch"), [&] {
        assert(registry->get(std::string("scratch")) == temp);
        return 42;
    });
    assert(result == 42);
    assert(!registry->isRegistered("scratch"));

    bool thrown = false;
    try {
        registry->registerTemporarily(temp, std::nullopt, [&] {
            assert(registry->isRegistered("temp"));
            throw std::runtime_error("layout failed");
        });
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(!registry->isRegistered("temp"));
    assert(registry->registeredCount() == 0);

    std::cout << "PASSED\n";
}

void test_system_fallback() {
    std::cout << "Testing: Unknown names fall back to cached system fonts... ";

    auto registry = FontRegistry::create();
    FontRef a = registry->get(std::string("Some Missing Family"));
    assert(a != nullptr);
    assert(a->name() == "Some Missing Family");

    auto* system = dynamic_cast<SystemFont*>(a.get());
    assert(system != nullptr);
    // name() alone never resolves the font
    assert(!system->isLoaded());

    assert(registry->get(std::string("Some Missing Family")) == a);
    assert(registry->registeredCount() == 0);

    FontRef byDefault = registry->get(std::nullopt);
    assert(byDefault->name() == "default");
    assert(registry->get(std::nullopt) == byDefault);
    assert(byDefault != a);

    // Spellings that normalize alike share one fallback
    assert(registry->get(std::string(" SOME missing family ")) == a);
    assert(registry->get(std::string("Arial")) == registry->get(std::string(" arial ")));
    assert(registry->systemFontCount() == 3);

    // A registered font takes precedence over the fallback and replaces its cache entry
    auto fake = std::make_shared<FakeFont>("Some Missing Family");
    registry->registerFont(fake);
    assert(registry->get(std::string("some missing family")) == fake);
    assert(registry->systemFontCount() == 2);
    registry->unregisterFont("some missing family");
    FontRef fresh = registry->get(std::string("Some Missing Family"));
    assert(fresh != a && fresh != fake);

    std::cout << "PASSED\n";
}

void test_system_font_registry() {
    std::cout << "Testing: Per-thread system registry... ";

    DefaultFontRegistry& registry = systemFontRegistry();
    assert(&registry == &systemFontRegistry());
    assert(registry.isRegistered("sans-serif"));
    assert(registry.get(std::string("Sans-Serif"))->name() == "sans-serif");

    auto fake = std::make_shared<FakeFont>("Helper");
    registerFont(fake, std::string("helper"));
    assert(registry.get(std::string("helper")) == fake);
    assert(registry.unregisterFont("helper") == fake);

    registerTemporarily(fake, std::string("tmp"), [&] {
        assert(systemFontRegistry().get(std::string("tmp")) == fake);
    });
    assert(!registry.isRegistered("tmp"));

    // Another thread gets its own registry
    DefaultFontRegistry* otherRegistry = nullptr;
    bool otherHasHelper = true;
    registerFont(fake, std::string("main-only"));
    std::thread worker([&] {
        otherRegistry = &systemFontRegistry();
        otherHasHelper = otherRegistry->isRegistered("main-only");
    });
    worker.join();
    assert(otherRegistry != &registry);
    assert(!otherHasHelper);
    registry.unregisterFont("main-only");

    std::cout << "PASSED\n";
}

// ============================================================================
// FreeType
// ============================================================================

void test_ttf_rejects_garbage() {
    std::cout << "Testing: TtfFont rejects invalid data... ";

    bool thrown = false;
    try {
        TtfFont::fromBytes({0, 1, 2, 3, 4, 5, 6, 7}, std::string("garbage"));
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        TtfFont::fromFile("/nonexistent/font.ttf");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED\n";
}

void test_ttf_metrics() {
    std::cout << "Testing: TtfFont metrics and glyphs... ";

    if (!fileExists(DEJAVU_SANS)) {
        std::cout << "SKIPPED (no DejaVu Sans)\n";
        return;
    }

    auto font = TtfFont::fromFile(DEJAVU_SANS);
    assert(font->name() == "DejaVu Sans");
    assert(font->familyName() == "DejaVu Sans");
    assert(font->numGlyphs() > 100);

    auto named = TtfFont::fromFile(DEJAVU_SANS, std::string("ui"));
    assert(named->name() == "ui");

    FontMetrics metrics = font->getFontMetrics(32.0);
    assert(metrics.size == 32.0);
    assert(metrics.ascent > 0.0);
    assert(metrics.descent < 0.0);
    assert(metrics.lineHeight >= metrics.ascent - metrics.descent);

    GlyphMetrics a = font->getGlyphMetrics(32.0, 'A');
    assert(a.existing);
    assert(a.codePoint == 'A');
    assert(a.xadvance > 0.0);
    assert(a.bounds.width > 0.0 && a.bounds.height > 0.0);
    // Capital letters sit above the baseline
    assert(a.bounds.y < 0.0);

    GlyphMetrics bigger = font->getGlyphMetrics(64.0, 'A');
    assert(bigger.xadvance > a.xadvance);

    // Supplementary private use code point without a glyph
    GlyphMetrics none = font->getGlyphMetrics(32.0, 0x10FFFD);
    assert(!none.existing);
    assert(font->renderGlyph(32.0, 0x10FFFD) == nullptr);

    BitmapRef glyph = font->renderGlyph(64.0, 'H', Colors::RED);
    assert(glyph != nullptr);
    assert(glyph->width() > 0 && glyph->height() > 0);
    bool inked = false;
    for (int y = 0; y < glyph->height() && !inked; y++) {
        for (int x = 0; x < glyph->width(); x++) {
            RGBA pixel = glyph->get(x, y);
            if (pixel.a() == 255) {
                assert(pixel.r() == 255 && pixel.g() == 0 && pixel.b() == 0);
                inked = true;
                break;
            }
        }
    }
    assert(inked);

    bool thrown = false;
    try {
        font->getFontMetrics(0.0);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "PASSED\n";
}

void test_system_font_resolution() {
    std::cout << "Testing: SystemFont resolves through fontconfig... ";

    std::string file;
    try {
        file = SystemFont::resolveFile("sans-serif");
    } catch (const std::runtime_error& e) {
        std::cout << "SKIPPED (" << e.what() << ")\n";
        return;
    }
    assert(!file.empty());
    assert(!SystemFont::listFontNames().empty());

    SystemFont font("sans-serif");
    assert(!font.isLoaded());
    FontMetrics metrics = font.getFontMetrics(16.0);
    assert(font.isLoaded());
    assert(metrics.ascent > 0.0);
    assert(font.name() == "sans-serif");
    assert(font.getGlyphMetrics(16.0, 'x').existing);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "Kestrel - Font Tests\n";
    std::cout << "========================================\n\n";

    try {
        test_normalize_name();
        test_register_and_unregister();
        test_register_temporarily();
        test_system_fallback();
        test_system_font_registry();
        test_ttf_rejects_garbage();
        test_ttf_metrics();
        test_system_font_resolution();

        std::cout << "\n========================================\n";
        std::cout << "All font tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTest FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
