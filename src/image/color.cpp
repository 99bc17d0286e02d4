#include "kestrel/image/color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace kestrel {

namespace {

uint8_t clampByte(double v) {
    return static_cast<uint8_t>(std::clamp(std::round(v), 0.0, 255.0));
}

int hexDigit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

std::optional<RGBA> parseHex(std::string_view hex) {
    std::string digits;
    for (char ch : hex) {
        if (hexDigit(ch) < 0) {
            return std::nullopt;
        }
        digits += ch;
    }

    // Expand short forms (#rgb, #rgba)
    if (digits.size() == 3 || digits.size() == 4) {
        std::string expanded;
        for (char ch : digits) {
            expanded += ch;
            expanded += ch;
        }
        digits = expanded;
    }
    if (digits.size() == 6) {
        digits += "ff";
    }
    if (digits.size() != 8) {
        return std::nullopt;
    }

    auto byteAt = [&](size_t i) {
        return static_cast<uint8_t>(hexDigit(digits[i]) * 16 + hexDigit(digits[i + 1]));
    };
    return RGBA(byteAt(0), byteAt(2), byteAt(4), byteAt(6));
}

const std::unordered_map<std::string, RGBA>& namedColors() {
    static const std::unordered_map<std::string, RGBA> colors = {
        {"transparent", Colors::TRANSPARENT_BLACK},
        {"black", RGBA(0, 0, 0)},
        {"white", RGBA(255, 255, 255)},
        {"red", RGBA(255, 0, 0)},
        {"green", RGBA(0, 128, 0)},
        {"lime", RGBA(0, 255, 0)},
        {"blue", RGBA(0, 0, 255)},
        {"yellow", RGBA(255, 255, 0)},
        {"cyan", RGBA(0, 255, 255)},
        {"aqua", RGBA(0, 255, 255)},
        {"magenta", RGBA(255, 0, 255)},
        {"fuchsia", RGBA(255, 0, 255)},
        {"gray", RGBA(128, 128, 128)},
        {"grey", RGBA(128, 128, 128)},
        {"darkgray", RGBA(169, 169, 169)},
        {"darkgrey", RGBA(169, 169, 169)},
        {"lightgray", RGBA(211, 211, 211)},
        {"lightgrey", RGBA(211, 211, 211)},
        {"silver", RGBA(192, 192, 192)},
        {"maroon", RGBA(128, 0, 0)},
        {"olive", RGBA(128, 128, 0)},
        {"navy", RGBA(0, 0, 128)},
        {"purple", RGBA(128, 0, 128)},
        {"teal", RGBA(0, 128, 128)},
        {"orange", RGBA(255, 165, 0)},
        {"pink", RGBA(255, 192, 203)},
        {"brown", RGBA(165, 42, 42)},
        {"gold", RGBA(255, 215, 0)},
        {"indigo", RGBA(75, 0, 130)},
        {"violet", RGBA(238, 130, 238)},
        {"coral", RGBA(255, 127, 80)},
        {"salmon", RGBA(250, 128, 114)},
        {"khaki", RGBA(240, 230, 140)},
        {"crimson", RGBA(220, 20, 60)},
        {"tomato", RGBA(255, 99, 71)},
        {"turquoise", RGBA(64, 224, 208)},
        {"skyblue", RGBA(135, 206, 235)},
        {"steelblue", RGBA(70, 130, 180)},
        {"darkblue", RGBA(0, 0, 139)},
        {"darkgreen", RGBA(0, 100, 0)},
        {"darkred", RGBA(139, 0, 0)},
        {"lightblue", RGBA(173, 216, 230)},
        {"lightgreen", RGBA(144, 238, 144)},
        {"beige", RGBA(245, 245, 220)},
        {"ivory", RGBA(255, 255, 240)},
        {"lavender", RGBA(230, 230, 250)},
        {"chocolate", RGBA(210, 105, 30)},
        {"tan", RGBA(210, 180, 140)},
        {"orchid", RGBA(218, 112, 214)},
        {"plum", RGBA(221, 160, 221)},
        {"sienna", RGBA(160, 82, 45)},
        {"snow", RGBA(255, 250, 250)},
        {"wheat", RGBA(245, 222, 179)},
        {"slategray", RGBA(112, 128, 144)},
        {"dimgray", RGBA(105, 105, 105)},
        {"cornflowerblue", RGBA(100, 149, 237)},
        {"hotpink", RGBA(255, 105, 180)},
        {"firebrick", RGBA(178, 34, 34)},
        {"forestgreen", RGBA(34, 139, 34)},
        {"seagreen", RGBA(46, 139, 87)},
        {"royalblue", RGBA(65, 105, 225)},
        {"midnightblue", RGBA(25, 25, 112)},
        {"darkorange", RGBA(255, 140, 0)},
    };
    return colors;
}

} // namespace

RGBA RGBA::withAlphaFactor(double factor) const {
    return withA(clampByte(a() * std::clamp(factor, 0.0, 1.0)));
}

RGBA RGBA::premultiplied() const {
    double alpha = af();
    return RGBA(clampByte(r() * alpha), clampByte(g() * alpha), clampByte(b() * alpha), a());
}

std::string RGBA::hexString() const {
    static const char* digits = "0123456789abcdef";
    std::string out = "#";
    for (uint8_t channel : {r(), g(), b(), a()}) {
        out += digits[channel >> 4];
        out += digits[channel & 0xF];
    }
    return out;
}

RGBA operator*(const RGBA& l, const RGBA& r) {
    auto mul = [](uint8_t x, uint8_t y) {
        return static_cast<uint8_t>((static_cast<uint32_t>(x) * y + 127) / 255);
    };
    return RGBA(mul(l.r(), r.r()), mul(l.g(), r.g()), mul(l.b(), r.b()), mul(l.a(), r.a()));
}

namespace Colors {

std::optional<RGBA> getOrNull(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) str.remove_prefix(1);
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) str.remove_suffix(1);

    if (str.empty()) {
        return std::nullopt;
    }
    if (str.front() == '#') {
        return parseHex(str.substr(1));
    }

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    auto& names = namedColors();
    auto it = names.find(lower);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

RGBA get(std::string_view str) {
    auto color = getOrNull(str);
    if (!color) {
        throw std::runtime_error("Unknown color: '" + std::string(str) + "'");
    }
    return *color;
}

} // namespace Colors

} // namespace kestrel
