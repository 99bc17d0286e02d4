#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kestrel {

/**
 * @brief 32-bit RGBA color, packed as 0xAABBGGRR (R in the low byte)
 */
class RGBA {
public:
    constexpr RGBA() = default;
    constexpr RGBA(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : value_(static_cast<uint32_t>(r) |
                 (static_cast<uint32_t>(g) << 8) |
                 (static_cast<uint32_t>(b) << 16) |
                 (static_cast<uint32_t>(a) << 24)) {}

    static constexpr RGBA fromPacked(uint32_t value) {
        RGBA c;
        c.value_ = value;
        return c;
    }

    constexpr uint8_t r() const { return static_cast<uint8_t>(value_ & 0xFF); }
    constexpr uint8_t g() const { return static_cast<uint8_t>((value_ >> 8) & 0xFF); }
    constexpr uint8_t b() const { return static_cast<uint8_t>((value_ >> 16) & 0xFF); }
    constexpr uint8_t a() const { return static_cast<uint8_t>((value_ >> 24) & 0xFF); }

    constexpr uint32_t packed() const { return value_; }

    constexpr double rf() const { return r() / 255.0; }
    constexpr double gf() const { return g() / 255.0; }
    constexpr double bf() const { return b() / 255.0; }
    constexpr double af() const { return a() / 255.0; }

    constexpr RGBA withA(uint8_t alpha) const { return RGBA(r(), g(), b(), alpha); }

    /// Color with alpha multiplied by @p factor (clamped to [0, 1])
    RGBA withAlphaFactor(double factor) const;

    /// Color channels multiplied by alpha
    RGBA premultiplied() const;

    /// "#rrggbbaa" in lowercase
    std::string hexString() const;

    constexpr bool operator==(const RGBA& o) const { return value_ == o.value_; }
    constexpr bool operator!=(const RGBA& o) const { return value_ != o.value_; }

private:
    uint32_t value_ = 0;
};

/// Channel-wise multiplication (255 * 255 -> 255)
RGBA operator*(const RGBA& l, const RGBA& r);

namespace Colors {

constexpr RGBA WHITE{255, 255, 255, 255};
constexpr RGBA BLACK{0, 0, 0, 255};
constexpr RGBA RED{255, 0, 0, 255};
constexpr RGBA GREEN{0, 255, 0, 255};
constexpr RGBA BLUE{0, 0, 255, 255};
constexpr RGBA YELLOW{255, 255, 0, 255};
constexpr RGBA TRANSPARENT_BLACK{0, 0, 0, 0};
constexpr RGBA TRANSPARENT_WHITE{255, 255, 255, 0};

/**
 * @brief Parse a color
 *
 * Accepts "#rgb", "#rgba", "#rrggbb", "#rrggbbaa" and CSS color names,
 * case-insensitive. Throws std::runtime_error for anything else.
 */
RGBA get(std::string_view str);

/// Like get(), but returns std::nullopt instead of throwing
std::optional<RGBA> getOrNull(std::string_view str);

} // namespace Colors

} // namespace kestrel
