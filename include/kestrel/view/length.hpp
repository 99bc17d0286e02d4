#pragma once

#include <optional>
#include <string>

namespace kestrel {

/**
 * @brief A length in pixels or as a percentage of the parent's size
 */
class Length {
public:
    enum class Unit { Pixels, Percent };

    static Length px(double value) { return Length(Unit::Pixels, value); }
    static Length percent(double value) { return Length(Unit::Percent, value); }

    Unit unit() const { return unit_; }
    double value() const { return value_; }

    /// Resolve against the size of the parent along the same axis
    double resolve(double parentSize) const {
        return unit_ == Unit::Percent ? parentSize * value_ / 100.0 : value_;
    }

    std::string toString() const;

    bool operator==(const Length& o) const { return unit_ == o.unit_ && value_ == o.value_; }
    bool operator!=(const Length& o) const { return !(*this == o); }

private:
    Length(Unit unit, double value) : unit_(unit), value_(value) {}

    Unit unit_;
    double value_;
};

/**
 * @brief Optional length bindings of a view's position and size
 *
 * x and width resolve against the parent's width, y and height against
 * its height.
 */
struct LengthBindings {
    std::optional<Length> x;
    std::optional<Length> y;
    std::optional<Length> width;
    std::optional<Length> height;

    bool isEmpty() const { return !x && !y && !width && !height; }
};

} // namespace kestrel
