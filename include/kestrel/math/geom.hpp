#pragma once

#include <algorithm>

namespace kestrel {

struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x_, double y_) : x(x_), y(y_) {}

    Point& setTo(double x_, double y_) {
        x = x_;
        y = y_;
        return *this;
    }

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

/**
 * @brief Axis-aligned rectangle
 *
 * Width/height may be negative when built with setBounds() from inverted
 * edges; orthographic projections rely on that to flip the Y axis.
 */
struct Rectangle {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    Rectangle() = default;
    Rectangle(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}

    Rectangle& setTo(double x_, double y_, double w, double h) {
        x = x_;
        y = y_;
        width = w;
        height = h;
        return *this;
    }

    Rectangle& setBounds(double left_, double top_, double right_, double bottom_) {
        return setTo(left_, top_, right_ - left_, bottom_ - top_);
    }

    double left() const { return x; }
    double top() const { return y; }
    double right() const { return x + width; }
    double bottom() const { return y + height; }

    bool isEmpty() const { return width == 0.0 || height == 0.0; }

    bool contains(double px, double py) const {
        return px >= std::min(left(), right()) && px < std::max(left(), right()) &&
               py >= std::min(top(), bottom()) && py < std::max(top(), bottom());
    }

    bool operator==(const Rectangle& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rectangle& o) const { return !(*this == o); }
};

/// Integer rectangle used for bitmap regions and scissors
struct RectangleInt {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const RectangleInt& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const RectangleInt& o) const { return !(*this == o); }
};

struct MarginInt {
    int top = 0;
    int right = 0;
    int bottom = 0;
    int left = 0;

    MarginInt& setTo(int top_, int right_, int bottom_, int left_) {
        top = top_;
        right = right_;
        bottom = bottom_;
        left = left_;
        return *this;
    }

    int leftPlusRight() const { return left + right; }
    int topPlusBottom() const { return top + bottom; }
};

} // namespace kestrel
