#pragma once

#include "kestrel/math/geom.hpp"
#include "kestrel/core/finally.hpp"

#include <glm/glm.hpp>
#include <string>

namespace kestrel {

/// 4x4 matrix used for projection/view uniforms
using Matrix3D = glm::mat4;

/**
 * @brief Build an orthographic projection from a rectangle's edges
 *
 * Maps bounds.left/right to -1/+1 and bounds.bottom/top to -1/+1, so a
 * rectangle from setBounds(0, 0, w, h) gives a Y-down screen projection and
 * setBounds(0, h, w, 0) the flipped one used for render-to-texture.
 */
void setToOrtho(Matrix3D& out, const Rectangle& bounds, float zNear, float zFar);

/**
 * @brief 2D affine transform
 *
 * Maps a point as:
 *   x' = a*x + c*y + tx
 *   y' = b*x + d*y + ty
 */
class Matrix {
public:
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 1.0;
    double tx = 0.0;
    double ty = 0.0;

    Matrix() = default;
    Matrix(double a_, double b_, double c_, double d_, double tx_, double ty_)
        : a(a_), b(b_), c(c_), d(d_), tx(tx_), ty(ty_) {}

    Matrix& setTo(double a_, double b_, double c_, double d_, double tx_, double ty_);
    Matrix& identity() { return setTo(1.0, 0.0, 0.0, 1.0, 0.0, 0.0); }
    Matrix& copyFrom(const Matrix& other) { return *this = other; }

    bool isIdentity() const {
        return a == 1.0 && b == 0.0 && c == 0.0 && d == 1.0 && tx == 0.0 && ty == 0.0;
    }

    /// this = l then r (apply @p l first, then @p r)
    Matrix& multiply(const Matrix& l, const Matrix& r);

    /// this = m then this
    Matrix& premultiply(const Matrix& m);

    Matrix& translate(double dx, double dy);
    Matrix& scale(double sx, double sy);
    Matrix& rotate(double radians);

    /// Invert in place; throws std::runtime_error when not invertible
    Matrix& invert();
    Matrix inverted() const;

    Matrix& setTransform(double x, double y, double scaleX, double scaleY,
                         double rotation, double skewX, double skewY);

    Point transform(const Point& p) const { return Point(transformX(p.x, p.y), transformY(p.x, p.y)); }
    double transformX(double px, double py) const { return a * px + c * py + tx; }
    double transformY(double px, double py) const { return b * px + d * py + ty; }

    /// Write this transform into the XY part of a 4x4 matrix
    Matrix3D& toMatrix3D(Matrix3D& out) const;
    Matrix3D toMatrix3D() const;

    /// Run @p block and restore this matrix afterwards
    template<typename F>
    auto keepMatrix(F&& block) {
        Matrix saved = *this;
        return tryFinally([&]() { return block(); }, [&] { *this = saved; });
    }

    std::string toString() const;

    bool operator==(const Matrix& o) const {
        return a == o.a && b == o.b && c == o.c && d == o.d && tx == o.tx && ty == o.ty;
    }
    bool operator!=(const Matrix& o) const { return !(*this == o); }
};

} // namespace kestrel
