#include "kestrel/math/matrix.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace kestrel {

void setToOrtho(Matrix3D& out, const Rectangle& bounds, float zNear, float zFar) {
    out = glm::ortho(
        static_cast<float>(bounds.left()),
        static_cast<float>(bounds.right()),
        static_cast<float>(bounds.bottom()),
        static_cast<float>(bounds.top()),
        zNear, zFar);
}

Matrix& Matrix::setTo(double a_, double b_, double c_, double d_, double tx_, double ty_) {
    a = a_;
    b = b_;
    c = c_;
    d = d_;
    tx = tx_;
    ty = ty_;
    return *this;
}

Matrix& Matrix::multiply(const Matrix& l, const Matrix& r) {
    // l and r may alias this
    return setTo(
        l.a * r.a + l.b * r.c,
        l.a * r.b + l.b * r.d,
        l.c * r.a + l.d * r.c,
        l.c * r.b + l.d * r.d,
        l.tx * r.a + l.ty * r.c + r.tx,
        l.tx * r.b + l.ty * r.d + r.ty);
}

Matrix& Matrix::premultiply(const Matrix& m) {
    return multiply(m, *this);
}

Matrix& Matrix::translate(double dx, double dy) {
    tx += dx;
    ty += dy;
    return *this;
}

Matrix& Matrix::scale(double sx, double sy) {
    return setTo(a * sx, b * sy, c * sx, d * sy, tx * sx, ty * sy);
}

Matrix& Matrix::rotate(double radians) {
    double cs = std::cos(radians);
    double sn = std::sin(radians);
    return multiply(*this, Matrix(cs, sn, -sn, cs, 0.0, 0.0));
}

Matrix& Matrix::invert() {
    double det = a * d - b * c;
    if (det == 0.0 || !std::isfinite(det)) {
        throw std::runtime_error("Matrix is not invertible: " + toString());
    }
    double inv = 1.0 / det;
    return setTo(
        d * inv,
        -b * inv,
        -c * inv,
        a * inv,
        (c * ty - d * tx) * inv,
        (b * tx - a * ty) * inv);
}

Matrix Matrix::inverted() const {
    Matrix out = *this;
    out.invert();
    return out;
}

Matrix& Matrix::setTransform(double x, double y, double scaleX, double scaleY,
                             double rotation, double skewX, double skewY) {
    if (skewX == 0.0 && skewY == 0.0) {
        if (rotation == 0.0) {
            return setTo(scaleX, 0.0, 0.0, scaleY, x, y);
        }
        double cs = std::cos(rotation);
        double sn = std::sin(rotation);
        return setTo(cs * scaleX, sn * scaleX, -sn * scaleY, cs * scaleY, x, y);
    }
    return setTo(
        std::cos(rotation + skewY) * scaleX,
        std::sin(rotation + skewY) * scaleX,
        -std::sin(rotation - skewX) * scaleY,
        std::cos(rotation - skewX) * scaleY,
        x, y);
}

Matrix3D& Matrix::toMatrix3D(Matrix3D& out) const {
    // glm is column-major: out[column][row]
    out = Matrix3D(1.0f);
    out[0][0] = static_cast<float>(a);
    out[0][1] = static_cast<float>(b);
    out[1][0] = static_cast<float>(c);
    out[1][1] = static_cast<float>(d);
    out[3][0] = static_cast<float>(tx);
    out[3][1] = static_cast<float>(ty);
    return out;
}

Matrix3D Matrix::toMatrix3D() const {
    Matrix3D out(1.0f);
    toMatrix3D(out);
    return out;
}

std::string Matrix::toString() const {
    std::ostringstream ss;
    ss << "Matrix(a=" << a << ", b=" << b << ", c=" << c << ", d=" << d
       << ", tx=" << tx << ", ty=" << ty << ")";
    return ss.str();
}

} // namespace kestrel
