#include "kestrel/view/view.hpp"
#include "kestrel/view/container.hpp"

#include <cmath>

namespace kestrel {

namespace {
constexpr double PI = 3.14159265358979323846;
} // namespace

View::View() = default;

View::~View() = default;

double View::rotationDegrees() const {
    return rotation_ * 180.0 / PI;
}

void View::setRotationDegrees(double degrees) {
    rotation_ = degrees * PI / 180.0;
}

ViewPtr View::removeFromParent() {
    if (!parent_) {
        return nullptr;
    }
    return parent_->removeChild(this);
}

Matrix View::localMatrix() const {
    Matrix m;
    m.setTransform(x_, y_, scaleX_, scaleY_, rotation_, skewX_, skewY_);
    return m;
}

Matrix View::globalMatrix() const {
    Matrix m = localMatrix();
    if (parent_) {
        m.multiply(m, parent_->globalMatrix());
    }
    return m;
}

RGBA View::renderColorMul() const {
    RGBA own = colorMul_.withAlphaFactor(alpha_);
    if (parent_) {
        return own * parent_->renderColorMul();
    }
    return own;
}

void View::update(double dtSeconds) {
    applyLengthBindings();
    if (updaters_.listenerCount() > 0) {
        updaters_(dtSeconds * speed_);
    }
}

void View::render(RenderContext& ctx) {
    if (!visible_ || alpha_ <= 0.0) {
        return;
    }
    renderInternal(ctx);
}

void View::applyLengthBindings() {
    if (!lengths_) {
        return;
    }
    double parentWidth = parent_ ? parent_->width() : 0.0;
    double parentHeight = parent_ ? parent_->height() : 0.0;

    if (lengths_->x) {
        x_ = lengths_->x->resolve(parentWidth);
    }
    if (lengths_->y) {
        y_ = lengths_->y->resolve(parentHeight);
    }
    if (lengths_->width) {
        setWidth(lengths_->width->resolve(parentWidth));
    }
    if (lengths_->height) {
        setHeight(lengths_->height->resolve(parentHeight));
    }
}

} // namespace kestrel
