#include "kestrel/view/container.hpp"
#include "kestrel/render/render_context.hpp"
#include "kestrel/core/finally.hpp"

#include <algorithm>
#include <cmath>

namespace kestrel {

// ============================================================================
// Container
// ============================================================================

Container::~Container() {
    for (auto& child : children_) {
        child->parent_ = nullptr;
    }
}

View& Container::addChild(ViewPtr child) {
    if (!child) {
        throw std::invalid_argument("Container::addChild: child cannot be null");
    }
    if (child.get() == this) {
        throw std::invalid_argument("Container::addChild: a view cannot contain itself");
    }
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *children_.back();
}

ViewPtr Container::removeChild(View* child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [child](const ViewPtr& c) { return c.get() == child; });
    if (it == children_.end()) {
        return nullptr;
    }
    ViewPtr owned = std::move(*it);
    children_.erase(it);
    owned->parent_ = nullptr;
    return owned;
}

void Container::removeChildren() {
    for (auto& child : children_) {
        child->parent_ = nullptr;
    }
    children_.clear();
}

View& Container::getChildAt(size_t index) const {
    if (index >= children_.size()) {
        throw std::out_of_range("Container::getChildAt: index " + std::to_string(index) +
            " out of range (" + std::to_string(children_.size()) + " children)");
    }
    return *children_[index];
}

void Container::update(double dtSeconds) {
    View::update(dtSeconds);
    double childDt = dtSeconds * speed();

    // Children may add or remove siblings from their updaters
    std::vector<View*> snapshot;
    snapshot.reserve(children_.size());
    for (const auto& child : children_) {
        snapshot.push_back(child.get());
    }
    for (View* child : snapshot) {
        bool stillChild = std::any_of(children_.begin(), children_.end(),
            [child](const ViewPtr& c) { return c.get() == child; });
        if (stillChild) {
            child->update(childDt);
        }
    }
}

void Container::renderInternal(RenderContext& ctx) {
    for (const auto& child : children_) {
        child->render(ctx);
    }
}

// ============================================================================
// FixedSizeContainer
// ============================================================================

FixedSizeContainer::FixedSizeContainer(double width, double height, bool clip)
    : width_(width)
    , height_(height)
    , clip_(clip) {
}

void FixedSizeContainer::renderInternal(RenderContext& ctx) {
    if (!clip_) {
        Container::renderInternal(ctx);
        return;
    }

    Matrix m = globalMatrix();
    double xs[] = {m.transformX(0, 0), m.transformX(width_, 0), m.transformX(width_, height_), m.transformX(0, height_)};
    double ys[] = {m.transformY(0, 0), m.transformY(width_, 0), m.transformY(width_, height_), m.transformY(0, height_)};
    int left = static_cast<int>(std::floor(*std::min_element(std::begin(xs), std::end(xs))));
    int top = static_cast<int>(std::floor(*std::min_element(std::begin(ys), std::end(ys))));
    int right = static_cast<int>(std::ceil(*std::max_element(std::begin(xs), std::end(xs))));
    int bottom = static_cast<int>(std::ceil(*std::max_element(std::begin(ys), std::end(ys))));

    ctx.useBatcher([&](BatchBuilder2D& batch) {
        std::optional<AGScissor> oldScissor = batch.scissor();
        batch.setScissor(AGScissor{left, top, right - left, bottom - top});
        tryFinally([&] { Container::renderInternal(ctx); }, [&] { batch.setScissor(oldScissor); });
    });
}

} // namespace kestrel
