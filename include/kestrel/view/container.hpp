#pragma once

#include "kestrel/view/view.hpp"

#include <stdexcept>
#include <vector>

namespace kestrel {

/**
 * @brief View that owns and renders an ordered list of children
 */
class Container : public View {
public:
    Container() = default;
    ~Container() override;

    const char* typeName() const override { return "Container"; }

    /// Take ownership of @p child and append it; returns the child
    View& addChild(ViewPtr child);

    template<typename T>
    T& addChild(std::unique_ptr<T> child) {
        T& ref = *child;
        addChild(ViewPtr(std::move(child)));
        return ref;
    }

    /// Create a child in place: container.add<SolidRect>(100, 100, Colors::RED)
    template<typename T, typename... Args>
    T& add(Args&&... args) {
        return addChild(std::make_unique<T>(std::forward<Args>(args)...));
    }

    /// Remove @p child and return ownership, or nullptr if it is not a child
    ViewPtr removeChild(View* child);

    void removeChildren();

    size_t numChildren() const { return children_.size(); }

    /// @throws std::out_of_range for a bad index
    View& getChildAt(size_t index) const;

    template<typename F>
    void forEachChildren(F&& block) const {
        for (const auto& child : children_) {
            block(*child);
        }
    }

    void update(double dtSeconds) override;

protected:
    void renderInternal(RenderContext& ctx) override;

private:
    std::vector<ViewPtr> children_;
};

/**
 * @brief Container with an explicit size
 */
class FixedSizeContainer : public Container {
public:
    FixedSizeContainer(double width = 100.0, double height = 100.0, bool clip = false);

    const char* typeName() const override { return "FixedSizeContainer"; }

    double width() const override { return width_; }
    double height() const override { return height_; }
    void setWidth(double width) override { width_ = width; }
    void setHeight(double height) override { height_ = height; }

    bool clip() const { return clip_; }
    void setClip(bool clip) { clip_ = clip; }

protected:
    void renderInternal(RenderContext& ctx) override;

private:
    double width_;
    double height_;
    bool clip_;
};

} // namespace kestrel
