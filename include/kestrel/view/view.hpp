#pragma once

#include "kestrel/core/types.hpp"
#include "kestrel/core/signal.hpp"
#include "kestrel/image/color.hpp"
#include "kestrel/math/matrix.hpp"
#include "kestrel/view/length.hpp"

#include <memory>
#include <optional>
#include <string>

namespace kestrel {

/**
 * @brief Node of the display tree
 *
 * A view has a 2D transform (position, scale, rotation, skew), a multiply
 * color and alpha, and may have a parent Container that owns it.
 *
 * update() applies length bindings, then the registered updaters with the
 * delta time scaled by speed(). render() draws nothing for invisible or
 * fully transparent views.
 */
class View {
public:
    View();
    virtual ~View();

    View(const View&) = delete;
    View& operator=(const View&) = delete;

    /// Short type name used in logs and error messages
    virtual const char* typeName() const { return "View"; }

    // =========================================================================
    // Properties
    // =========================================================================

    const std::optional<std::string>& name() const { return name_; }
    void setName(std::optional<std::string> name) { name_ = std::move(name); }

    RGBA colorMul() const { return colorMul_; }
    void setColorMul(RGBA color) { colorMul_ = color; }

    double alpha() const { return alpha_; }
    void setAlpha(double alpha) { alpha_ = alpha; }

    double speed() const { return speed_; }
    void setSpeed(double speed) { speed_ = speed; }

    double ratio() const { return ratio_; }
    void setRatio(double ratio) { ratio_ = ratio; }

    double x() const { return x_; }
    void setX(double x) { x_ = x; }

    double y() const { return y_; }
    void setY(double y) { y_ = y; }

    View& xy(double x, double y) {
        x_ = x;
        y_ = y;
        return *this;
    }

    /// Rotation in radians
    double rotation() const { return rotation_; }
    void setRotation(double radians) { rotation_ = radians; }

    double rotationDegrees() const;
    void setRotationDegrees(double degrees);

    double scaleX() const { return scaleX_; }
    void setScaleX(double scale) { scaleX_ = scale; }

    double scaleY() const { return scaleY_; }
    void setScaleY(double scale) { scaleY_ = scale; }

    double skewX() const { return skewX_; }
    void setSkewX(double skew) { skewX_ = skew; }

    double skewY() const { return skewY_; }
    void setSkewY(double skew) { skewY_ = skew; }

    bool visible() const { return visible_; }
    void setVisible(bool visible) { visible_ = visible; }

    /// Unscaled size; views without an intrinsic size report 0
    virtual double width() const { return 0.0; }
    virtual double height() const { return 0.0; }

    /// Views without an intrinsic size ignore these
    virtual void setWidth(double width) { (void)width; }
    virtual void setHeight(double height) { (void)height; }

    View& size(double width, double height) {
        setWidth(width);
        setHeight(height);
        return *this;
    }

    // =========================================================================
    // Hierarchy and transforms
    // =========================================================================

    Container* parent() const { return parent_; }

    /// Detach from the parent; returns ownership, or nullptr without a parent
    ViewPtr removeFromParent();

    Matrix localMatrix() const;

    /// Local matrix followed by every ancestor's
    Matrix globalMatrix() const;

    /// colorMul with alpha applied, multiplied by every ancestor's
    RGBA renderColorMul() const;

    // =========================================================================
    // Frame
    // =========================================================================

    /// Apply bindings and run updaters; @p dtSeconds is scaled by speed()
    virtual void update(double dtSeconds);

    void render(RenderContext& ctx);

    /// Run @p updater every update with the scaled delta time
    size_t addUpdater(std::function<void(double)> updater) { return updaters_.add(std::move(updater)); }
    bool removeUpdater(size_t id) { return updaters_.remove(id); }

    // =========================================================================
    // Length bindings
    // =========================================================================

    /**
     * @brief Edit the length bindings of this view
     *
     * Bindings take effect on the next update() and then keep overriding
     * manual changes. Clearing every binding removes them, after which
     * manual changes persist.
     *
     * @code
     * rect.lengths([](LengthBindings& l) {
     *     l.x = Length::percent(50);
     *     l.width = Length::px(20);
     * });
     * @endcode
     */
    template<typename F>
    void lengths(F&& block) {
        if (!lengths_) {
            lengths_ = std::make_unique<LengthBindings>();
        }
        block(*lengths_);
        if (lengths_->isEmpty()) {
            lengths_.reset();
        }
    }

    bool hasLengthBindings() const { return lengths_ != nullptr; }
    const LengthBindings* lengthBindings() const { return lengths_.get(); }

protected:
    virtual void renderInternal(RenderContext& ctx) { (void)ctx; }

private:
    friend class Container;

    void applyLengthBindings();

    Container* parent_ = nullptr;

    std::optional<std::string> name_;
    RGBA colorMul_ = Colors::WHITE;
    double alpha_ = 1.0;
    double speed_ = 1.0;
    double ratio_ = 0.0;
    double x_ = 0.0;
    double y_ = 0.0;
    double rotation_ = 0.0;
    double scaleX_ = 1.0;
    double scaleY_ = 1.0;
    double skewX_ = 0.0;
    double skewY_ = 0.0;
    bool visible_ = true;

    Signal<double> updaters_;
    std::unique_ptr<LengthBindings> lengths_;
};

} // namespace kestrel
