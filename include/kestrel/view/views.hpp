#pragma once

#include "kestrel/ag/ag.hpp"
#include "kestrel/core/signal.hpp"
#include "kestrel/core/vfs.hpp"
#include "kestrel/engine/frame_clock.hpp"
#include "kestrel/image/color.hpp"
#include "kestrel/ktree/ktree.hpp"
#include "kestrel/render/render_context.hpp"
#include "kestrel/view/container.hpp"

#include <optional>

namespace kestrel {

/**
 * @brief Settings of a Views instance
 */
struct ViewsConfig {
    /// Size of the stage in virtual pixels
    double virtualWidth = 640.0;
    double virtualHeight = 480.0;

    RGBA clearColor = Colors::BLACK;
    bool clearEachFrame = true;

    /// Root used to resolve scene resources; an empty MemoryVfs if unset
    std::optional<VfsFile> vfs;

    RenderContextConfig render;
};

/**
 * @brief Owner of a stage and everything needed to update and render it
 *
 * Usage:
 * @code
 * LogAG ag;
 * Views views(ag);
 * views.stage().add<SolidRect>(100, 100, Colors::RED).xy(10, 10);
 *
 * views.frame(1.0 / 60.0);  // update + render
 * @endcode
 */
class Views : public KTreeSerializerHolder {
public:
    explicit Views(AG& ag, ViewsConfig config = {});
    ~Views() override;

    Views(const Views&) = delete;
    Views& operator=(const Views&) = delete;

    AG& ag() const { return ag_; }
    const ViewsConfig& config() const { return config_; }

    FixedSizeContainer& stage() { return stage_; }
    RenderContext& renderContext() { return renderContext_; }
    KTreeSerializer& serializer() override { return serializer_; }
    FrameClock& clock() { return clock_; }

    const VfsFile& currentVfs() const { return currentVfs_; }
    void setCurrentVfs(VfsFile vfs) { currentVfs_ = std::move(vfs); }

    // =========================================================================
    // Invalidation
    // =========================================================================

    /// Report that @p view needs to be redrawn
    void invalidatedView(View* view);

    uint64_t invalidationCount() const { return invalidationCount_; }
    View* lastInvalidatedView() const { return lastInvalidatedView_; }

    /// Fired by invalidatedView()
    Signal<View*>& onInvalidated() { return onInvalidated_; }

    // =========================================================================
    // Frame
    // =========================================================================

    /// Update the stage; @p dtSeconds is scaled by each view's speed
    void update(double dtSeconds);

    /// beginFrame(), renderStage(), endFrame()
    void render();

    /// Reset per-frame stats and clear when configured
    void beginFrame();

    void renderStage();

    /// Flush, flip and collect unused GPU resources
    void endFrame();

    /// update() followed by render()
    void frame(double dtSeconds);

    uint64_t frameCount() const { return frameCount_; }

private:
    AG& ag_;
    ViewsConfig config_;

    KTreeSerializer serializer_;
    VfsFile currentVfs_;
    FrameClock clock_;
    RenderContext renderContext_;
    FixedSizeContainer stage_;

    uint64_t frameCount_ = 0;
    uint64_t invalidationCount_ = 0;
    View* lastInvalidatedView_ = nullptr;
    Signal<View*> onInvalidated_;
};

} // namespace kestrel
