#pragma once

#include "kestrel/engine/frame_clock.hpp"
#include <cstdint>
#include <exception>
#include <functional>

namespace kestrel {

class Views;
class RenderContext;

/**
 * @brief Frame loop driving a Views instance
 *
 * Each frame updates the stage, renders it and runs the frame-end hook.
 * Errors thrown by any step go to onError(), which decides whether the
 * loop keeps running.
 *
 * Usage patterns:
 * 1. Inheritance: derive and override the virtual methods
 * 2. Listeners: use as-is and set callback functions
 *
 * Example (listeners):
 * @code
 * LogAG ag;
 * Views views(ag);
 * GameLoop loop(views);
 * loop.setTargetFramerate(60.0);
 * loop.setUpdateListener([&](double dt) {
 *     if (views.clock().totalTime() > 5.0) loop.quit();
 * });
 * loop.run();  // Blocks until quit()
 * @endcode
 */
class GameLoop {
public:
    using UpdateListener = std::function<void(double dt)>;
    using RenderListener = std::function<void(RenderContext& ctx)>;
    using FrameEndListener = std::function<void()>;
    using ErrorListener = std::function<bool(const std::exception&)>;

    explicit GameLoop(Views& views);
    virtual ~GameLoop() = default;

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Set target framerate (0 = unlimited) (default: 0)
    void setTargetFramerate(double fps) {
        targetFrameTime_ = (fps > 0.0) ? (1.0 / fps) : 0.0;
    }

    double targetFrameTime() const { return targetFrameTime_; }

    // =========================================================================
    // Listener Setters
    // =========================================================================

    /// Called after the stage was updated
    void setUpdateListener(UpdateListener listener) { updateListener_ = std::move(listener); }

    /// Called after the stage was rendered, before the frame is flushed
    void setRenderListener(RenderListener listener) { renderListener_ = std::move(listener); }

    void setFrameEndListener(FrameEndListener listener) { frameEndListener_ = std::move(listener); }

    /// Return false from the listener to stop the loop
    void setErrorListener(ErrorListener listener) { errorListener_ = std::move(listener); }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Run frames until quit() is called (blocks)
     *
     * Each iteration ticks the views clock and runs one frame with the
     * measured delta.
     */
    void run();

    /**
     * @brief Run one frame with an explicit delta
     * @return false if an error stopped the loop
     */
    bool runFrame(double dt);

    /// Request the loop to exit after the current frame
    void quit() { shouldQuit_ = true; }

    bool isRunning() const { return isRunning_; }

    uint64_t frameNumber() const { return frameNumber_; }

    Views& views() { return views_; }

protected:
    /// Update the stage, then call the update listener
    virtual void onUpdate(double dt);

    /// Render the stage, call the render listener and finish the frame
    virtual void onRender(double dt);

    virtual void onFrameEnd();

    /**
     * @brief Handle errors during the loop
     *
     * Default: logs the error and returns the error listener's verdict,
     * or true (continue) without a listener.
     */
    virtual bool onError(const std::exception& e);

    /// Sleep time for frame pacing; default is targetFrameTime - elapsed
    virtual double onComputeSleep(double targetFrameTime, double elapsed);

    virtual bool shouldQuit() const { return shouldQuit_; }

private:
    template<typename F>
    bool guarded(F&& step) {
        try {
            step();
            return true;
        } catch (const std::exception& e) {
            if (!onError(e)) {
                quit();
                return false;
            }
            return true;
        }
    }

    Views& views_;

    double targetFrameTime_ = 0.0;  // 0 = unlimited

    bool isRunning_ = false;
    bool shouldQuit_ = false;
    uint64_t frameNumber_ = 0;

    UpdateListener updateListener_;
    RenderListener renderListener_;
    FrameEndListener frameEndListener_;
    ErrorListener errorListener_;
};

} // namespace kestrel
