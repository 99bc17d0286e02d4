#include "kestrel/engine/game_loop.hpp"
#include "kestrel/core/logging.hpp"
#include "kestrel/view/views.hpp"

#include <chrono>

namespace kestrel {

GameLoop::GameLoop(Views& views)
    : views_(views) {
}

// =============================================================================
// Lifecycle
// =============================================================================

void GameLoop::run() {
    if (isRunning_) {
        KESTREL_WARN(LogCategory::Core, "GameLoop::run() called while already running");
        return;
    }

    isRunning_ = true;
    shouldQuit_ = false;
    views_.clock().start();

    KESTREL_INFO(LogCategory::Core, "GameLoop started");

    while (!shouldQuit()) {
        double dt = views_.clock().tick();
        auto frameStart = std::chrono::steady_clock::now();

        if (!runFrame(dt)) {
            break;
        }

        // Frame pacing
        if (targetFrameTime_ > 0.0) {
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - frameStart;
            double sleepTime = onComputeSleep(targetFrameTime_, elapsed.count());
            if (sleepTime > 0.0) {
                FrameClock::sleep(sleepTime);
            }
        }
    }

    isRunning_ = false;
    KESTREL_INFO(LogCategory::Core, "GameLoop exited after " + std::to_string(frameNumber_) + " frames");
}

bool GameLoop::runFrame(double dt) {
    if (!guarded([&] { onUpdate(dt); })) return false;
    if (!guarded([&] { onRender(dt); })) return false;
    if (!guarded([&] { onFrameEnd(); })) return false;
    frameNumber_++;
    return true;
}

// =============================================================================
// Virtual Method Implementations (Default Behavior)
// =============================================================================

void GameLoop::onUpdate(double dt) {
    views_.update(dt);
    if (updateListener_) {
        updateListener_(dt);
    }
}

void GameLoop::onRender(double dt) {
    (void)dt;
    views_.beginFrame();
    views_.renderStage();
    if (renderListener_) {
        renderListener_(views_.renderContext());
    }
    views_.endFrame();
}

void GameLoop::onFrameEnd() {
    if (frameEndListener_) {
        frameEndListener_();
    }
}

bool GameLoop::onError(const std::exception& e) {
    KESTREL_ERROR(LogCategory::Core, "GameLoop error: " + std::string(e.what()));

    if (errorListener_) {
        return errorListener_(e);
    }

    return true;  // Continue by default
}

double GameLoop::onComputeSleep(double targetFrameTime, double elapsed) {
    return targetFrameTime - elapsed;
}

} // namespace kestrel
