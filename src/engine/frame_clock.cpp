#include "kestrel/engine/frame_clock.hpp"

#include <algorithm>
#include <thread>

namespace kestrel {

FrameClock::FrameClock() {
    start();
}

void FrameClock::start() {
    lastFrameTime_ = Clock::now();
    deltaTime_ = 0.0;
    fps_ = 0.0;
    totalTime_ = 0.0;
    frameCount_ = 0;
    fpsAccumulator_ = 0.0;
    fpsFrameCount_ = 0;
}

double FrameClock::tick() {
    TimePoint currentTime = Clock::now();
    std::chrono::duration<double> elapsed = currentTime - lastFrameTime_;
    lastFrameTime_ = currentTime;
    return record(elapsed.count());
}

double FrameClock::advance(double dtSeconds) {
    lastFrameTime_ = Clock::now();
    return record(dtSeconds);
}

double FrameClock::record(double dtSeconds) {
    deltaTime_ = std::clamp(dtSeconds, 0.0, maxDelta_);
    totalTime_ += deltaTime_;
    frameCount_++;

    // Update FPS with smoothing
    fpsAccumulator_ += deltaTime_;
    fpsFrameCount_++;

    if (fpsFrameCount_ >= FPS_SAMPLE_COUNT) {
        fps_ = fpsAccumulator_ > 0.0 ? fpsFrameCount_ / fpsAccumulator_ : 0.0;
        fpsAccumulator_ = 0.0;
        fpsFrameCount_ = 0;
    }

    return deltaTime_;
}

void FrameClock::sleep(double seconds) {
    if (seconds > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }
}

} // namespace kestrel
