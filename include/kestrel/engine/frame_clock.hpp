#pragma once

#include <chrono>
#include <cstdint>

namespace kestrel {

/**
 * @brief Frame delta and FPS measurement
 *
 * tick() measures the wall-clock time since the previous tick.
 * advance() feeds an explicit delta instead, which keeps headless runs and
 * tests deterministic. Deltas are clamped to maxDelta() so a stalled
 * frame does not make animations jump.
 */
class FrameClock {
public:
    FrameClock();

    /// Start/restart the clock
    void start();

    /// Mark the end of a frame and return the measured delta in seconds
    double tick();

    /// Mark the end of a frame with an explicit delta in seconds
    double advance(double dtSeconds);

    double deltaTime() const { return deltaTime_; }

    /// Smoothed frames per second (0 until enough frames were counted)
    double fps() const { return fps_; }

    /// Sum of all deltas since start()
    double totalTime() const { return totalTime_; }

    uint64_t frameCount() const { return frameCount_; }

    double maxDelta() const { return maxDelta_; }
    void setMaxDelta(double seconds) { maxDelta_ = seconds > 0.0 ? seconds : 0.0; }

    /// Sleep for a specified duration in seconds
    static void sleep(double seconds);

private:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    double record(double dtSeconds);

    TimePoint lastFrameTime_;
    double deltaTime_ = 0.0;
    double fps_ = 0.0;
    double totalTime_ = 0.0;
    double maxDelta_ = 0.25;
    uint64_t frameCount_ = 0;

    // FPS smoothing
    static constexpr int FPS_SAMPLE_COUNT = 60;
    double fpsAccumulator_ = 0.0;
    int fpsFrameCount_ = 0;
};

} // namespace kestrel
