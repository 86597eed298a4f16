#include "PlayheadController.hpp"

#include <algorithm>
#include <cmath>

#include "core/CoordinateMapper.hpp"

namespace wavetrim {

PlayheadController::PlayheadController(const EditorConfig& config) : config_(config) {}

void PlayheadController::setDuration(double duration) {
    duration_ = duration > 0.0 ? duration : 0.0;
    drag_.end();
}

void PlayheadController::setSeekEnabled(bool enabled) {
    seekEnabled_ = enabled;
    if (!seekEnabled_)
        drag_.end();
}

void PlayheadController::setCurrentTime(std::optional<double> time) {
    if (time && !std::isfinite(*time))
        return;

    // The engine's file length can differ slightly from the peaks' duration
    if (time && duration_ > 0.0)
        time = std::clamp(*time, 0.0, duration_);
    applyTime(time);
}

bool PlayheadController::hitTest(double x, double width) const {
    if (!currentTime_ || !CoordinateMapper::hasData(duration_, width))
        return false;

    const double playheadX = CoordinateMapper::timeToX(*currentTime_, duration_, width);
    return std::abs(x - playheadX) < config_.getHandleHitThresholdPixels();
}

bool PlayheadController::pointerDown(double x, double width) {
    if (!seekEnabled_ || !hitTest(x, width))
        return false;

    drag_.begin(DragTarget::Playhead);
    return true;
}

void PlayheadController::pointerMove(double x, double width) {
    if (!drag_.active || !CoordinateMapper::hasData(duration_, width))
        return;

    const double clampedX = std::clamp(x, 0.0, width);
    seekTo(CoordinateMapper::xToTime(clampedX, duration_, width));
}

void PlayheadController::pointerUp() {
    drag_.end();
}

bool PlayheadController::seekTo(double seconds) {
    if (!seekEnabled_ || duration_ <= 0.0 || !std::isfinite(seconds))
        return false;

    const double target = std::clamp(seconds, 0.0, duration_);
    applyTime(target);

    if (onSeekRequested)
        onSeekRequested(target);
    return true;
}

void PlayheadController::applyTime(std::optional<double> time) {
    if (time == currentTime_)
        return;

    currentTime_ = time;
    if (onCurrentTimeChanged)
        onCurrentTimeChanged(currentTime_);
}

}  // namespace wavetrim
