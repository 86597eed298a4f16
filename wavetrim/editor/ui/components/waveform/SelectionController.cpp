#include "SelectionController.hpp"

#include <algorithm>
#include <cmath>

#include "core/CoordinateMapper.hpp"

namespace wavetrim {

SelectionController::SelectionController(const EditorConfig& config) : config_(config) {}

void SelectionController::reset(double duration) {
    duration_ = duration > 0.0 ? duration : 0.0;
    state_ = State::Idle;
    applySelection(TrimSelection::fullRange(duration_));
}

DragTarget SelectionController::hitTest(double x, double width) const {
    if (!CoordinateMapper::hasData(duration_, width))
        return DragTarget::None;

    const double threshold = config_.getHandleHitThresholdPixels();
    const double startX = CoordinateMapper::timeToX(selection_.start, duration_, width);
    const double endX = CoordinateMapper::timeToX(selection_.end, duration_, width);

    if (std::abs(x - startX) < threshold)
        return DragTarget::SelectionStart;
    if (std::abs(x - endX) < threshold)
        return DragTarget::SelectionEnd;
    return DragTarget::None;
}

bool SelectionController::pointerDown(double x, double width) {
    switch (hitTest(x, width)) {
        case DragTarget::SelectionStart:
            state_ = State::DraggingStart;
            return true;
        case DragTarget::SelectionEnd:
            state_ = State::DraggingEnd;
            return true;
        default:
            return false;
    }
}

void SelectionController::pointerMove(double x, double width) {
    if (state_ == State::Idle || !CoordinateMapper::hasData(duration_, width))
        return;

    const double clampedX = std::clamp(x, 0.0, width);
    const double time = CoordinateMapper::xToTime(clampedX, duration_, width);

    if (state_ == State::DraggingStart)
        setStart(time);
    else
        setEnd(time);
}

void SelectionController::pointerUp() {
    state_ = State::Idle;
}

void SelectionController::setStart(double seconds) {
    if (!std::isfinite(seconds) || !canEdit())
        return;

    applySelection({clampStart(seconds), selection_.end});
}

void SelectionController::setEnd(double seconds) {
    if (!std::isfinite(seconds) || !canEdit())
        return;

    applySelection({selection_.start, clampEnd(seconds)});
}

double SelectionController::clampStart(double seconds) const {
    return std::max(0.0, std::min(seconds, selection_.end - config_.getMinSelectionSeconds()));
}

double SelectionController::clampEnd(double seconds) const {
    return std::min(duration_,
                    std::max(seconds, selection_.start + config_.getMinSelectionSeconds()));
}

bool SelectionController::canEdit() const {
    // A file shorter than the minimum selection keeps its full range
    return duration_ >= config_.getMinSelectionSeconds();
}

void SelectionController::applySelection(const TrimSelection& next) {
    if (next == selection_)
        return;

    selection_ = next;
    if (onSelectionChanged)
        onSelectionChanged(selection_);
}

}  // namespace wavetrim
