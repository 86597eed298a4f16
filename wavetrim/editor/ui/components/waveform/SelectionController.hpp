#pragma once

#include <functional>

#include "core/DragState.hpp"
#include "core/EditorConfig.hpp"
#include "core/TrimSelection.hpp"

namespace wavetrim {

/**
 * @brief Drag state machine for the two trim selection handles
 *
 * States: Idle, DraggingStart, DraggingEnd. Every edit goes through the same clamping,
 * so the selection stays inside [0, duration] and keeps at least the configured minimum
 * length (to within floating-point rounding of end - min), including during a drag.
 *
 * Pointer positions are in component pixels. The width passed with each event is the
 * current viewport width.
 */
class SelectionController {
  public:
    enum class State { Idle, DraggingStart, DraggingEnd };

    explicit SelectionController(const EditorConfig& config);

    /** Resets the selection to [0, duration] and cancels any drag. */
    void reset(double duration);

    const TrimSelection& getSelection() const {
        return selection_;
    }
    double getDuration() const {
        return duration_;
    }
    State getState() const {
        return state_;
    }
    bool isDragging() const {
        return state_ != State::Idle;
    }

    /**
     * @brief Which handle (if any) lies within the hit threshold of x
     *
     * The start handle is checked first, so it wins when both handles overlap.
     * @return SelectionStart, SelectionEnd or None
     */
    DragTarget hitTest(double x, double width) const;

    /** Starts a drag if x is on a handle. Returns true when a drag began. */
    bool pointerDown(double x, double width);
    void pointerMove(double x, double width);
    void pointerUp();

    /** Typed edits. Clamped the same way as drags, non-finite values are ignored. */
    void setStart(double seconds);
    void setEnd(double seconds);

    /** Fired after every change to the selection. */
    std::function<void(const TrimSelection&)> onSelectionChanged;

  private:
    double clampStart(double seconds) const;
    double clampEnd(double seconds) const;
    bool canEdit() const;
    void applySelection(const TrimSelection& next);

    const EditorConfig& config_;

    TrimSelection selection_;
    double duration_ = 0.0;
    State state_ = State::Idle;
};

}  // namespace wavetrim
