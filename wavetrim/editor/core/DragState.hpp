#pragma once

namespace wavetrim {

/** What a pointer-down landed on. */
enum class DragTarget { None, SelectionStart, SelectionEnd, Playhead };

/**
 * @brief Ephemeral pointer interaction state
 *
 * active is only true between pointer-down and pointer-up on a recognised target.
 */
struct DragState {
    DragTarget target = DragTarget::None;
    bool active = false;

    void begin(DragTarget t) {
        target = t;
        active = (t != DragTarget::None);
    }

    void end() {
        target = DragTarget::None;
        active = false;
    }
};

}  // namespace wavetrim
