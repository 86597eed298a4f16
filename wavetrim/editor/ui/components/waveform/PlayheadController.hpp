#pragma once

#include <functional>
#include <optional>

#include "core/DragState.hpp"
#include "core/EditorConfig.hpp"

namespace wavetrim {

/**
 * @brief Drag/seek state machine for the playhead
 *
 * Holds the displayed playback time. The authoritative value comes from the engine
 * poll (setCurrentTime). A seek updates the displayed time optimistically and asks the
 * owner to send the command. The next poll result replaces it.
 */
class PlayheadController {
  public:
    explicit PlayheadController(const EditorConfig& config);

    void setDuration(double duration);
    double getDuration() const {
        return duration_;
    }

    /** Seeking (drag or body click) is only possible while enabled. */
    void setSeekEnabled(bool enabled);
    bool isSeekEnabled() const {
        return seekEnabled_;
    }

    std::optional<double> getCurrentTime() const {
        return currentTime_;
    }

    /** Applies a polled time clamped to [0, duration], or clears the playhead with nullopt. */
    void setCurrentTime(std::optional<double> time);

    bool isDragging() const {
        return drag_.active;
    }

    /** True if x is within the hit threshold of the drawn playhead. */
    bool hitTest(double x, double width) const;

    /** Starts a drag when seeking is enabled and x is on the playhead. */
    bool pointerDown(double x, double width);
    void pointerMove(double x, double width);
    void pointerUp();

    /**
     * @brief Requests a seek to the given time (clamped to [0, duration])
     * @return false if seeking is unavailable
     */
    bool seekTo(double seconds);

    /** Seek request for the engine. */
    std::function<void(double)> onSeekRequested;

    /** Fired whenever the displayed time changes. */
    std::function<void(std::optional<double>)> onCurrentTimeChanged;

  private:
    void applyTime(std::optional<double> time);

    const EditorConfig& config_;

    std::optional<double> currentTime_;
    double duration_ = 0.0;
    bool seekEnabled_ = false;
    DragState drag_;
};

}  // namespace wavetrim
