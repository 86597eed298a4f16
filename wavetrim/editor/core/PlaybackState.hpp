#pragma once

namespace wavetrim {

/**
 * @brief Snapshot of the external transport as last reported by the engine
 *
 * Overwritten wholesale on every poll. A duration of 0 means no file is loaded.
 */
struct PlaybackState {
    bool isPlaying = false;
    double currentTime = 0.0;
    double duration = 0.0;

    bool hasFile() const {
        return duration > 0.0;
    }

    bool operator==(const PlaybackState& other) const {
        return isPlaying == other.isPlaying && currentTime == other.currentTime &&
               duration == other.duration;
    }
    bool operator!=(const PlaybackState& other) const {
        return !(*this == other);
    }
};

}  // namespace wavetrim
