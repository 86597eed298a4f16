#pragma once

#include <cstdint>

#include "CommandResult.hpp"

namespace wavetrim {

/**
 * @brief Validated [start, end] range for a trimAudioFile request
 *
 * Validation happens before any audio is read, so a bad range never produces a
 * partial output file.
 */
struct TrimRange {
    double startSeconds = 0.0;
    double endSeconds = 0.0;

    double length() const {
        return endSeconds - startSeconds;
    }

    /** Checks start >= 0 and end > start. */
    CommandResult validate() const;

    /** Also checks that the range ends inside a file of the given duration. */
    CommandResult validateAgainstDuration(double durationSeconds) const;

    /**
     * @brief Frame span covered by this range at the given sample rate
     *
     * Both ends are clamped to totalFrames.
     */
    struct FrameSpan {
        std::int64_t startFrame = 0;
        std::int64_t numFrames = 0;
    };
    FrameSpan toFrames(double sampleRate, std::int64_t totalFrames) const;
};

}  // namespace wavetrim
