#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace wavetrim {

/**
 * @brief Fixed-resolution min/max amplitude summary of a decoded audio file
 *
 * Produced by the audio engine once per loaded file and never mutated afterwards.
 * A new file replaces the whole object.
 */
struct WaveformPeaks {
    std::vector<float> minPeaks;
    std::vector<float> maxPeaks;
    std::size_t numPeaks = 0;
    double durationSeconds = 0.0;

    // Informational only
    double sampleRate = 0.0;
    int channels = 0;

    /** True when there is nothing to draw (no buckets or zero length). */
    bool isEmpty() const {
        return numPeaks == 0 || durationSeconds <= 0.0;
    }

    /**
     * @brief Checks the bucket counts and per-bucket ordering
     *
     * Peaks that fail this check are treated as a load error and never installed.
     */
    bool isValid() const {
        if (minPeaks.size() != numPeaks || maxPeaks.size() != numPeaks)
            return false;
        if (!std::isfinite(durationSeconds) || durationSeconds <= 0.0)
            return false;

        for (std::size_t i = 0; i < numPeaks; ++i) {
            if (!(minPeaks[i] <= maxPeaks[i]))
                return false;
            if (minPeaks[i] < -1.0f || maxPeaks[i] > 1.0f)
                return false;
        }
        return true;
    }
};

}  // namespace wavetrim
