#pragma once

namespace wavetrim {

/**
 * @brief User-chosen [start, end] sub-range of the loaded file, in seconds
 *
 * Owned by the editor host and only changed through SelectionController, which keeps
 * 0 <= start < end <= duration and end - start >= the minimum selection length.
 */
struct TrimSelection {
    double start = 0.0;
    double end = 0.0;

    static TrimSelection fullRange(double duration) {
        return {0.0, duration > 0.0 ? duration : 0.0};
    }

    double length() const {
        return end - start;
    }

    bool operator==(const TrimSelection& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const TrimSelection& other) const {
        return !(*this == other);
    }
};

}  // namespace wavetrim
