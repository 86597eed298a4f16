#pragma once

#include <algorithm>

namespace wavetrim {

/**
 * @brief Conversions between time in seconds and horizontal pixel position
 *
 * The whole duration is mapped onto the viewport width. Callers must check hasData()
 * first: with a zero duration or width the mapping is meaningless and nothing should be
 * drawn or seeked.
 */
namespace CoordinateMapper {

inline bool hasData(double duration, double width) {
    return duration > 0.0 && width > 0.0;
}

/**
 * Convert a time to an x position
 * @param time Time in seconds
 * @param duration Total duration in seconds (must be > 0)
 * @param width Viewport width in pixels
 */
inline double timeToX(double time, double duration, double width) {
    return (time / duration) * width;
}

/**
 * Convert an x position to a time, clamped to [0, duration]
 * @param x Pixel position
 * @param duration Total duration in seconds (must be > 0)
 * @param width Viewport width in pixels (must be > 0)
 */
inline double xToTime(double x, double duration, double width) {
    return std::clamp(x / width, 0.0, 1.0) * duration;
}

}  // namespace CoordinateMapper

}  // namespace wavetrim
