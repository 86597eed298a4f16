#include "TrimRange.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace wavetrim {

namespace {

std::string formatSeconds(double value) {
    std::ostringstream stream;
    stream << value;
    return stream.str();
}

}  // namespace

CommandResult TrimRange::validate() const {
    if (startSeconds < 0.0)
        return CommandResult::Failure("Start time cannot be negative: " +
                                      formatSeconds(startSeconds));

    if (endSeconds <= startSeconds)
        return CommandResult::Failure("End time (" + formatSeconds(endSeconds) +
                                      ") must be greater than start time (" +
                                      formatSeconds(startSeconds) + ")");

    return CommandResult::Success();
}

CommandResult TrimRange::validateAgainstDuration(double durationSeconds) const {
    auto result = validate();
    if (!result.success)
        return result;

    if (endSeconds > durationSeconds)
        return CommandResult::Failure("Trim range (" + formatSeconds(startSeconds) + "s to " +
                                      formatSeconds(endSeconds) +
                                      "s) exceeds audio duration (" +
                                      formatSeconds(durationSeconds) + "s)");

    return CommandResult::Success();
}

TrimRange::FrameSpan TrimRange::toFrames(double sampleRate, std::int64_t totalFrames) const {
    auto start = static_cast<std::int64_t>(startSeconds * sampleRate);
    auto end = static_cast<std::int64_t>(endSeconds * sampleRate);

    start = std::clamp<std::int64_t>(start, 0, totalFrames);
    end = std::clamp<std::int64_t>(end, start, totalFrames);

    return {start, end - start};
}

}  // namespace wavetrim
