#pragma once

#include <juce_core/juce_core.h>

#include <functional>

#include "core/CommandResult.hpp"
#include "core/PlaybackState.hpp"
#include "core/WaveformPeaks.hpp"

namespace wavetrim {

/**
 * @brief Asynchronous command interface to the audio engine
 *
 * Every command returns immediately. Its callback runs later on the message thread and
 * never from inside the call itself. Callbacks may be empty for fire-and-forget use.
 * Failures are reported through the result, no exception crosses this boundary.
 */
class AudioEngineClient {
  public:
    using StatusCallback = std::function<void(const CommandResult&)>;
    using PeaksCallback = std::function<void(const ValueResult<WaveformPeaks>&)>;
    using StateCallback = std::function<void(const ValueResult<PlaybackState>&)>;

    static constexpr int DEFAULT_PEAK_COUNT = 2000;

    virtual ~AudioEngineClient() = default;

    /** Decode the file and summarise it into targetPeakCount min/max buckets. */
    virtual void getWaveformPeaks(const juce::File& file, int targetPeakCount,
                                  PeaksCallback callback) = 0;

    // Transport
    /** Load the file if needed and play it from 0. */
    virtual void playAudio(const juce::File& file, StatusCallback callback) = 0;
    /** Pause, keeping the position. */
    virtual void pauseAudio(StatusCallback callback) = 0;
    /** Resume from the paused position. */
    virtual void resumeAudio(StatusCallback callback) = 0;
    /** Stop and rewind to 0. */
    virtual void stopAudio(StatusCallback callback) = 0;
    virtual void seekAudio(double seconds, StatusCallback callback) = 0;

    /** Snapshot of the transport. duration is 0 when no file is loaded. */
    virtual void getPlaybackState(StateCallback callback) = 0;

    /** Write [startSeconds, endSeconds] of input to output as a 32-bit float WAV. */
    virtual void trimAudioFile(const juce::File& input, const juce::File& output,
                               double startSeconds, double endSeconds,
                               StatusCallback callback) = 0;
};

}  // namespace wavetrim
