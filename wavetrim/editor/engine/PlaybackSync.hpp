#pragma once

#include <juce_events/juce_events.h>

#include <functional>

#include "core/CommandResult.hpp"
#include "core/EditorConfig.hpp"
#include "core/PlaybackState.hpp"

namespace wavetrim {

class AudioEngineClient;

/**
 * @brief Timer that polls the audio engine for transport state
 *
 * Every tick sends one getPlaybackState request, unless the previous one is still
 * outstanding. Successful results replace the local PlaybackState and fire
 * onStateChanged. Failed polls are logged and leave the previous state untouched.
 *
 * Responses issued before stop() or applyLocalSeek() are discarded when they arrive,
 * so an old poll can never overwrite a newer local seek or a torn-down view.
 */
class PlaybackSync : private juce::Timer {
  public:
    PlaybackSync(AudioEngineClient& engine, const EditorConfig& config);
    ~PlaybackSync() override;

    /** Starts polling. No-op while already running. */
    void start();
    /** Stops polling and forgets the last state. Safe to call when not running. */
    void stop();
    bool isRunning() const;

    /** Sends one poll now (the timer calls this on every tick). */
    void pollNow();

    /**
     * @brief Records a seek made locally and discards polls already in flight
     *
     * The next poll sent after this call is the one that reconciles the time.
     */
    void applyLocalSeek(double seconds);

    bool hasState() const {
        return hasState_;
    }
    const PlaybackState& getState() const {
        return state_;
    }
    bool isRequestInFlight() const {
        return requestInFlight_;
    }

    /** Fired on the message thread whenever the polled state changes. */
    std::function<void(const PlaybackState&)> onStateChanged;

  private:
    void timerCallback() override;
    void handlePollResult(juce::uint64 serial, const ValueResult<PlaybackState>& result);
    void publish(const PlaybackState& newState);

    AudioEngineClient& engine_;
    const EditorConfig& config_;

    PlaybackState state_;
    bool hasState_ = false;

    bool requestInFlight_ = false;
    juce::uint64 inFlightSerial_ = 0;
    juce::uint64 nextSerial_ = 1;
    juce::uint64 minAcceptedSerial_ = 1;  // Older responses are stale

    JUCE_DECLARE_WEAK_REFERENCEABLE(PlaybackSync)
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PlaybackSync)
};

}  // namespace wavetrim
