#include "PlaybackSync.hpp"

#include "AudioEngineClient.hpp"

namespace wavetrim {

PlaybackSync::PlaybackSync(AudioEngineClient& engine, const EditorConfig& config)
    : engine_(engine), config_(config) {}

PlaybackSync::~PlaybackSync() {
    stopTimer();
}

void PlaybackSync::start() {
    if (isTimerRunning())
        return;

    startTimer(config_.getPollIntervalMs());
    DBG("PlaybackSync: polling every " << config_.getPollIntervalMs() << "ms");
}

void PlaybackSync::stop() {
    if (isTimerRunning()) {
        stopTimer();
        DBG("PlaybackSync: polling stopped");
    }

    // Anything still in flight belongs to the old session
    minAcceptedSerial_ = nextSerial_;
    requestInFlight_ = false;
    state_ = {};
    hasState_ = false;
}

bool PlaybackSync::isRunning() const {
    return isTimerRunning();
}

void PlaybackSync::timerCallback() {
    pollNow();
}

void PlaybackSync::pollNow() {
    if (requestInFlight_)
        return;

    const auto serial = nextSerial_++;
    requestInFlight_ = true;
    inFlightSerial_ = serial;

    juce::WeakReference<PlaybackSync> weakThis(this);
    engine_.getPlaybackState([weakThis, serial](const ValueResult<PlaybackState>& result) {
        if (auto* self = weakThis.get())
            self->handlePollResult(serial, result);
    });
}

void PlaybackSync::applyLocalSeek(double seconds) {
    minAcceptedSerial_ = nextSerial_;

    if (hasState_) {
        auto seeked = state_;
        seeked.currentTime = juce::jlimit(0.0, seeked.duration, seconds);
        publish(seeked);
    }
}

void PlaybackSync::handlePollResult(juce::uint64 serial,
                                    const ValueResult<PlaybackState>& result) {
    if (serial == inFlightSerial_)
        requestInFlight_ = false;

    if (serial < minAcceptedSerial_) {
        DBG("PlaybackSync: discarding stale poll #" << (juce::int64)serial);
        return;
    }

    if (!result.success) {
        DBG("PlaybackSync: poll failed, keeping previous state: "
            << juce::String(result.errorMessage));
        return;
    }

    publish(result.value);
}

void PlaybackSync::publish(const PlaybackState& newState) {
    if (hasState_ && newState == state_)
        return;

    state_ = newState;
    hasState_ = true;

    if (onStateChanged)
        onStateChanged(state_);
}

}  // namespace wavetrim
