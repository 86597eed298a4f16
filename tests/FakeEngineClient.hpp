#pragma once

#include <deque>
#include <string>
#include <vector>

#include "wavetrim/editor/engine/AudioEngineClient.hpp"

namespace wavetrim::test {

/**
 * Scripted AudioEngineClient for tests.
 *
 * Requests are queued with their callbacks and nothing is answered until the test calls
 * one of the respond*() methods, so responses can be delivered late, out of order, or
 * after the requester is gone.
 */
class FakeEngineClient : public AudioEngineClient {
  public:
    struct PeaksRequest {
        juce::File file;
        int targetPeakCount = 0;
        PeaksCallback callback;
    };

    struct TrimRequest {
        juce::File input;
        juce::File output;
        double startSeconds = 0.0;
        double endSeconds = 0.0;
        StatusCallback callback;
    };

    // AudioEngineClient
    void getWaveformPeaks(const juce::File& file, int targetPeakCount,
                          PeaksCallback callback) override {
        peaksRequests.push_back({file, targetPeakCount, std::move(callback)});
    }

    void playAudio(const juce::File& file, StatusCallback callback) override {
        playedFiles.push_back(file);
        statusCallbacks.push_back(std::move(callback));
    }

    void pauseAudio(StatusCallback callback) override {
        ++pauseCount;
        statusCallbacks.push_back(std::move(callback));
    }

    void resumeAudio(StatusCallback callback) override {
        ++resumeCount;
        statusCallbacks.push_back(std::move(callback));
    }

    void stopAudio(StatusCallback callback) override {
        ++stopCount;
        if (callback)
            statusCallbacks.push_back(std::move(callback));
    }

    void seekAudio(double seconds, StatusCallback /*callback*/) override {
        seeks.push_back(seconds);
    }

    void getPlaybackState(StateCallback callback) override {
        ++stateRequestCount;
        if (autoRespondState) {
            callback(ValueResult<PlaybackState>::Success(autoState));
            return;
        }
        stateCallbacks.push_back(std::move(callback));
    }

    void trimAudioFile(const juce::File& input, const juce::File& output, double startSeconds,
                       double endSeconds, StatusCallback callback) override {
        trimRequests.push_back({input, output, startSeconds, endSeconds, std::move(callback)});
    }

    // Responses, oldest request first unless an index is given
    void respondPeaks(size_t index, const ValueResult<WaveformPeaks>& result) {
        auto callback = peaksRequests.at(index).callback;
        peaksRequests.erase(peaksRequests.begin() + static_cast<long>(index));
        callback(result);
    }

    void respondState(const ValueResult<PlaybackState>& result) {
        auto callback = stateCallbacks.front();
        stateCallbacks.pop_front();
        callback(result);
    }

    void respondStatus(const CommandResult& result) {
        auto callback = statusCallbacks.front();
        statusCallbacks.pop_front();
        if (callback)
            callback(result);
    }

    void respondTrim(const CommandResult& result) {
        auto callback = trimRequests.front().callback;
        trimRequests.erase(trimRequests.begin());
        callback(result);
    }

    static WaveformPeaks makePeaks(double duration, size_t numPeaks = 100) {
        WaveformPeaks peaks;
        peaks.numPeaks = numPeaks;
        peaks.durationSeconds = duration;
        peaks.sampleRate = 44100.0;
        peaks.channels = 2;
        peaks.minPeaks.assign(numPeaks, -0.5f);
        peaks.maxPeaks.assign(numPeaks, 0.5f);
        return peaks;
    }

    std::vector<PeaksRequest> peaksRequests;
    std::vector<TrimRequest> trimRequests;
    std::deque<StateCallback> stateCallbacks;
    std::deque<StatusCallback> statusCallbacks;

    std::vector<juce::File> playedFiles;
    std::vector<double> seeks;
    int pauseCount = 0;
    int resumeCount = 0;
    int stopCount = 0;
    int stateRequestCount = 0;

    // Answers state polls immediately, for timer tests
    bool autoRespondState = false;
    PlaybackState autoState;
};

}  // namespace wavetrim::test
