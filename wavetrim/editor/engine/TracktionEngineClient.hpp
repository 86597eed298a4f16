#pragma once

#include <tracktion_engine/tracktion_engine.h>

#include <memory>

#include "AudioEngineClient.hpp"

namespace wavetrim {

/**
 * @brief AudioEngineClient backed by Tracktion Engine
 *
 * Playback uses a single-track Edit holding one WaveAudioClip for the loaded file.
 * Peak extraction and trimming run on a worker pool. All callbacks are posted to the
 * message thread.
 *
 * Must be created, used and destroyed on the message thread.
 */
class TracktionEngineClient : public AudioEngineClient {
  public:
    TracktionEngineClient();
    ~TracktionEngineClient() override;

    /** Creates the engine, audio device and Edit. Returns false on failure. */
    bool initialize();
    void shutdown();

    bool isInitialized() const {
        return edit_ != nullptr;
    }

    // AudioEngineClient
    void getWaveformPeaks(const juce::File& file, int targetPeakCount,
                          PeaksCallback callback) override;
    void playAudio(const juce::File& file, StatusCallback callback) override;
    void pauseAudio(StatusCallback callback) override;
    void resumeAudio(StatusCallback callback) override;
    void stopAudio(StatusCallback callback) override;
    void seekAudio(double seconds, StatusCallback callback) override;
    void getPlaybackState(StateCallback callback) override;
    void trimAudioFile(const juce::File& input, const juce::File& output, double startSeconds,
                       double endSeconds, StatusCallback callback) override;

  private:
    CommandResult loadFile(const juce::File& file);
    void unloadFile();
    PlaybackState readTransportState();

    template <typename Result, typename Callback>
    static void post(Callback callback, Result result) {
        juce::MessageManager::callAsync([callback, result]() {
            if (callback)
                callback(result);
        });
    }

    std::unique_ptr<tracktion::Engine> engine_;
    std::unique_ptr<tracktion::Edit> edit_;
    tracktion::AudioTrack::Ptr track_;
    tracktion::WaveAudioClip::Ptr clip_;

    juce::File loadedFile_;
    double loadedDuration_ = 0.0;

    juce::ThreadPool workerPool_{WORKER_THREADS};

    static constexpr int WORKER_THREADS = 2;
    static constexpr int WORKER_SHUTDOWN_TIMEOUT_MS = 5000;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TracktionEngineClient)
};

}  // namespace wavetrim
