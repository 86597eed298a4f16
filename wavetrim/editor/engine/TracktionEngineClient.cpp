#include "TracktionEngineClient.hpp"

#include <iostream>

#include "AudioFileProcessing.hpp"

namespace wavetrim {

namespace te = tracktion;

TracktionEngineClient::TracktionEngineClient() = default;

TracktionEngineClient::~TracktionEngineClient() {
    shutdown();
}

bool TracktionEngineClient::initialize() {
    try {
        engine_ = std::make_unique<te::Engine>("wavetrim");

        // Playback only, no inputs
        engine_->getDeviceManager().initialise(0, 2);

        auto editFile = juce::File::getSpecialLocation(juce::File::tempDirectory)
                            .getChildFile("wavetrim_temp.tracktionedit");
        if (editFile.existsAsFile())
            editFile.deleteFile();

        edit_ = te::createEmptyEdit(*engine_, editFile);
        if (!edit_) {
            std::cerr << "ERROR: Failed to create Tracktion Edit" << std::endl;
            return false;
        }

        track_ = edit_->insertNewAudioTrack(te::TrackInsertPoint(nullptr, nullptr), nullptr);
        if (!track_) {
            std::cerr << "ERROR: Failed to create playback track" << std::endl;
            edit_.reset();
            return false;
        }

        edit_->getTransport().ensureContextAllocated();

        std::cout << "Tracktion Engine initialized" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: Failed to initialize Tracktion Engine: " << e.what() << std::endl;
        return false;
    }
}

void TracktionEngineClient::shutdown() {
    workerPool_.removeAllJobs(true, WORKER_SHUTDOWN_TIMEOUT_MS);

    if (edit_) {
        edit_->getTransport().stop(false, false);
        unloadFile();
    }

    track_ = nullptr;
    edit_.reset();

    if (engine_) {
        engine_.reset();
        std::cout << "Tracktion Engine shut down" << std::endl;
    }
}

// ============================================================================
// File loading
// ============================================================================

CommandResult TracktionEngineClient::loadFile(const juce::File& file) {
    if (!edit_ || !track_)
        return CommandResult::Failure("Audio engine not initialized");

    if (file == loadedFile_ && clip_ != nullptr)
        return CommandResult::Success();

    if (!file.existsAsFile())
        return CommandResult::Failure("File not found: " + file.getFullPathName().toStdString());

    te::AudioFile audioFile(*engine_, file);
    if (!audioFile.isValid() || audioFile.getLength() <= 0.0)
        return CommandResult::Failure("Unsupported or unreadable audio file: " +
                                      file.getFileName().toStdString());

    unloadFile();

    const double length = audioFile.getLength();
    auto timeRange =
        te::TimeRange(te::TimePosition::fromSeconds(0.0), te::TimePosition::fromSeconds(length));

    clip_ = insertWaveClip(*track_, file.getFileNameWithoutExtension(), file,
                           te::ClipPosition{timeRange}, te::DeleteExistingClips::yes);
    if (!clip_)
        return CommandResult::Failure("Failed to create audio clip from: " +
                                      file.getFullPathName().toStdString());

    loadedFile_ = file;
    loadedDuration_ = length;

    DBG("TracktionEngineClient: loaded " << file.getFileName() << " (" << length << "s)");
    return CommandResult::Success();
}

void TracktionEngineClient::unloadFile() {
    if (clip_) {
        clip_->removeFromParent();
        clip_ = nullptr;
    }
    loadedFile_ = juce::File();
    loadedDuration_ = 0.0;
}

// ============================================================================
// Transport
// ============================================================================

void TracktionEngineClient::playAudio(const juce::File& file, StatusCallback callback) {
    try {
        auto loaded = loadFile(file);
        if (!loaded.success) {
            post(callback, loaded);
            return;
        }

        auto& transport = edit_->getTransport();
        transport.setPosition(te::TimePosition::fromSeconds(0.0));
        transport.play(false);
        std::cout << "Playback started: " << file.getFileName() << std::endl;
        post(callback, CommandResult::Success());

    } catch (const std::exception& e) {
        post(callback, CommandResult::Failure(e.what()));
    }
}

void TracktionEngineClient::pauseAudio(StatusCallback callback) {
    if (!clip_) {
        post(callback, CommandResult::Failure("No audio file loaded"));
        return;
    }

    // Keep the position: stop() may move the transport
    auto& transport = edit_->getTransport();
    auto position = transport.position.get();
    transport.stop(false, false);
    transport.setPosition(position);

    DBG("TracktionEngineClient: paused at " << position.inSeconds() << "s");
    post(callback, CommandResult::Success());
}

void TracktionEngineClient::resumeAudio(StatusCallback callback) {
    if (!clip_) {
        post(callback, CommandResult::Failure("No audio file loaded"));
        return;
    }

    edit_->getTransport().play(false);
    DBG("TracktionEngineClient: resumed");
    post(callback, CommandResult::Success());
}

void TracktionEngineClient::stopAudio(StatusCallback callback) {
    if (!edit_) {
        post(callback, CommandResult::Failure("Audio engine not initialized"));
        return;
    }

    auto& transport = edit_->getTransport();
    transport.stop(false, false);
    transport.setPosition(te::TimePosition::fromSeconds(0.0));

    std::cout << "Playback stopped" << std::endl;
    post(callback, CommandResult::Success());
}

void TracktionEngineClient::seekAudio(double seconds, StatusCallback callback) {
    if (!clip_) {
        post(callback, CommandResult::Failure("No audio file loaded"));
        return;
    }

    const double target = juce::jlimit(0.0, loadedDuration_, seconds);
    edit_->getTransport().setPosition(te::TimePosition::fromSeconds(target));
    post(callback, CommandResult::Success());
}

PlaybackState TracktionEngineClient::readTransportState() {
    if (!edit_ || !clip_)
        return {};

    auto& transport = edit_->getTransport();
    PlaybackState state;
    state.duration = loadedDuration_;
    state.isPlaying = transport.isPlaying();
    state.currentTime = transport.position.get().inSeconds();

    // Finished: rewind so the next play starts from the top
    if (state.isPlaying && state.currentTime >= loadedDuration_) {
        transport.stop(false, false);
        transport.setPosition(te::TimePosition::fromSeconds(0.0));
        state.isPlaying = false;
        state.currentTime = 0.0;
        DBG("TracktionEngineClient: reached end of file");
    }

    state.currentTime = juce::jlimit(0.0, loadedDuration_, state.currentTime);
    return state;
}

void TracktionEngineClient::getPlaybackState(StateCallback callback) {
    if (!edit_) {
        post(callback, ValueResult<PlaybackState>::Failure("Audio engine not initialized"));
        return;
    }
    post(callback, ValueResult<PlaybackState>::Success(readTransportState()));
}

// ============================================================================
// Background file work
// ============================================================================

void TracktionEngineClient::getWaveformPeaks(const juce::File& file, int targetPeakCount,
                                             PeaksCallback callback) {
    workerPool_.addJob([file, targetPeakCount, callback]() {
        ValueResult<WaveformPeaks> result;
        try {
            result = AudioFileProcessing::extractWaveformPeaks(file, targetPeakCount);
        } catch (const std::exception& e) {
            result = ValueResult<WaveformPeaks>::Failure(e.what());
        }

        if (!result.success)
            std::cerr << "Failed to load waveform peaks: " << result.errorMessage << std::endl;

        post(callback, result);
    });
}

void TracktionEngineClient::trimAudioFile(const juce::File& input, const juce::File& output,
                                          double startSeconds, double endSeconds,
                                          StatusCallback callback) {
    TrimRange range{startSeconds, endSeconds};

    // Reject bad ranges before queueing any work
    auto check = range.validate();
    if (!check.success) {
        post(callback, check);
        return;
    }

    workerPool_.addJob([input, output, range, callback]() {
        CommandResult result;
        try {
            result = AudioFileProcessing::writeTrimmedFile(input, output, range);
        } catch (const std::exception& e) {
            result = CommandResult::Failure(e.what());
        }

        if (result.success)
            std::cout << "Trimmed audio written to: " << output.getFullPathName() << std::endl;
        else
            std::cerr << "Trim failed: " << result.errorMessage << std::endl;

        post(callback, result);
    });
}

}  // namespace wavetrim
