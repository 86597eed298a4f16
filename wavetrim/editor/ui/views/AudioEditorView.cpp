#include "AudioEditorView.hpp"

#include <iostream>

#include "engine/AudioFileProcessing.hpp"

namespace wavetrim::ui {

// ============================================================================
// TimeField
// ============================================================================

AudioEditorView::TimeField::TimeField(const juce::String& labelText, double step) : step_(step) {
    label_.setText(labelText, juce::dontSendNotification);
    label_.setFont(juce::Font(14.0f, juce::Font::bold));
    addAndMakeVisible(label_);

    editor_.setInputRestrictions(12, "0123456789.");
    editor_.setJustification(juce::Justification::centredRight);
    editor_.onReturnKey = [this]() { commitText(); };
    editor_.onFocusLost = [this]() { commitText(); };
    addAndMakeVisible(editor_);

    decrementButton_.onClick = [this]() {
        if (onValueCommitted)
            onValueCommitted(value_ - step_);
    };
    addAndMakeVisible(decrementButton_);

    incrementButton_.onClick = [this]() {
        if (onValueCommitted)
            onValueCommitted(value_ + step_);
    };
    addAndMakeVisible(incrementButton_);

    unitsLabel_.setText("seconds", juce::dontSendNotification);
    addAndMakeVisible(unitsLabel_);
}

void AudioEditorView::TimeField::resized() {
    auto bounds = getLocalBounds();
    label_.setBounds(bounds.removeFromLeft(50));
    decrementButton_.setBounds(bounds.removeFromLeft(24));
    editor_.setBounds(bounds.removeFromLeft(70).reduced(2, 0));
    incrementButton_.setBounds(bounds.removeFromLeft(24));
    unitsLabel_.setBounds(bounds);
}

void AudioEditorView::TimeField::setValue(double seconds) {
    value_ = seconds;
    editor_.setText(juce::String(seconds, 2), juce::dontSendNotification);
}

double AudioEditorView::TimeField::getValue() const {
    return value_;
}

void AudioEditorView::TimeField::commitText() {
    auto text = editor_.getText().trim();
    if (text.isEmpty()) {
        setValue(value_);
        return;
    }

    if (onValueCommitted)
        onValueCommitted(text.getDoubleValue());
}

// ============================================================================
// AudioEditorView
// ============================================================================

AudioEditorView::AudioEditorView(AudioEngineClient& engine, const EditorConfig& config,
                                 const WaveformTheme& theme)
    : engine_(engine),
      config_(config),
      theme_(theme),
      surface_(config, theme),
      playbackSync_(engine, config),
      startField_("Start:", TIME_FIELD_STEP),
      endField_("End:", TIME_FIELD_STEP) {
    titleLabel_.setText("Audio Editor", juce::dontSendNotification);
    titleLabel_.setFont(juce::Font(24.0f, juce::Font::bold));
    titleLabel_.setJustificationType(juce::Justification::centred);
    addAndMakeVisible(titleLabel_);

    subtitleLabel_.setText("Trim and prepare your recordings", juce::dontSendNotification);
    subtitleLabel_.setJustificationType(juce::Justification::centred);
    addAndMakeVisible(subtitleLabel_);

    openButton_.onClick = [this]() { showOpenDialog(); };
    addChildComponent(openButton_);

    statusLabel_.setJustificationType(juce::Justification::centred);
    addChildComponent(statusLabel_);

    tryAgainButton_.onClick = [this]() { clearFile(); };
    addChildComponent(tryAgainButton_);

    fileNameLabel_.setFont(juce::Font(18.0f, juce::Font::bold));
    addChildComponent(fileNameLabel_);
    addChildComponent(fileInfoLabel_);

    surface_.onSelectionChange = [this](const TrimSelection& selection) {
        handleSelectionChanged(selection);
    };
    surface_.onSeek = [this](double seconds) { handleSeek(seconds); };
    addChildComponent(surface_);

    playButton_.onClick = [this]() { play(); };
    pauseButton_.onClick = [this]() {
        if (isPaused_)
            resume();
        else
            pause();
    };
    stopButton_.onClick = [this]() { stop(); };
    addChildComponent(playButton_);
    addChildComponent(pauseButton_);
    addChildComponent(stopButton_);

    startField_.onValueCommitted = [this](double seconds) {
        surface_.setSelectionStart(seconds);
        handleSelectionChanged(surface_.getSelection());
    };
    endField_.onValueCommitted = [this](double seconds) {
        surface_.setSelectionEnd(seconds);
        handleSelectionChanged(surface_.getSelection());
    };
    addChildComponent(startField_);
    addChildComponent(endField_);
    addChildComponent(trimDurationLabel_);

    trimButton_.onClick = [this]() { showTrimDialog(); };
    addChildComponent(trimButton_);

    trimErrorLabel_.setColour(juce::Label::textColourId, theme_.handle);
    addChildComponent(trimErrorLabel_);

    loadDifferentButton_.onClick = [this]() { clearFile(); };
    addChildComponent(loadDifferentButton_);

    playbackSync_.onStateChanged = [this](const PlaybackState& state) {
        handlePlaybackState(state);
    };

    for (auto* label : {&titleLabel_, &subtitleLabel_, &statusLabel_, &fileNameLabel_,
                        &fileInfoLabel_, &trimDurationLabel_})
        label->setColour(juce::Label::textColourId, theme_.label);

    updateControls();
}

AudioEditorView::~AudioEditorView() {
    playbackSync_.onStateChanged = nullptr;
    playbackSync_.stop();
}

void AudioEditorView::paint(juce::Graphics& g) {
    g.fillAll(theme_.background);
}

void AudioEditorView::resized() {
    auto bounds = getLocalBounds().reduced(MARGIN);

    titleLabel_.setBounds(bounds.removeFromTop(32));
    subtitleLabel_.setBounds(bounds.removeFromTop(20));
    bounds.removeFromTop(ROW_GAP * 2);

    // Empty, loading and error states share the centre
    auto centre = bounds.withSizeKeepingCentre(juce::jmin(bounds.getWidth(), 480), 100);
    statusLabel_.setBounds(centre.removeFromTop(40));
    centre.removeFromTop(ROW_GAP);
    auto centreButtons = centre.removeFromTop(ROW_HEIGHT).withSizeKeepingCentre(180, ROW_HEIGHT);
    openButton_.setBounds(centreButtons);
    tryAgainButton_.setBounds(centreButtons);

    // Loaded workspace
    fileNameLabel_.setBounds(bounds.removeFromTop(24));
    fileInfoLabel_.setBounds(bounds.removeFromTop(20));
    bounds.removeFromTop(ROW_GAP);

    auto bottom = bounds.removeFromBottom(ROW_HEIGHT);
    loadDifferentButton_.setBounds(bottom.removeFromLeft(180));
    bounds.removeFromBottom(ROW_GAP);

    trimErrorLabel_.setBounds(bounds.removeFromBottom(20));

    auto trimRow = bounds.removeFromBottom(ROW_HEIGHT);
    startField_.setBounds(trimRow.removeFromLeft(240));
    trimRow.removeFromLeft(ROW_GAP);
    endField_.setBounds(trimRow.removeFromLeft(240));
    trimRow.removeFromLeft(ROW_GAP);
    trimButton_.setBounds(trimRow.removeFromRight(120));
    trimDurationLabel_.setBounds(trimRow);
    bounds.removeFromBottom(ROW_GAP);

    auto transportRow = bounds.removeFromBottom(ROW_HEIGHT);
    playButton_.setBounds(transportRow.removeFromLeft(80));
    transportRow.removeFromLeft(ROW_GAP);
    pauseButton_.setBounds(transportRow.removeFromLeft(80));
    transportRow.removeFromLeft(ROW_GAP);
    stopButton_.setBounds(transportRow.removeFromLeft(80));
    bounds.removeFromBottom(ROW_GAP);

    surface_.setBounds(bounds);
}

// ============================================================================
// File drag and drop
// ============================================================================

bool AudioEditorView::isInterestedInFileDrag(const juce::StringArray& files) {
    if (files.size() != 1 || isTrimming_)
        return false;
    return juce::File(files[0]).hasFileExtension(
        AudioFileProcessing::getSupportedExtensions().joinIntoString(";"));
}

void AudioEditorView::filesDropped(const juce::StringArray& files, int /*x*/, int /*y*/) {
    if (!files.isEmpty())
        openFile(juce::File(files[0]));
}

// ============================================================================
// File loading
// ============================================================================

void AudioEditorView::showOpenDialog() {
    fileChooser_ = std::make_unique<juce::FileChooser>(
        "Open Audio File", juce::File::getSpecialLocation(juce::File::userMusicDirectory),
        AudioFileProcessing::getSupportedFilePatterns());

    auto flags = juce::FileBrowserComponent::openMode | juce::FileBrowserComponent::canSelectFiles;

    juce::Component::SafePointer<AudioEditorView> safeThis(this);
    fileChooser_->launchAsync(flags, [safeThis](const juce::FileChooser& chooser) {
        if (!safeThis)
            return;

        auto file = chooser.getResult();
        safeThis->fileChooser_.reset();
        if (file.existsAsFile())
            safeThis->openFile(file);
    });
}

void AudioEditorView::openFile(const juce::File& file) {
    if (engineHasCurrentFile_)
        engine_.stopAudio({});
    playbackSync_.stop();
    resetTransportDisplay();

    const auto generation = ++loadGeneration_;

    fileState_ = {};
    fileState_.file = file;
    fileState_.fileName = file.getFileName();
    fileState_.isLoading = true;
    trimError_.clear();

    surface_.setPeaks(nullptr);
    updateControls();

    DBG("AudioEditorView: loading " << file.getFullPathName());

    juce::Component::SafePointer<AudioEditorView> safeThis(this);
    engine_.getWaveformPeaks(file, config_.getTargetPeakCount(),
                             [safeThis, generation](const ValueResult<WaveformPeaks>& result) {
                                 if (safeThis)
                                     safeThis->handlePeaksLoaded(generation, result);
                             });
}

void AudioEditorView::handlePeaksLoaded(juce::uint64 generation,
                                        const ValueResult<WaveformPeaks>& result) {
    if (generation != loadGeneration_ || !fileState_.isLoading) {
        DBG("AudioEditorView: dropping peaks for a file that is no longer current");
        return;
    }

    fileState_.isLoading = false;

    if (!result.success) {
        fileState_.error = result.errorMessage;
        std::cerr << "Error loading audio: " << result.errorMessage << std::endl;
        updateControls();
        return;
    }

    if (!result.value.isValid()) {
        fileState_.error = "Invalid waveform data returned for " + fileState_.fileName;
        std::cerr << "Error loading audio: " << fileState_.error << std::endl;
        updateControls();
        return;
    }

    fileState_.peaks = std::make_shared<const WaveformPeaks>(result.value);
    surface_.setPeaks(fileState_.peaks);
    handleSelectionChanged(surface_.getSelection());

    playbackSync_.start();

    std::cout << "Loaded " << fileState_.fileName << " (" << fileState_.peaks->durationSeconds
              << "s)" << std::endl;
    updateControls();
}

void AudioEditorView::clearFile() {
    if (engineHasCurrentFile_)
        engine_.stopAudio({});

    playbackSync_.stop();
    resetTransportDisplay();

    // Invalidate any load still in flight
    ++loadGeneration_;

    fileState_ = {};
    trimError_.clear();
    surface_.setPeaks(nullptr);
    updateControls();
}

// ============================================================================
// Trim
// ============================================================================

juce::String AudioEditorView::defaultTrimFileName(const juce::String& fileName) {
    auto baseName = fileName.containsChar('.') ? fileName.upToLastOccurrenceOf(".", false, false)
                                               : fileName;
    return "trimmed_" + baseName + ".wav";
}

void AudioEditorView::showTrimDialog() {
    if (!fileState_.peaks || isTrimming_)
        return;

    isTrimming_ = true;
    trimError_.clear();
    updateControls();

    auto defaultFile = fileState_.file.getSiblingFile(defaultTrimFileName(fileState_.fileName));
    fileChooser_ = std::make_unique<juce::FileChooser>("Save Trimmed Audio", defaultFile, "*.wav");

    auto flags = juce::FileBrowserComponent::saveMode | juce::FileBrowserComponent::canSelectFiles |
                 juce::FileBrowserComponent::warnAboutOverwriting;

    juce::Component::SafePointer<AudioEditorView> safeThis(this);
    fileChooser_->launchAsync(flags, [safeThis](const juce::FileChooser& chooser) {
        if (!safeThis)
            return;

        auto file = chooser.getResult();
        safeThis->fileChooser_.reset();

        // Cancelled
        safeThis->isTrimming_ = false;
        if (file == juce::File()) {
            safeThis->updateControls();
            return;
        }

        if (!file.hasFileExtension(".wav"))
            file = file.withFileExtension(".wav");

        safeThis->trimToFile(file);
    });
}

void AudioEditorView::trimToFile(const juce::File& output) {
    if (!fileState_.peaks || isTrimming_)
        return;

    isTrimming_ = true;
    trimError_.clear();
    updateControls();

    const auto selection = surface_.getSelection();
    const auto generation = loadGeneration_;

    DBG("AudioEditorView: trimming " << selection.start << "s to " << selection.end << "s into "
                                     << output.getFullPathName());

    juce::Component::SafePointer<AudioEditorView> safeThis(this);
    engine_.trimAudioFile(fileState_.file, output, selection.start, selection.end,
                          [safeThis, generation, output](const CommandResult& result) {
                              if (!safeThis)
                                  return;

                              safeThis->isTrimming_ = false;
                              if (result.success)
                                  std::cout << "Saved trimmed audio: " << output.getFullPathName()
                                            << std::endl;
                              else if (generation == safeThis->loadGeneration_)
                                  safeThis->trimError_ = result.errorMessage;
                              safeThis->updateControls();
                          });
}

// ============================================================================
// Transport
// ============================================================================

void AudioEditorView::play() {
    if (!fileState_.peaks)
        return;

    const auto generation = loadGeneration_;
    juce::Component::SafePointer<AudioEditorView> safeThis(this);
    engine_.playAudio(fileState_.file, [safeThis, generation](const CommandResult& result) {
        if (!safeThis || generation != safeThis->loadGeneration_)
            return;

        if (!result.success) {
            std::cerr << "Playback failed: " << result.errorMessage << std::endl;
            return;
        }

        safeThis->engineHasCurrentFile_ = true;
        safeThis->isPaused_ = false;
        safeThis->playbackSync_.start();
        safeThis->updateControls();
    });
}

void AudioEditorView::pause() {
    if (!engineHasCurrentFile_)
        return;

    juce::Component::SafePointer<AudioEditorView> safeThis(this);
    engine_.pauseAudio([safeThis](const CommandResult& result) {
        if (!safeThis)
            return;
        if (!result.success) {
            std::cerr << "Pause failed: " << result.errorMessage << std::endl;
            return;
        }
        safeThis->isPaused_ = true;
        safeThis->updateControls();
    });
}

void AudioEditorView::resume() {
    if (!engineHasCurrentFile_)
        return;

    juce::Component::SafePointer<AudioEditorView> safeThis(this);
    engine_.resumeAudio([safeThis](const CommandResult& result) {
        if (!safeThis)
            return;
        if (!result.success) {
            std::cerr << "Resume failed: " << result.errorMessage << std::endl;
            return;
        }
        safeThis->isPaused_ = false;
        safeThis->updateControls();
    });
}

void AudioEditorView::stop() {
    if (!engineHasCurrentFile_)
        return;

    juce::Component::SafePointer<AudioEditorView> safeThis(this);
    engine_.stopAudio([safeThis](const CommandResult& result) {
        if (!safeThis)
            return;
        if (!result.success) {
            std::cerr << "Stop failed: " << result.errorMessage << std::endl;
            return;
        }
        safeThis->isPaused_ = false;
        safeThis->updateControls();
    });
}

void AudioEditorView::handleSeek(double seconds) {
    engine_.seekAudio(seconds, [](const CommandResult& result) {
        if (!result.success)
            DBG("AudioEditorView: seek failed: " << juce::String(result.errorMessage));
    });
    playbackSync_.applyLocalSeek(seconds);
}

void AudioEditorView::handlePlaybackState(const PlaybackState& state) {
    // The engine may still hold a previous file until Play is pressed
    if (!engineHasCurrentFile_ || !state.hasFile()) {
        surface_.setSeekEnabled(false);
        surface_.setCurrentTime(std::nullopt);
        return;
    }

    surface_.setSeekEnabled(true);
    surface_.setCurrentTime(state.currentTime);

    if (!state.isPlaying && state.currentTime <= 0.0)
        isPaused_ = false;
    updateControls();
}

void AudioEditorView::resetTransportDisplay() {
    engineHasCurrentFile_ = false;
    isPaused_ = false;
    surface_.setSeekEnabled(false);
    surface_.setCurrentTime(std::nullopt);
}

// ============================================================================
// Display
// ============================================================================

juce::String AudioEditorView::formatFileInfo(const WaveformPeaks& peaks) {
    return "Duration: " + juce::String(peaks.durationSeconds, 2) +
           "s | Sample Rate: " + juce::String(juce::roundToInt(peaks.sampleRate)) +
           "Hz | Channels: " + juce::String(peaks.channels);
}

juce::String AudioEditorView::formatTrimDuration(const TrimSelection& selection) {
    return "Trim Duration: " + juce::String(selection.length(), 2) + "s";
}

void AudioEditorView::handleSelectionChanged(const TrimSelection& selection) {
    startField_.setValue(selection.start);
    endField_.setValue(selection.end);
    trimDurationLabel_.setText(formatTrimDuration(selection), juce::dontSendNotification);
}

void AudioEditorView::updateControls() {
    const bool hasPeaks = fileState_.peaks != nullptr;
    const bool hasError = fileState_.error.isNotEmpty();

    openButton_.setVisible(fileState_.isEmpty());
    tryAgainButton_.setVisible(hasError);

    if (fileState_.isLoading)
        statusLabel_.setText("Analyzing audio file...\nExtracting waveform peaks",
                             juce::dontSendNotification);
    else if (hasError)
        statusLabel_.setText("Error loading audio: " + fileState_.error,
                             juce::dontSendNotification);
    else
        statusLabel_.setText("Drop an audio file here or open one", juce::dontSendNotification);
    statusLabel_.setVisible(!hasPeaks);

    juce::Component* workspace[] = {&fileNameLabel_,    &fileInfoLabel_, &surface_,
                                    &playButton_,       &pauseButton_,   &stopButton_,
                                    &startField_,       &endField_,      &trimDurationLabel_,
                                    &trimButton_,       &loadDifferentButton_};
    for (auto* c : workspace)
        c->setVisible(hasPeaks);

    if (hasPeaks) {
        fileNameLabel_.setText(fileState_.fileName, juce::dontSendNotification);
        fileInfoLabel_.setText(formatFileInfo(*fileState_.peaks), juce::dontSendNotification);
    }

    pauseButton_.setButtonText(isPaused_ ? "Resume" : "Pause");
    pauseButton_.setEnabled(engineHasCurrentFile_);
    stopButton_.setEnabled(engineHasCurrentFile_);

    trimButton_.setButtonText(isTrimming_ ? "Trimming..." : "Trim & Save");
    trimButton_.setEnabled(hasPeaks && !isTrimming_);
    loadDifferentButton_.setEnabled(!isTrimming_);

    trimErrorLabel_.setText(trimError_, juce::dontSendNotification);
    trimErrorLabel_.setVisible(hasPeaks && trimError_.isNotEmpty());
}

}  // namespace wavetrim::ui
