#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

#include <functional>
#include <memory>

#include "core/EditorConfig.hpp"
#include "core/PlaybackState.hpp"
#include "core/WaveformPeaks.hpp"
#include "engine/AudioEngineClient.hpp"
#include "engine/PlaybackSync.hpp"
#include "ui/components/waveform/WaveformSurface.hpp"
#include "ui/themes/WaveformTheme.hpp"

namespace wavetrim::ui {

/**
 * @brief Editor page: file loading, waveform, trim and transport controls
 *
 * Owns the loaded-file state, the WaveformSurface and the PlaybackSync. Polling runs
 * while a file is loaded and stops when it is cleared or the view is destroyed.
 * Engine responses for a file that is no longer current are dropped.
 */
class AudioEditorView : public juce::Component, public juce::FileDragAndDropTarget {
  public:
    struct FileState {
        juce::File file;
        juce::String fileName;
        std::shared_ptr<const WaveformPeaks> peaks;
        bool isLoading = false;
        juce::String error;

        bool isEmpty() const {
            return file == juce::File() && !isLoading && error.isEmpty();
        }
    };

    AudioEditorView(AudioEngineClient& engine, const EditorConfig& config,
                    const WaveformTheme& theme);
    ~AudioEditorView() override;

    void paint(juce::Graphics& g) override;
    void resized() override;

    // FileDragAndDropTarget
    bool isInterestedInFileDrag(const juce::StringArray& files) override;
    void filesDropped(const juce::StringArray& files, int x, int y) override;

    // ========================================================================
    // File
    // ========================================================================

    /** Requests peaks for the file and shows it once they arrive. */
    void openFile(const juce::File& file);

    /** Back to the empty state (Try Again / Load Different File). Stops playback. */
    void clearFile();

    /** Opens a file chooser for an audio file. */
    void showOpenDialog();

    const FileState& getFileState() const {
        return fileState_;
    }

    // ========================================================================
    // Trim
    // ========================================================================

    /** Asks for an output file, then trims. Cancelling leaves nothing pending. */
    void showTrimDialog();

    /** Trims the current selection into output. Ignored while a trim is running. */
    void trimToFile(const juce::File& output);

    bool isTrimming() const {
        return isTrimming_;
    }
    const juce::String& getTrimError() const {
        return trimError_;
    }

    // ========================================================================
    // Transport
    // ========================================================================

    void play();
    void pause();
    void resume();
    void stop();

    bool isPaused() const {
        return isPaused_;
    }

    WaveformSurface& getSurface() {
        return surface_;
    }
    PlaybackSync& getPlaybackSync() {
        return playbackSync_;
    }

    // ========================================================================
    // Formatting helpers
    // ========================================================================

    /** trimmed_<name without extension>.wav */
    static juce::String defaultTrimFileName(const juce::String& fileName);

    /** "Duration: D.DDs | Sample Rate: NHz | Channels: C" */
    static juce::String formatFileInfo(const WaveformPeaks& peaks);

    /** "Trim Duration: X.XXs" */
    static juce::String formatTrimDuration(const TrimSelection& selection);

  private:
    /** Numeric seconds field with step buttons. */
    class TimeField : public juce::Component {
      public:
        TimeField(const juce::String& labelText, double step);

        void resized() override;

        void setValue(double seconds);
        double getValue() const;

        /** Fired with the typed or stepped value. */
        std::function<void(double)> onValueCommitted;

      private:
        void commitText();

        double step_;
        double value_ = 0.0;
        juce::Label label_;
        juce::TextEditor editor_;
        juce::TextButton decrementButton_{"-"};
        juce::TextButton incrementButton_{"+"};
        juce::Label unitsLabel_;
    };

    void handlePeaksLoaded(juce::uint64 generation, const ValueResult<WaveformPeaks>& result);
    void handlePlaybackState(const PlaybackState& state);
    void handleSelectionChanged(const TrimSelection& selection);
    void handleSeek(double seconds);
    void resetTransportDisplay();
    void updateControls();

    AudioEngineClient& engine_;
    const EditorConfig& config_;
    const WaveformTheme theme_;

    FileState fileState_;
    juce::uint64 loadGeneration_ = 0;

    bool isTrimming_ = false;
    juce::String trimError_;

    bool engineHasCurrentFile_ = false;  // playAudio succeeded for fileState_.file
    bool isPaused_ = false;

    WaveformSurface surface_;
    PlaybackSync playbackSync_;

    // Header
    juce::Label titleLabel_;
    juce::Label subtitleLabel_;

    // Empty / loading / error states
    juce::TextButton openButton_{"Open Audio File..."};
    juce::Label statusLabel_;
    juce::TextButton tryAgainButton_{"Try Again"};

    // Loaded file
    juce::Label fileNameLabel_;
    juce::Label fileInfoLabel_;

    // Transport
    juce::TextButton playButton_{"Play"};
    juce::TextButton pauseButton_{"Pause"};
    juce::TextButton stopButton_{"Stop"};

    // Trim
    TimeField startField_;
    TimeField endField_;
    juce::Label trimDurationLabel_;
    juce::TextButton trimButton_{"Trim & Save"};
    juce::Label trimErrorLabel_;

    juce::TextButton loadDifferentButton_{"Load Different File"};

    std::unique_ptr<juce::FileChooser> fileChooser_;

    static constexpr double TIME_FIELD_STEP = 0.1;
    static constexpr int MARGIN = 20;
    static constexpr int ROW_HEIGHT = 28;
    static constexpr int ROW_GAP = 10;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioEditorView)
};

}  // namespace wavetrim::ui
