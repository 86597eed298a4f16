#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

#include <memory>

#include "core/EditorConfig.hpp"
#include "engine/AudioEngineClient.hpp"
#include "ui/themes/WaveformTheme.hpp"

namespace wavetrim::ui {

class AudioEditorView;

/**
 * @brief Top-level window hosting the audio editor
 *
 * The engine and config are owned by the application and must outlive the window.
 */
class MainWindow : public juce::DocumentWindow {
  public:
    MainWindow(AudioEngineClient& engine, const EditorConfig& config);
    ~MainWindow() override;

    void closeButtonPressed() override;

    AudioEditorView& getEditorView() {
        return *editorView_;
    }

  private:
    WaveformTheme theme_;
    AudioEditorView* editorView_ = nullptr;  // Owned by DocumentWindow

    static constexpr int DEFAULT_WIDTH = 1000;
    static constexpr int DEFAULT_HEIGHT = 640;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainWindow)
};

}  // namespace wavetrim::ui
