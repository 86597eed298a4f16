#include "MainWindow.hpp"

#include "ui/views/AudioEditorView.hpp"

namespace wavetrim::ui {

MainWindow::MainWindow(AudioEngineClient& engine, const EditorConfig& config)
    : DocumentWindow("wavetrim", juce::Colour(WaveformTheme::PARCHMENT),
                     DocumentWindow::allButtons),
      theme_(WaveformTheme::parchment()) {
    setUsingNativeTitleBar(true);
    setResizable(true, true);
    setResizeLimits(640, 420, 4096, 4096);

    editorView_ = new AudioEditorView(engine, config, theme_);
    setContentOwned(editorView_, false);

    setSize(DEFAULT_WIDTH, DEFAULT_HEIGHT);
    centreWithSize(getWidth(), getHeight());
    setVisible(true);
}

MainWindow::~MainWindow() {
    // Tear the view down while the engine is still alive
    clearContentComponent();
    editorView_ = nullptr;
}

void MainWindow::closeButtonPressed() {
    juce::JUCEApplication::getInstance()->systemRequestedQuit();
}

}  // namespace wavetrim::ui
