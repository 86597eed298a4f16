#include <juce_gui_basics/juce_gui_basics.h>

#include <iostream>
#include <memory>

#include "core/EditorConfig.hpp"
#include "engine/TracktionEngineClient.hpp"
#include "ui/views/AudioEditorView.hpp"
#include "ui/windows/MainWindow.hpp"

using namespace juce;

class WavetrimApplication : public JUCEApplication {
  private:
    wavetrim::EditorConfig config_;
    std::unique_ptr<wavetrim::TracktionEngineClient> engine_;
    std::unique_ptr<wavetrim::ui::MainWindow> mainWindow_;

    static File getConfigFile() {
        return File::getSpecialLocation(File::userApplicationDataDirectory)
            .getChildFile("wavetrim")
            .getChildFile("wavetrim.conf");
    }

  public:
    WavetrimApplication() = default;

    const String getApplicationName() override {
        return "wavetrim";
    }
    const String getApplicationVersion() override {
        return "1.0.0";
    }
    bool moreThanOneInstanceAllowed() override {
        return true;
    }

    void initialise(const String& commandLine) override {
        // 1. Load settings
        config_.loadFromFile(getConfigFile().getFullPathName().toStdString());

        // 2. Initialize audio engine
        engine_ = std::make_unique<wavetrim::TracktionEngineClient>();
        if (!engine_->initialize()) {
            std::cerr << "ERROR: Failed to initialize Tracktion Engine" << std::endl;
            quit();
            return;
        }

        std::cout << "✓ Audio engine initialized" << std::endl;

        // 3. Create main window
        mainWindow_ = std::make_unique<wavetrim::ui::MainWindow>(*engine_, config_);

        // 4. Open a file passed on the command line
        auto path = commandLine.unquoted().trim();
        if (path.isNotEmpty()) {
            File file = File::isAbsolutePath(path)
                            ? File(path)
                            : File::getCurrentWorkingDirectory().getChildFile(path);
            if (file.existsAsFile())
                mainWindow_->getEditorView().openFile(file);
            else
                std::cerr << "File not found: " << file.getFullPathName() << std::endl;
        }

        std::cout << "wavetrim is ready" << std::endl;
    }

    void shutdown() override {
        // Window first: the editor view stops its polling and drops engine callbacks
        mainWindow_.reset();

        if (engine_) {
            engine_->shutdown();
            engine_.reset();
        }

        std::cout << "wavetrim shutdown complete" << std::endl;
    }

    void systemRequestedQuit() override {
        quit();
    }

    void anotherInstanceStarted(const String& /*commandLine*/) override {}
};

// JUCE application startup
START_JUCE_APPLICATION(WavetrimApplication)
