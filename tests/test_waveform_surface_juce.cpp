#include <juce_gui_basics/juce_gui_basics.h>

#include <memory>
#include <vector>

#include "FakeEngineClient.hpp"
#include "wavetrim/editor/core/EditorConfig.hpp"
#include "wavetrim/editor/ui/components/waveform/WaveformSurface.hpp"
#include "wavetrim/editor/ui/themes/WaveformTheme.hpp"

using namespace wavetrim;
using wavetrim::test::FakeEngineClient;
using wavetrim::ui::WaveformSurface;

/**
 * @brief WaveformSurface re-render, interaction and teardown rules
 *
 * The surface is 200x100 with a 10 second file, so one second is 20px.
 */
class WaveformSurfaceTest final : public juce::UnitTest {
  public:
    WaveformSurfaceTest() : juce::UnitTest("WaveformSurface Tests", "wavetrim") {}

    void runTest() override {
        testInstallingPeaksResetsSelection();
        testRendersOnlyOnChanges();
        testRerenderIsIdempotent();
        testPollDuringSelectionDrag();
        testBodyClickSeeks();
        testPlayheadDrag();
        testThemeIsOwnedBySurface();
        testPlayheadColourMatchingHandleIsReplaced();
        testTeardownDropsCallbacks();
    }

  private:
    EditorConfig config_;

    static std::shared_ptr<const WaveformPeaks> makePeaks(double duration) {
        return std::make_shared<const WaveformPeaks>(FakeEngineClient::makePeaks(duration));
    }

    static std::unique_ptr<WaveformSurface> makeSurface(const EditorConfig& config,
                                                        const WaveformTheme& theme) {
        auto surface = std::make_unique<WaveformSurface>(config, theme);
        surface->setSize(200, 100);
        surface->setPeaks(makePeaks(10.0));
        return surface;
    }

    static juce::MouseEvent mouseAt(juce::Component& component, float x) {
        const juce::Point<float> position{x, 50.0f};
        const auto now = juce::Time::getCurrentTime();
        return juce::MouseEvent(juce::Desktop::getInstance().getMainMouseSource(), position,
                                juce::ModifierKeys(), juce::MouseInputSource::defaultPressure,
                                juce::MouseInputSource::defaultOrientation,
                                juce::MouseInputSource::defaultRotation,
                                juce::MouseInputSource::defaultTiltX,
                                juce::MouseInputSource::defaultTiltY, &component, &component,
                                now, position, now, 1, false);
    }

    void testInstallingPeaksResetsSelection() {
        beginTest("Installing peaks selects the whole file and hides the playhead");

        auto surface = makeSurface(config_, WaveformTheme::parchment());
        surface->setCurrentTime(4.0);
        surface->setSelectionStart(2.0);

        const int before = surface->getRenderCount();
        surface->setPeaks(makePeaks(7.5));

        expect(surface->getSelection() == TrimSelection{0.0, 7.5});
        expect(!surface->getCurrentTime().has_value());
        expectEquals(surface->getRenderCount() - before, 1, "one render per peaks change");
        expect(surface->getRenderedImage().isValid());

        beginTest("Clearing peaks empties the selection");
        surface->setPeaks(nullptr);
        expect(surface->getSelection() == TrimSelection{0.0, 0.0});
    }

    void testRendersOnlyOnChanges() {
        beginTest("Re-renders on selection and time changes only");

        auto surface = makeSurface(config_, WaveformTheme::parchment());
        int count = surface->getRenderCount();

        surface->setSelectionStart(2.0);
        expectEquals(surface->getRenderCount(), ++count);

        surface->setSelectionStart(2.0);
        expectEquals(surface->getRenderCount(), count);

        surface->setCurrentTime(3.2);
        expectEquals(surface->getRenderCount(), ++count);

        surface->setCurrentTime(3.2);
        expectEquals(surface->getRenderCount(), count);

        surface->setSeekEnabled(true);
        expectEquals(surface->getRenderCount(), count);

        surface->mouseMove(mouseAt(*surface, 120.0f));
        expectEquals(surface->getRenderCount(), count, "hover never renders");

        beginTest("Re-renders on resize");
        surface->setSize(300, 100);
        expectEquals(surface->getRenderCount(), ++count);
    }

    static int countDifferentPixels(const juce::Image& a, const juce::Image& b) {
        if (a.getBounds() != b.getBounds())
            return -1;
        int different = 0;
        for (int y = 0; y < a.getHeight(); ++y)
            for (int x = 0; x < a.getWidth(); ++x)
                if (a.getPixelAt(x, y) != b.getPixelAt(x, y))
                    ++different;
        return different;
    }

    void testRerenderIsIdempotent() {
        beginTest("Re-rendering unchanged inputs leaves the raster unchanged");

        auto theme = WaveformTheme::parchment();
        auto surface = makeSurface(config_, theme);
        surface->setSelectionStart(2.5);
        surface->setSelectionEnd(7.25);
        surface->setCurrentTime(4.1);

        const auto before = surface->getRenderedImage().createCopy();
        const int count = surface->getRenderCount();

        surface->resized();
        expectEquals(surface->getRenderCount(), count + 1);
        expectEquals(countDifferentPixels(before, surface->getRenderedImage()), 0);

        beginTest("A translucent background does not build up across re-renders");

        theme.background = theme.background.withAlpha(0.5f);
        auto translucent = makeSurface(config_, theme);
        const auto first = translucent->getRenderedImage().createCopy();

        translucent->resized();
        translucent->resized();
        expectEquals(countDifferentPixels(first, translucent->getRenderedImage()), 0);
    }

    void testPollDuringSelectionDrag() {
        beginTest("A poll during a selection drag moves the playhead only");

        auto surface = makeSurface(config_, WaveformTheme::parchment());
        surface->setSelectionStart(2.0);
        surface->setSelectionEnd(8.0);

        std::vector<TrimSelection> changes;
        surface->onSelectionChange = [&](const TrimSelection& s) { changes.push_back(s); };

        surface->mouseDown(mouseAt(*surface, 40.0f));
        expect(surface->isDragging());

        surface->setSeekEnabled(true);
        surface->setCurrentTime(3.2);

        expect(surface->isDragging(), "the drag survives the poll");
        expect(surface->getSelection() == TrimSelection{2.0, 8.0});
        expect(surface->getCurrentTime() == 3.2);
        expect(changes.empty());

        beginTest("Dragging start past end clamps to end minus the minimum");
        surface->mouseDrag(mouseAt(*surface, 190.0f));  // 9.5s
        expectWithinAbsoluteError(surface->getSelection().start, 7.9, 1e-9);
        expectEquals(static_cast<int>(changes.size()), 1);

        surface->mouseUp(mouseAt(*surface, 190.0f));
        expect(!surface->isDragging());
    }

    void testBodyClickSeeks() {
        beginTest("Clicking the body seeks when seeking is enabled");

        auto surface = makeSurface(config_, WaveformTheme::parchment());
        std::vector<double> seeks;
        surface->onSeek = [&](double t) { seeks.push_back(t); };

        surface->mouseDown(mouseAt(*surface, 150.0f));
        expect(seeks.empty(), "no seek before a file is playing");

        surface->setSeekEnabled(true);
        surface->mouseDown(mouseAt(*surface, 150.0f));
        surface->mouseUp(mouseAt(*surface, 150.0f));

        expectEquals(static_cast<int>(seeks.size()), 1);
        expectWithinAbsoluteError(seeks[0], 7.5, 1e-9);
        expect(surface->getCurrentTime() == 7.5, "seek updates the playhead straight away");

        beginTest("Clicking a selection handle does not seek");
        surface->mouseDown(mouseAt(*surface, 2.0f));
        surface->mouseUp(mouseAt(*surface, 2.0f));
        expectEquals(static_cast<int>(seeks.size()), 1);
    }

    void testPlayheadDrag() {
        beginTest("Dragging the playhead seeks continuously");

        auto surface = makeSurface(config_, WaveformTheme::parchment());
        surface->setSeekEnabled(true);
        surface->setCurrentTime(5.0);

        std::vector<double> seeks;
        surface->onSeek = [&](double t) { seeks.push_back(t); };

        surface->mouseDown(mouseAt(*surface, 100.0f));
        expect(surface->isDragging());
        surface->mouseDrag(mouseAt(*surface, 60.0f));
        surface->mouseDrag(mouseAt(*surface, -20.0f));
        surface->mouseUp(mouseAt(*surface, -20.0f));

        expectEquals(static_cast<int>(seeks.size()), 2);
        expectWithinAbsoluteError(seeks[0], 3.0, 1e-9);
        expectWithinAbsoluteError(seeks[1], 0.0, 1e-9);
        expect(surface->getSelection() == TrimSelection{0.0, 10.0});
    }

    void testThemeIsOwnedBySurface() {
        beginTest("The surface keeps its own copy of the theme");

        auto theme = std::make_unique<WaveformTheme>(WaveformTheme::parchment());
        auto surface = makeSurface(config_, *theme);
        const auto background = theme->background;

        theme->background = juce::Colours::red;
        theme.reset();

        expect(surface->getTheme().background == background);
        surface->setCurrentTime(1.0);
        expect(surface->getRenderedImage().isValid());
    }

    void testPlayheadColourMatchingHandleIsReplaced() {
        beginTest("A playhead colour equal to the handle colour is replaced");

        auto theme = WaveformTheme::parchment();
        theme.playhead = theme.handle;

        WaveformSurface surface(config_, theme);
        expect(surface.getTheme().hasDistinctPlayhead());
        expect(surface.getTheme().playhead == juce::Colour(WaveformTheme::PLAYHEAD));

        beginTest("Falls back to a contrasting colour when the handle uses the default");

        theme.handle = juce::Colour(WaveformTheme::PLAYHEAD);
        theme.playhead = theme.handle;
        WaveformSurface contrasting(config_, theme);
        expect(contrasting.getTheme().hasDistinctPlayhead());
    }

    void testTeardownDropsCallbacks() {
        beginTest("Destroying the surface mid-drag is safe");

        int selectionChanges = 0;
        {
            auto surface = makeSurface(config_, WaveformTheme::parchment());
            surface->onSelectionChange = [&](const TrimSelection&) { ++selectionChanges; };
            surface->mouseDown(mouseAt(*surface, 200.0f));
            surface->mouseDrag(mouseAt(*surface, 150.0f));
        }
        expectEquals(selectionChanges, 1);
    }
};

static WaveformSurfaceTest waveformSurfaceTest;
