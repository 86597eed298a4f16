#include <juce_gui_basics/juce_gui_basics.h>

#include <cmath>

#include "wavetrim/editor/core/EditorConfig.hpp"
#include "wavetrim/editor/ui/components/waveform/PeakRenderer.hpp"
#include "wavetrim/editor/ui/themes/WaveformTheme.hpp"

using namespace wavetrim;
using wavetrim::ui::PeakRenderer;

/**
 * @brief Pixel checks for PeakRenderer
 *
 * Renders into a 200x100 image. With 10 buckets over 10 seconds each bar is 20px wide
 * (16px drawn) and the vertical scale of 0.9 puts full-scale peaks at y = 5 and y = 95.
 * Sample points stay away from edges and text.
 */
class PeakRendererTest final : public juce::UnitTest {
  public:
    PeakRendererTest() : juce::UnitTest("PeakRenderer Tests", "wavetrim") {}

    void runTest() override {
        testEmptyPeaksDrawOnlyBackground();
        testBarsAndGaps();
        testPositiveAmplitudeGoesUp();
        testSelectionDimmingAndHandles();
        testPlayhead();
        testSameInputsSameImage();
    }

  private:
    static constexpr int WIDTH = 200;
    static constexpr int HEIGHT = 100;

    EditorConfig config_;
    WaveformTheme theme_ = WaveformTheme::parchment();

    static WaveformPeaks makePeaks(float minValue, float maxValue) {
        WaveformPeaks peaks;
        peaks.numPeaks = 10;
        peaks.durationSeconds = 10.0;
        peaks.sampleRate = 44100.0;
        peaks.channels = 1;
        peaks.minPeaks.assign(10, minValue);
        peaks.maxPeaks.assign(10, maxValue);
        return peaks;
    }

    juce::Image render(const WaveformPeaks& peaks, const TrimSelection& selection,
                       std::optional<double> currentTime) {
        juce::Image image(juce::Image::ARGB, WIDTH, HEIGHT, true);
        juce::Graphics g(image);
        PeakRenderer renderer(theme_, config_);
        renderer.render(g, static_cast<float>(WIDTH), static_cast<float>(HEIGHT), peaks,
                        selection, currentTime);
        return image;
    }

    static int countDifferentPixels(const juce::Image& a, const juce::Image& b) {
        int different = 0;
        for (int y = 0; y < a.getHeight(); ++y)
            for (int x = 0; x < a.getWidth(); ++x)
                if (a.getPixelAt(x, y) != b.getPixelAt(x, y))
                    ++different;
        return different;
    }

    static bool coloursClose(juce::Colour a, juce::Colour b) {
        const int tolerance = 3;
        return std::abs(a.getRed() - b.getRed()) <= tolerance &&
               std::abs(a.getGreen() - b.getGreen()) <= tolerance &&
               std::abs(a.getBlue() - b.getBlue()) <= tolerance;
    }

    void expectPixel(const juce::Image& image, int x, int y, juce::Colour expected,
                     const juce::String& what) {
        auto actual = image.getPixelAt(x, y);
        expect(coloursClose(actual, expected), what + " at (" + juce::String(x) + ", " +
                                                   juce::String(y) + "): got " +
                                                   actual.toDisplayString(true) + ", expected " +
                                                   expected.toDisplayString(true));
    }

    void testEmptyPeaksDrawOnlyBackground() {
        beginTest("Empty peaks draw only the background");

        WaveformPeaks empty;
        auto image = render(empty, {0.0, 0.0}, 1.0);

        for (int x = 0; x < WIDTH; x += 7)
            for (int y = 0; y < HEIGHT; y += 7)
                expectPixel(image, x, y, theme_.background, "background");

        beginTest("Zero duration draws only the background");

        auto zeroDuration = makePeaks(-1.0f, 1.0f);
        zeroDuration.durationSeconds = 0.0;
        image = render(zeroDuration, {0.0, 0.0}, std::nullopt);
        expectPixel(image, 10, 50, theme_.background, "background");
        expectPixel(image, 100, 50, theme_.background, "background");
    }

    void testBarsAndGaps() {
        beginTest("Bars fill 80% of each bucket");

        auto image = render(makePeaks(-1.0f, 1.0f), {0.0, 10.0}, std::nullopt);

        expectPixel(image, 10, 50, theme_.waveform, "bar");
        expectPixel(image, 70, 30, theme_.waveform, "bar");
        expectPixel(image, 18, 50, theme_.background, "gap between bars");
        expectPixel(image, 70, 98, theme_.background, "below the peak");
    }

    void testPositiveAmplitudeGoesUp() {
        beginTest("Positive amplitudes are drawn above the centre line");

        auto image = render(makePeaks(0.0f, 1.0f), {0.0, 10.0}, std::nullopt);

        expectPixel(image, 70, 25, theme_.waveform, "upper half");
        expectPixel(image, 70, 75, theme_.background, "lower half");
    }

    void testSelectionDimmingAndHandles() {
        beginTest("Outside the selection is dimmed and handles are drawn");

        // 2.5s..7.5s -> x 50..150
        auto image = render(makePeaks(-1.0f, 1.0f), {2.5, 7.5}, std::nullopt);

        auto dimmed =
            theme_.background.overlaidWith(theme_.dimming.withAlpha(config_.getDimmingAlpha()));
        expectPixel(image, 30, 98, dimmed, "dimmed left");
        expectPixel(image, 170, 98, dimmed, "dimmed right");
        expectPixel(image, 110, 98, theme_.background, "inside selection");

        expectPixel(image, 50, 60, theme_.handle, "start handle");
        expectPixel(image, 150, 60, theme_.handle, "end handle");
    }

    void testPlayhead() {
        beginTest("Playhead line is drawn in the playhead colour");

        auto image = render(makePeaks(-1.0f, 1.0f), {0.0, 10.0}, 5.0);
        expectPixel(image, 100, 60, theme_.playhead, "playhead line");
        expectPixel(image, 100, 3, theme_.playhead, "playhead triangle");

        beginTest("No playhead without a current time");

        image = render(makePeaks(-1.0f, 1.0f), {0.0, 10.0}, std::nullopt);
        expectPixel(image, 110, 60, theme_.waveform, "bar without playhead");
    }

    void testSameInputsSameImage() {
        beginTest("Rendering the same inputs twice gives identical pixels");

        WaveformPeaks peaks = makePeaks(-0.6f, 0.8f);
        peaks.minPeaks[3] = -1.0f;
        peaks.maxPeaks[7] = 0.1f;

        auto first = render(peaks, {2.5, 7.25}, 4.1);
        auto second = render(peaks, {2.5, 7.25}, 4.1);
        expectEquals(countDifferentPixels(first, second), 0);

        beginTest("Rendering twice into one image gives the same pixels as once");

        juce::Image reused(juce::Image::ARGB, WIDTH, HEIGHT, true);
        PeakRenderer renderer(theme_, config_);
        for (int pass = 0; pass < 2; ++pass) {
            juce::Graphics g(reused);
            renderer.render(g, static_cast<float>(WIDTH), static_cast<float>(HEIGHT), peaks,
                            {2.5, 7.25}, 4.1);
        }
        expectEquals(countDifferentPixels(first, reused), 0);
    }
};

static PeakRendererTest peakRendererTest;
