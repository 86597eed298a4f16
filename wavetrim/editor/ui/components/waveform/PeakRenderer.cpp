#include "PeakRenderer.hpp"

#include <algorithm>
#include <cmath>

#include "core/CoordinateMapper.hpp"

namespace wavetrim::ui {

PeakRenderer::PeakRenderer(const WaveformTheme& theme, const EditorConfig& config)
    : theme_(theme), config_(config) {}

void PeakRenderer::render(juce::Graphics& g, float width, float height,
                          const WaveformPeaks& peaks, const TrimSelection& selection,
                          std::optional<double> currentTime) const {
    g.fillAll(theme_.background);

    if (peaks.isEmpty() || width <= 0.0f || height <= 0.0f)
        return;

    paintPeaks(g, width, height, peaks);
    paintSelection(g, width, height, peaks.durationSeconds, selection);

    if (currentTime)
        paintPlayhead(g, width, height, peaks.durationSeconds, *currentTime);
}

void PeakRenderer::paintPeaks(juce::Graphics& g, float width, float height,
                              const WaveformPeaks& peaks) const {
    const auto numPeaks =
        std::min({peaks.numPeaks, peaks.minPeaks.size(), peaks.maxPeaks.size()});
    if (numPeaks == 0)
        return;

    const float barWidth = width / static_cast<float>(peaks.numPeaks);
    const float drawnWidth = std::max(barWidth * BAR_FILL_RATIO, 1.0f);
    const float centerY = height * 0.5f;
    const float amplitudeScale = centerY * static_cast<float>(config_.getPeakVerticalScale());

    g.setColour(theme_.waveform);

    for (size_t i = 0; i < numPeaks; ++i) {
        const float x = static_cast<float>(i) * barWidth;

        // Positive amplitudes go up
        const float topY = centerY - peaks.maxPeaks[i] * amplitudeScale;
        const float bottomY = centerY - peaks.minPeaks[i] * amplitudeScale;

        g.fillRect(x, std::min(topY, bottomY), drawnWidth, std::abs(bottomY - topY));
    }
}

void PeakRenderer::paintSelection(juce::Graphics& g, float width, float height, double duration,
                                  const TrimSelection& selection) const {
    const auto startX =
        static_cast<float>(CoordinateMapper::timeToX(selection.start, duration, width));
    const auto endX =
        static_cast<float>(CoordinateMapper::timeToX(selection.end, duration, width));

    // Dim everything outside the selection
    g.setColour(theme_.dimming.withAlpha(config_.getDimmingAlpha()));
    g.fillRect(0.0f, 0.0f, startX, height);
    g.fillRect(endX, 0.0f, width - endX, height);

    // Handles
    const auto handleWidth = static_cast<float>(config_.getHandleWidthPixels());
    g.setColour(theme_.handle);
    g.fillRect(startX - handleWidth * 0.5f, 0.0f, handleWidth, height);
    g.fillRect(endX - handleWidth * 0.5f, 0.0f, handleWidth, height);

    // Time labels
    g.setColour(theme_.label);
    g.setFont(juce::Font(theme_.labelFontHeight));
    g.drawSingleLineText(juce::String(selection.start, 2) + "s",
                         juce::roundToInt(startX + LABEL_INSET), juce::roundToInt(LABEL_BASELINE),
                         juce::Justification::left);
    g.drawSingleLineText(juce::String(selection.end, 2) + "s",
                         juce::roundToInt(endX - LABEL_INSET), juce::roundToInt(LABEL_BASELINE),
                         juce::Justification::right);
}

void PeakRenderer::paintPlayhead(juce::Graphics& g, float width, float height, double duration,
                                 double currentTime) const {
    const auto playheadX =
        static_cast<float>(CoordinateMapper::timeToX(currentTime, duration, width));

    g.setColour(theme_.playhead);
    g.drawLine(playheadX, 0.0f, playheadX, height, PLAYHEAD_LINE_WIDTH);

    // Drag handle at the top
    juce::Path triangle;
    triangle.addTriangle(playheadX - PLAYHEAD_TRIANGLE_HALF_WIDTH, 0.0f,
                         playheadX + PLAYHEAD_TRIANGLE_HALF_WIDTH, 0.0f, playheadX,
                         PLAYHEAD_TRIANGLE_HEIGHT);
    g.fillPath(triangle);

    g.setFont(juce::Font(theme_.labelFontHeight, juce::Font::bold));
    g.drawSingleLineText(juce::String(currentTime, 1) + "s", juce::roundToInt(playheadX),
                         juce::roundToInt(height - PLAYHEAD_LABEL_BOTTOM_OFFSET),
                         juce::Justification::horizontallyCentred);
}

}  // namespace wavetrim::ui
