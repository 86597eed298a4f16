#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

#include <optional>

#include "core/EditorConfig.hpp"
#include "core/TrimSelection.hpp"
#include "core/WaveformPeaks.hpp"
#include "ui/themes/WaveformTheme.hpp"

namespace wavetrim::ui {

/**
 * @brief Draws the peak summary, trim selection overlay and playhead
 *
 * Stateless apart from its theme and config. The drawing target is passed to render()
 * and never kept, so the same inputs always produce the same pixels.
 * Sizes are in logical pixels; the caller scales the Graphics for the display density.
 */
class PeakRenderer {
  public:
    PeakRenderer(const WaveformTheme& theme, const EditorConfig& config);

    /**
     * @brief Paint a complete frame
     *
     * With no peaks or a zero duration only the background is drawn.
     * @param currentTime Playback time to mark, or nullopt for no playhead
     */
    void render(juce::Graphics& g, float width, float height, const WaveformPeaks& peaks,
                const TrimSelection& selection, std::optional<double> currentTime) const;

    static constexpr float BAR_FILL_RATIO = 0.8f;
    static constexpr float PLAYHEAD_LINE_WIDTH = 3.0f;
    static constexpr float PLAYHEAD_TRIANGLE_HALF_WIDTH = 10.0f;
    static constexpr float PLAYHEAD_TRIANGLE_HEIGHT = 16.0f;
    static constexpr float LABEL_INSET = 4.0f;
    static constexpr float LABEL_BASELINE = 20.0f;
    static constexpr float PLAYHEAD_LABEL_BOTTOM_OFFSET = 6.0f;

  private:
    void paintPeaks(juce::Graphics& g, float width, float height,
                    const WaveformPeaks& peaks) const;
    void paintSelection(juce::Graphics& g, float width, float height, double duration,
                        const TrimSelection& selection) const;
    void paintPlayhead(juce::Graphics& g, float width, float height, double duration,
                       double currentTime) const;

    const WaveformTheme& theme_;
    const EditorConfig& config_;
};

}  // namespace wavetrim::ui
