#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

#include <functional>
#include <memory>
#include <optional>

#include "PeakRenderer.hpp"
#include "PlayheadController.hpp"
#include "SelectionController.hpp"
#include "core/EditorConfig.hpp"
#include "core/WaveformPeaks.hpp"
#include "ui/themes/WaveformTheme.hpp"

namespace wavetrim::ui {

/**
 * @brief Interactive waveform view with trim selection and playhead
 *
 * Owns the raster image the waveform is rendered into, the selection and playhead
 * controllers and the renderer. paint() only blits the image. The image is re-rendered
 * when the peaks, the selection or the playback time change, and on resize. Nothing
 * else triggers a render.
 *
 * Pointer precedence on mouse-down: selection handles, then the playhead, then a seek
 * on the waveform body when seeking is enabled.
 */
class WaveformSurface : public juce::Component {
  public:
    WaveformSurface(const EditorConfig& config, const WaveformTheme& theme);
    ~WaveformSurface() override;

    // Component overrides
    void paint(juce::Graphics& g) override;
    void resized() override;

    void mouseDown(const juce::MouseEvent& event) override;
    void mouseDrag(const juce::MouseEvent& event) override;
    void mouseUp(const juce::MouseEvent& event) override;
    void mouseMove(const juce::MouseEvent& event) override;
    void mouseExit(const juce::MouseEvent& event) override;

    // ========================================================================
    // Inputs
    // ========================================================================

    /**
     * @brief Install the peaks for a newly loaded file
     *
     * Resets the selection to the whole file and clears the playhead.
     * nullptr clears the surface.
     */
    void setPeaks(std::shared_ptr<const WaveformPeaks> peaks);
    const WaveformPeaks* getPeaks() const {
        return peaks_.get();
    }

    /** Typed selection edits, clamped like drags. */
    void setSelectionStart(double seconds);
    void setSelectionEnd(double seconds);
    const TrimSelection& getSelection() const {
        return selection_.getSelection();
    }

    /** Polled playback time, or nullopt to hide the playhead. */
    void setCurrentTime(std::optional<double> seconds);
    std::optional<double> getCurrentTime() const {
        return playhead_.getCurrentTime();
    }

    /** Enables playhead dragging and click-to-seek. */
    void setSeekEnabled(bool enabled);
    bool isSeekEnabled() const {
        return playhead_.isSeekEnabled();
    }

    const WaveformTheme& getTheme() const {
        return theme_;
    }

    // ========================================================================
    // Outputs
    // ========================================================================

    std::function<void(const TrimSelection&)> onSelectionChange;
    std::function<void(double)> onSeek;

    // Inspection, mainly for tests
    const juce::Image& getRenderedImage() const {
        return raster_;
    }
    int getRenderCount() const {
        return renderCount_;
    }
    bool isDragging() const {
        return selection_.isDragging() || playhead_.isDragging();
    }

  private:
    void requestRender();
    void rerender();
    void updateHoverCursor(float x);

    const EditorConfig& config_;
    WaveformTheme theme_;
    PeakRenderer renderer_;
    SelectionController selection_;
    PlayheadController playhead_;

    std::shared_ptr<const WaveformPeaks> peaks_;
    juce::Image raster_;

    int renderCount_ = 0;
    bool batchingUpdates_ = false;  // setPeaks renders once at the end

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WaveformSurface)
};

}  // namespace wavetrim::ui
