#include "WaveformSurface.hpp"

#include <iostream>

#include "core/CoordinateMapper.hpp"

namespace wavetrim::ui {

WaveformSurface::WaveformSurface(const EditorConfig& config, const WaveformTheme& theme)
    : config_(config),
      theme_(theme),
      renderer_(theme_, config_),
      selection_(config_),
      playhead_(config_) {
    if (!theme_.hasDistinctPlayhead()) {
        std::cerr << "WaveformSurface: playhead colour matches the handle colour, using the "
                     "default playhead colour"
                  << std::endl;
        theme_.playhead = juce::Colour(WaveformTheme::PLAYHEAD);
        if (!theme_.hasDistinctPlayhead())
            theme_.playhead = theme_.handle.contrasting();
    }

    selection_.onSelectionChanged = [this](const TrimSelection& selection) {
        requestRender();
        if (onSelectionChange)
            onSelectionChange(selection);
    };

    playhead_.onCurrentTimeChanged = [this](std::optional<double>) { requestRender(); };

    playhead_.onSeekRequested = [this](double seconds) {
        if (onSeek)
            onSeek(seconds);
    };

    setOpaque(true);
    rerender();
}

WaveformSurface::~WaveformSurface() {
    selection_.onSelectionChanged = nullptr;
    playhead_.onCurrentTimeChanged = nullptr;
    playhead_.onSeekRequested = nullptr;
}

// ============================================================================
// Rendering
// ============================================================================

void WaveformSurface::paint(juce::Graphics& g) {
    if (raster_.isValid())
        g.drawImage(raster_, getLocalBounds().toFloat());
    else
        g.fillAll(theme_.background);
}

void WaveformSurface::resized() {
    rerender();
}

void WaveformSurface::requestRender() {
    if (!batchingUpdates_)
        rerender();
}

void WaveformSurface::rerender() {
    ++renderCount_;

    const int width = getWidth();
    const int height = getHeight();
    if (width <= 0 || height <= 0) {
        raster_ = juce::Image();
        return;
    }

    // Match the display density so the image stays sharp
    const float scale = juce::Component::getApproximateScaleFactorForComponent(this);
    const int pixelWidth = juce::roundToInt(width * scale);
    const int pixelHeight = juce::roundToInt(height * scale);

    if (!raster_.isValid() || raster_.getWidth() != pixelWidth ||
        raster_.getHeight() != pixelHeight)
        raster_ = juce::Image(juce::Image::ARGB, pixelWidth, pixelHeight, true);
    else
        raster_.clear(raster_.getBounds());  // Start each frame from transparent

    {
        juce::Graphics g(raster_);
        g.addTransform(juce::AffineTransform::scale(scale));

        static const WaveformPeaks noPeaks;
        renderer_.render(g, static_cast<float>(width), static_cast<float>(height),
                         peaks_ ? *peaks_ : noPeaks, selection_.getSelection(),
                         playhead_.getCurrentTime());
    }

    repaint();
}

// ============================================================================
// Inputs
// ============================================================================

void WaveformSurface::setPeaks(std::shared_ptr<const WaveformPeaks> peaks) {
    if (peaks == peaks_)
        return;

    peaks_ = std::move(peaks);
    const double duration = peaks_ ? peaks_->durationSeconds : 0.0;

    {
        juce::ScopedValueSetter<bool> batching(batchingUpdates_, true);
        selection_.reset(duration);
        playhead_.setDuration(duration);
        playhead_.setCurrentTime(std::nullopt);
    }

    rerender();
}

void WaveformSurface::setSelectionStart(double seconds) {
    selection_.setStart(seconds);
}

void WaveformSurface::setSelectionEnd(double seconds) {
    selection_.setEnd(seconds);
}

void WaveformSurface::setCurrentTime(std::optional<double> seconds) {
    playhead_.setCurrentTime(seconds);
}

void WaveformSurface::setSeekEnabled(bool enabled) {
    playhead_.setSeekEnabled(enabled);
}

// ============================================================================
// Mouse interaction
// ============================================================================

void WaveformSurface::mouseDown(const juce::MouseEvent& event) {
    const double x = event.position.x;
    const double width = getWidth();

    if (!peaks_ || !CoordinateMapper::hasData(peaks_->durationSeconds, width))
        return;

    if (selection_.pointerDown(x, width)) {
        setMouseCursor(juce::MouseCursor::LeftRightResizeCursor);
        return;
    }

    if (playhead_.pointerDown(x, width)) {
        setMouseCursor(juce::MouseCursor::DraggingHandCursor);
        return;
    }

    // Click on the body seeks
    if (playhead_.isSeekEnabled())
        playhead_.seekTo(CoordinateMapper::xToTime(x, peaks_->durationSeconds, width));
}

void WaveformSurface::mouseDrag(const juce::MouseEvent& event) {
    const double x = event.position.x;
    const double width = getWidth();

    if (selection_.isDragging())
        selection_.pointerMove(x, width);
    else if (playhead_.isDragging())
        playhead_.pointerMove(x, width);
}

void WaveformSurface::mouseUp(const juce::MouseEvent& event) {
    selection_.pointerUp();
    playhead_.pointerUp();
    updateHoverCursor(event.position.x);
}

void WaveformSurface::mouseMove(const juce::MouseEvent& event) {
    if (isDragging())
        return;
    updateHoverCursor(event.position.x);
}

void WaveformSurface::mouseExit(const juce::MouseEvent& /*event*/) {
    if (!isDragging())
        setMouseCursor(juce::MouseCursor::NormalCursor);
}

void WaveformSurface::updateHoverCursor(float x) {
    const double width = getWidth();

    if (!peaks_ || !CoordinateMapper::hasData(peaks_->durationSeconds, width)) {
        setMouseCursor(juce::MouseCursor::NormalCursor);
        return;
    }

    if (selection_.hitTest(x, width) != DragTarget::None) {
        setMouseCursor(juce::MouseCursor::LeftRightResizeCursor);
    } else if (playhead_.hitTest(x, width)) {
        setMouseCursor(juce::MouseCursor::DraggingHandCursor);
    } else if (playhead_.isSeekEnabled()) {
        setMouseCursor(juce::MouseCursor::PointingHandCursor);
    } else {
        setMouseCursor(juce::MouseCursor::NormalCursor);
    }
}

}  // namespace wavetrim::ui
