#pragma once

#include <juce_graphics/juce_graphics.h>

namespace wavetrim {

/**
 * @brief Colours used to draw the waveform surface
 *
 * Passed to WaveformSurface at construction and owned by it for its lifetime.
 * The playhead colour must differ from the handle colour.
 */
struct WaveformTheme {
    static constexpr auto PARCHMENT = 0xFFF4ECD8;  // Background
    static constexpr auto INK_DARK = 0xFF2C1810;   // Peaks and selection labels
    static constexpr auto BURGUNDY = 0xFF800020;   // Selection handles
    static constexpr auto PLAYHEAD = 0xFF00CED1;   // Bright cyan, contrasts with burgundy

    juce::Colour background{PARCHMENT};
    juce::Colour waveform{INK_DARK};
    juce::Colour dimming{juce::Colours::black};  // Alpha comes from EditorConfig
    juce::Colour handle{BURGUNDY};
    juce::Colour playhead{PLAYHEAD};
    juce::Colour label{INK_DARK};

    float labelFontHeight = 12.0f;

    static WaveformTheme parchment() {
        return {};
    }

    bool hasDistinctPlayhead() const {
        return playhead != handle;
    }
};

}  // namespace wavetrim
