#pragma once

#include <string>

namespace wavetrim {

/**
 * Editor settings: interaction thresholds, render constants and polling rate.
 * The application creates one instance and passes it by reference to the
 * components that need it.
 */
class EditorConfig {
  public:
    EditorConfig() = default;

    // Selection handles
    int getHandleWidthPixels() const {
        return handleWidthPixels;
    }
    void setHandleWidthPixels(int width) {
        handleWidthPixels = width;
    }

    int getHandleHitThresholdPixels() const {
        return handleHitThresholdPixels;
    }
    void setHandleHitThresholdPixels(int pixels) {
        handleHitThresholdPixels = pixels;
    }

    double getMinSelectionSeconds() const {
        return minSelectionSeconds;
    }
    void setMinSelectionSeconds(double seconds) {
        minSelectionSeconds = seconds;
    }

    // Playback polling
    int getPollIntervalMs() const {
        return pollIntervalMs;
    }
    void setPollIntervalMs(int ms) {
        pollIntervalMs = ms;
    }

    // Peak loading and drawing
    int getTargetPeakCount() const {
        return targetPeakCount;
    }
    void setTargetPeakCount(int count) {
        targetPeakCount = count;
    }

    double getPeakVerticalScale() const {
        return peakVerticalScale;
    }
    void setPeakVerticalScale(double scale) {
        peakVerticalScale = scale;
    }

    float getDimmingAlpha() const {
        return dimmingAlpha;
    }
    void setDimmingAlpha(float alpha) {
        dimmingAlpha = alpha;
    }

    // Save/Load Configuration
    bool saveToFile(const std::string& filename) const;
    void loadFromFile(const std::string& filename);

    // Applies a single key=value pair, returns false if the value was rejected
    bool parseConfigLine(const std::string& key, const std::string& value);

  private:
    int handleWidthPixels = 8;
    int handleHitThresholdPixels = 12;
    double minSelectionSeconds = 0.1;

    int pollIntervalMs = 50;  // 20Hz

    int targetPeakCount = 2000;
    double peakVerticalScale = 0.9;  // Keeps full-scale peaks off the frame edge
    float dimmingAlpha = 0.3f;
};

}  // namespace wavetrim
