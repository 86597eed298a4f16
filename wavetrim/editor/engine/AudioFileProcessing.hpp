#pragma once

#include <juce_audio_formats/juce_audio_formats.h>

#include "core/CommandResult.hpp"
#include "core/TrimRange.hpp"
#include "core/WaveformPeaks.hpp"

namespace wavetrim {

/**
 * @brief Blocking file work behind getWaveformPeaks and trimAudioFile
 *
 * Safe to call from any thread: each call uses its own AudioFormatManager and reader.
 * The engine client runs these on its worker pool.
 */
namespace AudioFileProcessing {

/** What a reader reports about a file before any samples are decoded. */
struct AudioFileInfo {
    double durationSeconds = 0.0;
    double sampleRate = 0.0;
    int channels = 0;
    juce::int64 totalFrames = 0;
    juce::String formatName;
};

ValueResult<AudioFileInfo> readFileInfo(const juce::File& file);

/**
 * Summarise a file into numPeaks min/max buckets.
 * Channels are merged; buckets with no frames are reported as 0.
 */
ValueResult<WaveformPeaks> extractWaveformPeaks(const juce::File& file, int numPeaks);

/**
 * Write [range.startSeconds, range.endSeconds] of input to output as 32-bit float WAV.
 * The range is checked against the file duration before anything is written, and the
 * output is only replaced once the whole range has been written.
 */
CommandResult writeTrimmedFile(const juce::File& input, const juce::File& output,
                               const TrimRange& range);

/** Extensions offered for opening, limited to those a registered format can read. */
juce::StringArray getSupportedExtensions();

/** getSupportedExtensions() as a FileChooser wildcard: "*.wav;*.flac;..." */
juce::String getSupportedFilePatterns();

constexpr int TRIM_OUTPUT_BITS = 32;

}  // namespace AudioFileProcessing

}  // namespace wavetrim
