#include "AudioFileProcessing.hpp"

#include <vector>

namespace wavetrim::AudioFileProcessing {

namespace {

// .m4a only has a reader on macOS/iOS (CoreAudio)
const char* const CANDIDATE_EXTENSIONS[] = {".mp3", ".wav", ".flac", ".m4a", ".ogg"};

void registerFormats(juce::AudioFormatManager& formatManager) {
    formatManager.registerBasicFormats();
}

std::unique_ptr<juce::AudioFormatReader> openReader(const juce::File& file,
                                                    juce::String& error) {
    if (!file.existsAsFile()) {
        error = "File not found: " + file.getFullPathName();
        return nullptr;
    }

    juce::AudioFormatManager formatManager;
    registerFormats(formatManager);

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager.createReaderFor(file));
    if (reader == nullptr) {
        error = "Unsupported or unreadable audio file: " + file.getFileName();
        return nullptr;
    }

    if (reader->sampleRate <= 0.0 || reader->lengthInSamples <= 0 ||
        reader->numChannels == 0) {
        error = "Audio file contains no samples: " + file.getFileName();
        return nullptr;
    }
    return reader;
}

}  // namespace

juce::StringArray getSupportedExtensions() {
    juce::AudioFormatManager formatManager;
    registerFormats(formatManager);

    juce::StringArray extensions;
    for (const auto* extension : CANDIDATE_EXTENSIONS)
        if (formatManager.findFormatForFileExtension(extension) != nullptr)
            extensions.add(extension);
    return extensions;
}

juce::String getSupportedFilePatterns() {
    juce::StringArray patterns;
    for (const auto& extension : getSupportedExtensions())
        patterns.add("*" + extension);
    return patterns.joinIntoString(";");
}

ValueResult<AudioFileInfo> readFileInfo(const juce::File& file) {
    juce::String error;
    auto reader = openReader(file, error);
    if (reader == nullptr)
        return ValueResult<AudioFileInfo>::Failure(error.toStdString());

    AudioFileInfo info;
    info.sampleRate = reader->sampleRate;
    info.channels = static_cast<int>(reader->numChannels);
    info.totalFrames = reader->lengthInSamples;
    info.durationSeconds = static_cast<double>(reader->lengthInSamples) / reader->sampleRate;
    info.formatName = reader->getFormatName();
    return ValueResult<AudioFileInfo>::Success(std::move(info));
}

ValueResult<WaveformPeaks> extractWaveformPeaks(const juce::File& file, int numPeaks) {
    if (numPeaks <= 0)
        return ValueResult<WaveformPeaks>::Failure("num_peaks must be greater than 0");

    juce::String error;
    auto reader = openReader(file, error);
    if (reader == nullptr)
        return ValueResult<WaveformPeaks>::Failure(error.toStdString());

    const auto totalFrames = reader->lengthInSamples;
    const auto numChannels = static_cast<int>(reader->numChannels);
    const double framesPerPeak = static_cast<double>(totalFrames) / numPeaks;

    WaveformPeaks peaks;
    peaks.numPeaks = static_cast<size_t>(numPeaks);
    peaks.minPeaks.assign(peaks.numPeaks, 0.0f);
    peaks.maxPeaks.assign(peaks.numPeaks, 0.0f);
    peaks.durationSeconds = static_cast<double>(totalFrames) / reader->sampleRate;
    peaks.sampleRate = reader->sampleRate;
    peaks.channels = numChannels;

    std::vector<juce::Range<float>> channelLevels(static_cast<size_t>(numChannels));

    for (int i = 0; i < numPeaks; ++i) {
        auto first = static_cast<juce::int64>(i * framesPerPeak);
        auto last = static_cast<juce::int64>((i + 1) * framesPerPeak);
        last = juce::jmin(last, totalFrames);
        if (last <= first)
            continue;  // Fewer frames than buckets

        reader->readMaxLevels(first, last - first, channelLevels.data(), numChannels);

        auto combined = channelLevels[0];
        for (int ch = 1; ch < numChannels; ++ch)
            combined = combined.getUnionWith(channelLevels[static_cast<size_t>(ch)]);

        const auto index = static_cast<size_t>(i);
        peaks.minPeaks[index] = juce::jlimit(-1.0f, 1.0f, combined.getStart());
        peaks.maxPeaks[index] = juce::jlimit(-1.0f, 1.0f, combined.getEnd());
    }

    DBG("AudioFileProcessing: " << numPeaks << " peaks from " << file.getFileName() << " ("
                                << peaks.durationSeconds << "s, " << numChannels << " ch)");
    return ValueResult<WaveformPeaks>::Success(std::move(peaks));
}

CommandResult writeTrimmedFile(const juce::File& input, const juce::File& output,
                               const TrimRange& range) {
    auto check = range.validate();
    if (!check.success)
        return check;

    juce::String error;
    auto reader = openReader(input, error);
    if (reader == nullptr)
        return CommandResult::Failure(error.toStdString());

    const double duration = static_cast<double>(reader->lengthInSamples) / reader->sampleRate;
    check = range.validateAgainstDuration(duration);
    if (!check.success)
        return check;

    const auto span = range.toFrames(reader->sampleRate, reader->lengthInSamples);

    // Write next to the target and swap in only on success
    juce::TemporaryFile temp(output);
    {
        std::unique_ptr<juce::FileOutputStream> stream(temp.getFile().createOutputStream());
        if (stream == nullptr)
            return CommandResult::Failure("Failed to open output file: " +
                                          output.getFullPathName().toStdString());

        juce::WavAudioFormat wavFormat;
        std::unique_ptr<juce::AudioFormatWriter> writer(
            wavFormat.createWriterFor(stream.get(), reader->sampleRate, reader->numChannels,
                                      TRIM_OUTPUT_BITS, {}, 0));
        if (writer == nullptr)
            return CommandResult::Failure("Failed to create WAV writer for: " +
                                          output.getFullPathName().toStdString());
        stream.release();  // Owned by the writer now

        if (!writer->writeFromAudioReader(*reader, span.startFrame, span.numFrames))
            return CommandResult::Failure("Failed to write trimmed audio to: " +
                                          output.getFullPathName().toStdString());
    }

    if (!temp.overwriteTargetFileWithTemporary())
        return CommandResult::Failure("Failed to replace output file: " +
                                      output.getFullPathName().toStdString());

    return CommandResult::Success();
}

}  // namespace wavetrim::AudioFileProcessing
