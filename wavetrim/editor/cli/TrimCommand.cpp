#include "TrimCommand.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "engine/AudioFileProcessing.hpp"

namespace wavetrim::cli {

namespace {

constexpr const char* RULE = "----------------------------------------";

// Value of "--name=value", or the argument after the option
juce::String optionValue(const juce::ArgumentList& args, juce::StringRef option) {
    const int index = args.indexOfOption(option);
    if (index < 0)
        return {};

    const auto& arg = args.arguments.getReference(index);
    if (arg.isLongOption() && arg.text.containsChar('='))
        return arg.getLongOptionValue();

    if (index + 1 < args.size())
        return args.arguments.getReference(index + 1).text;
    return {};
}

juce::File resolveFile(const juce::String& path) {
    return juce::File::getCurrentWorkingDirectory().getChildFile(path);
}

bool parseSeconds(const juce::String& text, double& seconds) {
    const auto value = text.trim().toStdString();
    try {
        size_t consumed = 0;
        seconds = std::stod(value, &consumed);
        return consumed == value.size() && std::isfinite(seconds);
    } catch (const std::exception&) {
        return false;
    }
}

juce::String seconds2(double value) {
    return juce::String(value, 2);
}

}  // namespace

juce::String getUsage() {
    return "Usage: wavetrim_trim --input <file> --output <file.wav> --start <seconds> "
           "--end <seconds> [--verbose]\n"
           "\n"
           "  -i, --input    Input audio file (WAV, MP3, FLAC, OGG, ...)\n"
           "  -o, --output   Output WAV file, written as 32-bit float\n"
           "  -s, --start    Start time in seconds\n"
           "  -e, --end      End time in seconds\n"
           "  -v, --verbose  Show detailed information\n";
}

ValueResult<TrimOptions> parseTrimOptions(const juce::ArgumentList& args) {
    using Result = ValueResult<TrimOptions>;

    TrimOptions options;

    const auto input = optionValue(args, "--input|-i");
    if (input.isEmpty())
        return Result::Failure("Missing required option --input");
    options.input = resolveFile(input);

    const auto output = optionValue(args, "--output|-o");
    if (output.isEmpty())
        return Result::Failure("Missing required option --output");
    options.output = resolveFile(output);

    const auto start = optionValue(args, "--start|-s");
    if (start.isEmpty())
        return Result::Failure("Missing required option --start");
    if (!parseSeconds(start, options.range.startSeconds))
        return Result::Failure("Invalid start time: " + start.toStdString());

    const auto end = optionValue(args, "--end|-e");
    if (end.isEmpty())
        return Result::Failure("Missing required option --end");
    if (!parseSeconds(end, options.range.endSeconds))
        return Result::Failure("Invalid end time: " + end.toStdString());

    options.verbose = args.containsOption("--verbose|-v");
    return Result::Success(std::move(options));
}

int runTrim(const TrimOptions& options, std::ostream& out, std::ostream& err) {
    out << "Audio Trimmer" << std::endl << RULE << std::endl;

    // 1. Inspect the input
    if (options.verbose)
        out << std::endl << "Getting audio info..." << std::endl;

    auto info = AudioFileProcessing::readFileInfo(options.input);
    if (!info.success) {
        err << std::endl << "Error: " << info.errorMessage << std::endl;
        return 1;
    }

    const auto& file = info.value;
    out << std::endl
        << "Input File: " << options.input.getFullPathName() << std::endl
        << "   Duration: " << seconds2(file.durationSeconds) << " seconds ("
        << seconds2(file.durationSeconds / 60.0) << " minutes)" << std::endl
        << "   Sample Rate: " << juce::roundToInt(file.sampleRate) << " Hz" << std::endl
        << "   Channels: " << file.channels << std::endl
        << "   Format: " << file.formatName << std::endl;

    // 2. Validate the range
    auto check = options.range.validate();
    if (!check.success) {
        err << std::endl << "Error: " << check.errorMessage << std::endl;
        return 1;
    }

    out << std::endl
        << "Trim Range:" << std::endl
        << "   Start: " << seconds2(options.range.startSeconds) << "s" << std::endl
        << "   End: " << seconds2(options.range.endSeconds) << "s" << std::endl
        << "   Duration: " << seconds2(options.range.length()) << "s" << std::endl;

    check = options.range.validateAgainstDuration(file.durationSeconds);
    if (!check.success) {
        err << std::endl << "Error: " << check.errorMessage << std::endl;
        return 1;
    }

    // 3. Trim and write
    out << std::endl << "Trimming audio..." << std::endl;
    const double startMs = juce::Time::getMillisecondCounterHiRes();

    auto result =
        AudioFileProcessing::writeTrimmedFile(options.input, options.output, options.range);
    if (!result.success) {
        err << std::endl << "Error: " << result.errorMessage << std::endl;
        return 1;
    }

    const double elapsedSeconds = (juce::Time::getMillisecondCounterHiRes() - startMs) / 1000.0;

    if (options.verbose) {
        const auto span = options.range.toFrames(file.sampleRate, file.totalFrames);
        out << "   Trimmed to " << span.numFrames << " frames" << std::endl
            << "   New duration: "
            << seconds2(static_cast<double>(span.numFrames) / file.sampleRate) << "s"
            << std::endl
            << "   Write time: " << seconds2(elapsedSeconds) << "s" << std::endl;
    }

    out << std::endl
        << "✓ Done! Output saved to: " << options.output.getFullPathName() << std::endl
        << "   Total time: " << seconds2(elapsedSeconds) << "s" << std::endl;
    return 0;
}

}  // namespace wavetrim::cli
