#pragma once

#include <juce_core/juce_core.h>

#include <ostream>

#include "core/CommandResult.hpp"
#include "core/TrimRange.hpp"

namespace wavetrim::cli {

/**
 * @brief Arguments of one wavetrim_trim run
 */
struct TrimOptions {
    juce::File input;
    juce::File output;
    TrimRange range;
    bool verbose = false;
};

/**
 * @brief Reads --input/-i, --output/-o, --start/-s, --end/-e and --verbose/-v
 *
 * Values follow their option ("--start 1.5") or are attached to a long option
 * ("--start=1.5"). Relative paths resolve against the working directory. The range is
 * only parsed here, not validated.
 */
ValueResult<TrimOptions> parseTrimOptions(const juce::ArgumentList& args);

/**
 * @brief Prints the input file's details, validates the range and writes the trim
 *
 * Progress goes to out, errors to err.
 * @return Process exit code, 0 on success
 */
int runTrim(const TrimOptions& options, std::ostream& out, std::ostream& err);

juce::String getUsage();

}  // namespace wavetrim::cli
