#include <juce_core/juce_core.h>

#include <iostream>

#include "cli/TrimCommand.hpp"

int main(int argc, char* argv[]) {
    const juce::ArgumentList args(argc, argv);

    if (args.size() == 0 || args.containsOption("--help|-h")) {
        std::cout << wavetrim::cli::getUsage() << std::endl;
        return 0;
    }

    return juce::ConsoleApplication::invokeCatchingFailures([&args]() {
        auto options = wavetrim::cli::parseTrimOptions(args);
        if (!options.success)
            juce::ConsoleApplication::fail("Error: " + juce::String(options.errorMessage) +
                                               "\n\n" + wavetrim::cli::getUsage(),
                                           2);

        return wavetrim::cli::runTrim(options.value, std::cout, std::cerr);
    });
}
