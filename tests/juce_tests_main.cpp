#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include <cstdlib>
#include <iostream>

/**
 * @brief Entry point for wavetrim_juce_tests
 *
 * Test classes register themselves through static instances. This runs every test in
 * the "wavetrim" category on the message thread and returns non-zero on any failure.
 */

int main(int /*argc*/, char* /*argv*/[]) {
    // Timers, async callbacks and image rendering need the GUI subsystem
    juce::ScopedJuceInitialiser_GUI juceInit;

    juce::UnitTestRunner runner;
    runner.setAssertOnFailure(false);

    std::cout << "========================================\n";
    std::cout << "Running wavetrim JUCE Unit Tests\n";
    std::cout << "========================================\n\n";

    runner.runTestsInCategory("wavetrim");

    int numFailures = 0;
    for (int i = 0; i < runner.getNumResults(); ++i) {
        auto* result = runner.getResult(i);
        std::cout << result->unitTestName << " / " << result->subcategoryName << ": "
                  << result->passes << " passed, " << result->failures << " failed\n";
        numFailures += result->failures;
    }

    std::cout << "\n========================================\n";
    if (numFailures == 0)
        std::cout << "All tests PASSED!\n";
    else
        std::cout << "FAILED: " << numFailures << " test(s) failed\n";
    std::cout << "========================================\n";

    // Skip static destruction of JUCE singletons, the results are already printed
    std::cout.flush();
    std::_Exit(numFailures > 0 ? 1 : 0);
}
