#pragma once

#include <string>
#include <utility>

namespace wavetrim {

/**
 * @brief Outcome of a command sent to the audio engine
 */
struct CommandResult {
    bool success = false;
    std::string errorMessage;

    static CommandResult Success() {
        return {true, {}};
    }
    static CommandResult Failure(const std::string& msg) {
        return {false, msg};
    }
};

/**
 * @brief Outcome of an engine query that yields a value on success
 */
template <typename T>
struct ValueResult {
    bool success = false;
    std::string errorMessage;
    T value{};

    static ValueResult Success(T v) {
        return {true, {}, std::move(v)};
    }
    static ValueResult Failure(const std::string& msg) {
        return {false, msg, T{}};
    }
};

}  // namespace wavetrim
