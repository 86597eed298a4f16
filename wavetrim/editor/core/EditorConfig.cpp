#include "EditorConfig.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace wavetrim {

namespace {

double parseNumber(const std::string& value) {
    size_t consumed = 0;
    double number = std::stod(value, &consumed);
    if (consumed != value.size())
        throw std::invalid_argument("trailing characters");
    return number;
}

std::string trimmed(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return {};
    auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

}  // namespace

bool EditorConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file for writing: " << filename << std::endl;
        return false;
    }

    file << "handleWidthPixels=" << handleWidthPixels << std::endl;
    file << "handleHitThresholdPixels=" << handleHitThresholdPixels << std::endl;
    file << "minSelectionSeconds=" << minSelectionSeconds << std::endl;
    file << "pollIntervalMs=" << pollIntervalMs << std::endl;
    file << "targetPeakCount=" << targetPeakCount << std::endl;
    file << "peakVerticalScale=" << peakVerticalScale << std::endl;
    file << "dimmingAlpha=" << dimmingAlpha << std::endl;

    file.close();
    std::cout << "Config saved to: " << filename << std::endl;
    return true;
}

void EditorConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Config file not found, using defaults: " << filename << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        parseConfigLine(trimmed(line.substr(0, equalPos)), trimmed(line.substr(equalPos + 1)));
    }

    file.close();
    std::cout << "Config loaded from: " << filename << std::endl;
}

bool EditorConfig::parseConfigLine(const std::string& key, const std::string& value) {
    static const char* const knownKeys[] = {
        "handleWidthPixels", "handleHitThresholdPixels", "minSelectionSeconds", "pollIntervalMs",
        "targetPeakCount",   "peakVerticalScale",        "dimmingAlpha"};

    bool known = false;
    for (auto* knownKey : knownKeys)
        known = known || key == knownKey;
    if (!known)
        return true;  // Skip unknown keys silently

    try {
        double numValue = parseNumber(value);

        if (key == "handleWidthPixels") {
            if (numValue < 1)
                throw std::out_of_range("must be at least 1");
            handleWidthPixels = static_cast<int>(numValue);
        } else if (key == "handleHitThresholdPixels") {
            if (numValue < 0)
                throw std::out_of_range("must not be negative");
            handleHitThresholdPixels = static_cast<int>(numValue);
        } else if (key == "minSelectionSeconds") {
            if (numValue <= 0)
                throw std::out_of_range("must be positive");
            minSelectionSeconds = numValue;
        } else if (key == "pollIntervalMs") {
            if (numValue < 1)
                throw std::out_of_range("must be at least 1");
            pollIntervalMs = static_cast<int>(numValue);
        } else if (key == "targetPeakCount") {
            if (numValue < 1)
                throw std::out_of_range("must be at least 1");
            targetPeakCount = static_cast<int>(numValue);
        } else if (key == "peakVerticalScale") {
            if (numValue <= 0 || numValue > 1)
                throw std::out_of_range("must be in (0, 1]");
            peakVerticalScale = numValue;
        } else if (key == "dimmingAlpha") {
            if (numValue < 0 || numValue > 1)
                throw std::out_of_range("must be in [0, 1]");
            dimmingAlpha = static_cast<float>(numValue);
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
        return false;
    }
}

}  // namespace wavetrim
