#pragma once

#include <chrono>
#include <map>
#include <string>

struct Settings {
    // Upper bound for any duration read from configuration
    static constexpr double MaxSeconds = 24 * 60 * 60;

    std::chrono::milliseconds requestTimeout{10000};
    // Minimum seconds between outbound requests; <= 0 disables pacing
    double requestRateLimit = 0.5;
    int requestMaxRetries = 2;

    size_t poolMaxHosts = 10;
    size_t poolMaxPerHost = 20;
    double backoffFactor = 1.0;

    std::string logLevel = "info";

    // Reads KEY=VALUE lines from envFile (when it exists), then lets the process
    // environment override them. Throws std::invalid_argument on a malformed value.
    static Settings load(const std::string& envFile = ".env");

    // Applies recognized keys from a map; unknown keys are ignored.
    void apply(const std::map<std::string, std::string>& values);

    static std::map<std::string, std::string> readEnvFile(const std::string& path);
};
