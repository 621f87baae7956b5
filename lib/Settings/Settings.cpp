#include "Settings.hpp"

#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "StringUtils.hpp"

namespace {

const char* const RecognizedKeys[] = {"REQUEST_TIMEOUT", "REQUEST_RATE_LIMIT",
                                      "REQUEST_MAX_RETRIES", "LOG_LEVEL"};

double parseSeconds(const std::string& key, const std::string& value) {
    size_t used = 0;
    double seconds = 0;
    try {
        seconds = std::stod(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(key + ": expected a number of seconds, got '" + value + "'");
    }
    if (used != value.size() || !std::isfinite(seconds)) {
        throw std::invalid_argument(key + ": expected a number of seconds, got '" + value + "'");
    }
    if (seconds > Settings::MaxSeconds) {
        throw std::invalid_argument(key + ": must not exceed " +
                                    std::to_string(static_cast<int>(Settings::MaxSeconds)) +
                                    " seconds, got '" + value + "'");
    }
    return seconds;
}

int parseCount(const std::string& key, const std::string& value) {
    size_t used = 0;
    int count = 0;
    try {
        count = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(key + ": expected an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(key + ": expected an integer, got '" + value + "'");
    }
    return count;
}

}  // namespace

std::map<std::string, std::string> Settings::readEnvFile(const std::string& path) {
    std::map<std::string, std::string> values;
    std::ifstream in(path);
    if (!in) {
        return values;
    }
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("Ignoring malformed line in {}: {}", path, line);
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        values[key] = value;
    }
    return values;
}

void Settings::apply(const std::map<std::string, std::string>& values) {
    for (const auto& [key, raw] : values) {
        std::string value = trim(raw);
        if (key == "REQUEST_TIMEOUT") {
            double seconds = parseSeconds(key, value);
            if (seconds <= 0) {
                throw std::invalid_argument(key + ": must be positive, got '" + value + "'");
            }
            requestTimeout = std::chrono::milliseconds(std::llround(seconds * 1000.0));
            if (requestTimeout.count() <= 0) {
                throw std::invalid_argument(key + ": must be at least 1ms, got '" + value + "'");
            }
        } else if (key == "REQUEST_RATE_LIMIT") {
            requestRateLimit = parseSeconds(key, value);
        } else if (key == "REQUEST_MAX_RETRIES") {
            int retries = parseCount(key, value);
            if (retries < 0) {
                throw std::invalid_argument(key + ": must not be negative, got '" + value + "'");
            }
            requestMaxRetries = retries;
        } else if (key == "LOG_LEVEL") {
            logLevel = value;
        }
    }
}

Settings Settings::load(const std::string& envFile) {
    std::map<std::string, std::string> values = readEnvFile(envFile);
    for (const char* key : RecognizedKeys) {
        if (const char* value = std::getenv(key)) {
            values[key] = value;
        }
    }
    Settings settings;
    settings.apply(values);
    return settings;
}
