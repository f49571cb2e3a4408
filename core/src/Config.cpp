#include "arcfortune/Config.h"
#include "arcfortune/Errors.h"

#include <cctype>
#include <limits>
#include <string>

namespace arcfortune {

namespace {

std::vector<std::string> split_on(const std::string& value, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : value) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

void check_smoothing(const SmoothingSpec& spec, const std::string& what) {
    if (spec.degree < 0) {
        throw ConfigError(what + ": polynomial degree must be non-negative");
    }
    if (spec.window <= static_cast<std::size_t>(spec.degree)) {
        throw ConfigError(what + ": window " + std::to_string(spec.window) +
                          " must exceed degree " + std::to_string(spec.degree));
    }
}

void check_unique_windows(const std::vector<std::size_t>& windows, const std::string& what) {
    for (std::size_t i = 0; i < windows.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (windows[i] == windows[j]) {
                throw ConfigError(what + ": window " + std::to_string(windows[i]) + " is listed twice");
            }
        }
    }
}

std::vector<std::size_t> smoothing_windows(const std::vector<SmoothingSpec>& specs) {
    std::vector<std::size_t> windows;
    windows.reserve(specs.size());
    for (const auto& spec : specs) windows.push_back(spec.window);
    return windows;
}

}  // namespace

std::size_t parse_count(const std::string& value, const std::string& option) {
    if (value.empty()) {
        throw ConfigError(option + ": expected a number");
    }
    std::size_t out = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError(option + ": '" + value + "' is not a non-negative integer");
        }
        const std::size_t digit = static_cast<std::size_t>(c - '0');
        if (out > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            throw ConfigError(option + ": '" + value + "' is out of range");
        }
        out = out * 10 + digit;
    }
    return out;
}

std::vector<std::size_t> parse_window_list(const std::string& value) {
    std::vector<std::size_t> windows;
    for (const auto& part : split_on(value, ',')) {
        const std::size_t w = parse_count(part, "--rolling");
        if (w == 0) {
            throw ConfigError("--rolling: window must be positive");
        }
        windows.push_back(w);
    }
    check_unique_windows(windows, "--rolling");
    return windows;
}

std::vector<SmoothingSpec> parse_smoothing_list(const std::string& value) {
    std::vector<SmoothingSpec> specs;
    for (const auto& part : split_on(value, ',')) {
        const auto fields = split_on(part, ':');
        if (fields.size() != 2) {
            throw ConfigError("--smoothing: expected WINDOW:DEGREE, got '" + part + "'");
        }
        SmoothingSpec spec;
        spec.window = parse_count(fields[0], "--smoothing");
        const std::size_t degree = parse_count(fields[1], "--smoothing");
        if (degree > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            throw ConfigError("--smoothing: degree out of range");
        }
        spec.degree = static_cast<int>(degree);
        check_smoothing(spec, "--smoothing");
        specs.push_back(spec);
    }
    check_unique_windows(smoothing_windows(specs), "--smoothing");
    return specs;
}

void validate_config(const PipelineConfig& config) {
    if (config.minWords < 0) {
        throw ConfigError("min-words must be non-negative");
    }
    for (std::size_t w : config.rollingWindows) {
        if (w == 0) {
            throw ConfigError("rolling window must be positive");
        }
    }
    check_unique_windows(config.rollingWindows, "rolling");
    for (const auto& spec : config.smoothing) {
        check_smoothing(spec, "smoothing");
    }
    check_unique_windows(smoothing_windows(config.smoothing), "smoothing");
    check_smoothing(SmoothingSpec{config.macroWindow, config.macroDegree}, "macro-window");
    if (config.batchSize == 0) {
        throw ConfigError("batch-size must be positive");
    }
    if (config.maxRetries < 0) {
        throw ConfigError("retries must be non-negative");
    }
    if (config.maxWorkers == 0) {
        throw ConfigError("max-workers must be positive");
    }
    if (config.outputPath.empty()) {
        throw ConfigError("output path must not be empty");
    }
}

}  // namespace arcfortune
