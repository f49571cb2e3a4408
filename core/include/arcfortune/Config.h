#pragma once

#include "arcfortune/CoreContract.h"

#include <cstddef>
#include <string>
#include <vector>

namespace arcfortune {

struct SmoothingSpec {
    std::size_t window{0};
    int degree{0};
};

/**
 * PipelineConfig: every tunable of a corpus run
 *
 * Defaults come from CoreContract.h. The CLI overrides them from argv and
 * calls validate_config() before any work is processed.
 */
struct PipelineConfig {
    int minWords{contract::MIN_WORDS_EXCLUSIVE};
    std::vector<std::size_t> rollingWindows{contract::ROLLING_WINDOW_SCENE, contract::ROLLING_WINDOW_ACT};
    std::vector<SmoothingSpec> smoothing{{contract::SAVGOL_WINDOW_SCENE, contract::SAVGOL_DEGREE},
                                         {contract::SAVGOL_WINDOW_MACRO, contract::SAVGOL_DEGREE}};
    std::size_t macroWindow{contract::MACRO_ARC_MAX_WINDOW};
    int macroDegree{contract::SAVGOL_DEGREE};

    std::size_t batchSize{contract::DEFAULT_BATCH_SIZE};
    int maxRetries{contract::DEFAULT_MAX_RETRIES};
    std::size_t maxWorkers{contract::DEFAULT_MAX_WORKERS};

    std::string lexiconPath{"vader_lexicon.txt"};
    std::string outputPath{"arcfortune.db"};
};

// Throws ConfigError describing the first invalid field.
void validate_config(const PipelineConfig& config);

// "20,100" -> {20, 100}. Throws ConfigError on malformed, non-positive or repeated entries.
std::vector<std::size_t> parse_window_list(const std::string& value);

// "51:3,201:3" -> {{51,3},{201,3}}. Throws ConfigError on malformed entries or a repeated window.
std::vector<SmoothingSpec> parse_smoothing_list(const std::string& value);

// Strict non-negative integer parse. Throws ConfigError naming the option.
std::size_t parse_count(const std::string& value, const std::string& option);

}  // namespace arcfortune
