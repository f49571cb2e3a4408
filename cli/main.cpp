/// @file
/// @brief CLI entry point: rank a corpus of works by narrative fortune.

#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "arcfortune/Config.h"
#include "arcfortune/Errors.h"
#include "arcfortune/FortuneEngine.h"
#include "arcfortune/segmentation/SentenceSplitter.h"
#include "arcfortune/sentiment/ClassifierHandle.h"
#include "arcfortune/sentiment/LexiconClassifier.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
    arcfortune::PipelineConfig config;
    std::vector<std::string> inputs;
};

/// @brief Print usage information.
void printUsage(std::FILE* out) {
    std::fprintf(out, "arcfortune - Narrative fortune analysis for a corpus of texts\n\n");
    std::fprintf(out, "Usage: arcfortune [options] FILE [FILE...]\n\n");
    std::fprintf(out, "Options:\n");
    std::fprintf(out, "  --min-words N          Keep sentences with more than N words (default 3)\n");
    std::fprintf(out, "  --rolling W[,W...]     Moving-average windows (default 20,100)\n");
    std::fprintf(out, "  --smoothing W:D[,...]  Savitzky-Golay window:degree pairs (default 51:3,201:3)\n");
    std::fprintf(out, "  --macro-window W       Macro Arc max window (default 201)\n");
    std::fprintf(out, "  --lexicon FILE         Sentiment lexicon (default vader_lexicon.txt)\n");
    std::fprintf(out, "  -o, --output FILE      Artifact database (default arcfortune.db)\n");
    std::fprintf(out, "  --max-workers N        Worker threads (default 5)\n");
    std::fprintf(out, "  --batch-size N         Classifier batch size (default 32)\n");
    std::fprintf(out, "  --retries N            Retries for transient classifier failures (default 2)\n");
    std::fprintf(out, "  -h, --help             Show this help\n");
}

/// @brief Value following an option, or ConfigError when argv ends.
const char* requireValue(int argc, char* argv[], int& idx) {
    if (idx + 1 >= argc) {
        throw arcfortune::ConfigError(std::string(argv[idx]) + ": missing value");
    }
    return argv[++idx];
}

/// @brief Parse command-line arguments into CliOptions.
/// @return False if --help was requested (caller should exit cleanly).
/// @throws arcfortune::ConfigError on unknown options or malformed values.
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    auto& config = opts.config;
    for (int idx = 1; idx < argc; ++idx) {
        const char* arg = argv[idx];
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage(stdout);
            return false;
        }
        if (std::strcmp(arg, "--min-words") == 0) {
            const std::size_t n = arcfortune::parse_count(requireValue(argc, argv, idx), "--min-words");
            if (n > 1000000) {
                throw arcfortune::ConfigError("--min-words: value out of range");
            }
            config.minWords = static_cast<int>(n);
        } else if (std::strcmp(arg, "--rolling") == 0) {
            config.rollingWindows = arcfortune::parse_window_list(requireValue(argc, argv, idx));
        } else if (std::strcmp(arg, "--smoothing") == 0) {
            config.smoothing = arcfortune::parse_smoothing_list(requireValue(argc, argv, idx));
        } else if (std::strcmp(arg, "--macro-window") == 0) {
            config.macroWindow = arcfortune::parse_count(requireValue(argc, argv, idx), "--macro-window");
        } else if (std::strcmp(arg, "--lexicon") == 0) {
            config.lexiconPath = requireValue(argc, argv, idx);
        } else if (std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0) {
            config.outputPath = requireValue(argc, argv, idx);
        } else if (std::strcmp(arg, "--max-workers") == 0) {
            config.maxWorkers = arcfortune::parse_count(requireValue(argc, argv, idx), "--max-workers");
        } else if (std::strcmp(arg, "--batch-size") == 0) {
            config.batchSize = arcfortune::parse_count(requireValue(argc, argv, idx), "--batch-size");
        } else if (std::strcmp(arg, "--retries") == 0) {
            const std::size_t n = arcfortune::parse_count(requireValue(argc, argv, idx), "--retries");
            if (n > 100) {
                throw arcfortune::ConfigError("--retries: value out of range");
            }
            config.maxRetries = static_cast<int>(n);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            throw arcfortune::ConfigError(std::string("unknown option ") + arg);
        } else {
            opts.inputs.emplace_back(arg);
        }
    }
    return true;
}

void printRanking(const arcfortune::CorpusRunSummary& summary) {
    std::printf("\nNarrative fortune ranking:\n");
    for (const auto& entry : summary.ranking.entries) {
        std::printf("  %2zu. %-32s %10.4f  %s\n",
                    entry.rank + 1,
                    entry.work.title.c_str(),
                    entry.work.ultimateFortune,
                    entry.colorString.c_str());
    }
    for (const auto& failure : summary.failures) {
        std::printf("  failed: %s (%s): %s\n", failure.workId.c_str(), failure.stage.c_str(),
                    failure.message.c_str());
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        if (!parseArgs(argc, argv, opts)) {
            return 0;
        }
        arcfortune::validate_config(opts.config);
        if (opts.inputs.empty()) {
            throw arcfortune::ConfigError("no input files");
        }
    } catch (const arcfortune::ConfigError& e) {
        std::fprintf(stderr, "arcfortune: %s\n\n", e.what());
        printUsage(stderr);
        return 2;
    }

    const std::string lexiconPath = opts.config.lexiconPath;
    arcfortune::sentiment::ClassifierHandle handle(
        [lexiconPath]() { return arcfortune::sentiment::LexiconClassifier::load(lexiconPath); });

    std::shared_ptr<const arcfortune::sentiment::SentimentClassifier> classifier;
    try {
        classifier = handle.acquire();
    } catch (const arcfortune::ClassifierError& e) {
        std::fprintf(stderr, "arcfortune: classifier unavailable: %s\n", e.what());
        return 1;
    }
    std::printf("[arcfortune] Loaded %s classifier from %s\n", classifier->name().c_str(), lexiconPath.c_str());

    std::unique_ptr<arcfortune::FortuneEngine> engine;
    try {
        engine = std::make_unique<arcfortune::FortuneEngine>(
            opts.config.outputPath, opts.config, classifier,
            std::make_shared<arcfortune::segmentation::RuleSentenceSplitter>());
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "arcfortune: cannot open artifact store: %s\n", e.what());
        return 1;
    }

    int status = 0;
    try {
        const auto summary = engine->run_corpus(opts.inputs);
        printRanking(summary);
        std::printf("\nArtifacts written to %s\n", opts.config.outputPath.c_str());
    } catch (const arcfortune::ConfigError& e) {
        std::fprintf(stderr, "arcfortune: %s\n", e.what());
        status = 2;
    } catch (const arcfortune::AggregationError& e) {
        std::fprintf(stderr, "arcfortune: %s\n", e.what());
        status = 1;
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "arcfortune: export failed: %s\n", e.what());
        status = 1;
    }

    engine.reset();
    classifier.reset();
    handle.release();
    return status;
}
