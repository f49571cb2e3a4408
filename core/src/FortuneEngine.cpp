#include "arcfortune/FortuneEngine.h"
#include "arcfortune/Errors.h"
#include "arcfortune/Utility.h"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <exception>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace arcfortune {

namespace {

struct WorkOutcome {
    std::optional<WorkAnalysis> analysis;
    std::optional<WorkFailure> failure;
};

void log_issues(const WorkAnalysis& analysis) {
    for (const auto& issue : analysis.issues) {
        std::fprintf(stderr, "[FortuneEngine] WARNING: %s: %s%s%s (%s)\n",
                     analysis.work.workId.c_str(),
                     issue.type.c_str(),
                     issue.curve.empty() ? "" : " ",
                     issue.curve.c_str(),
                     issue.explanation.c_str());
    }
}

}  // namespace

FortuneEngine::FortuneEngine(std::string databasePath,
                             PipelineConfig config,
                             std::shared_ptr<const sentiment::SentimentClassifier> classifier,
                             std::shared_ptr<const segmentation::SentenceSplitter> splitter)
    : config_(std::move(config)),
      segmenter_(std::move(splitter), config_.minWords),
      scorer_(std::move(classifier), config_.batchSize, config_.maxRetries),
      curveEngine_(config_),
      store_(std::make_unique<SQLiteStore>(std::move(databasePath))) {
    store_->initialize();
}

WorkAnalysis FortuneEngine::runPipeline(const WorkAnalysisRequest& request, std::string& stage) const {
    WorkAnalysis analysis;
    analysis.work.workId = request.workId;
    analysis.work.title = request.title.empty() ? title_from_work_id(request.workId) : request.title;
    analysis.work.sourcePath = request.sourcePath;

    // Step 1: sentences (empty is a valid degenerate work)
    stage = "segment";
    analysis.work.sentences = segmenter_.segment(request.text);

    // Step 2: raw scores, index-aligned with the sentences
    stage = "score";
    analysis.scores = scorer_.score(analysis.work.sentences);

    // Step 3: both metric families
    stage = "metrics";
    analysis.volatility = curveEngine_.build_volatility(analysis.scores);
    analysis.cumulative = curveEngine_.build_cumulative(analysis.scores);

    // Step 4: summary for the aggregator
    WorkResult& summary = analysis.summary;
    summary.workId = analysis.work.workId;
    summary.title = analysis.work.title;
    summary.sentenceCount = analysis.work.sentences.size();
    const auto& running = analysis.cumulative.running.values;
    summary.ultimateFortune = running.empty() ? 0.0 : running.back();
    const auto& macro = analysis.cumulative.macroArc;
    if (!macro.omitted && !macro.values.empty()) {
        summary.macroArcFinal = macro.values.back();
    }

    // Step 5: diagnostics
    analysis.issues = diagnostics_.detect(analysis);
    log_issues(analysis);

    return analysis;
}

WorkAnalysis FortuneEngine::analyze(const WorkAnalysisRequest& request) const {
    std::string stage;
    return runPipeline(request, stage);
}

WorkAnalysis FortuneEngine::analyze_and_store(const WorkAnalysisRequest& request) {
    WorkAnalysis analysis = analyze(request);
    store_->save_work(analysis);
    return analysis;
}

CorpusRunSummary FortuneEngine::run_corpus(const std::vector<std::string>& paths) {
    // Work ids name the exported bundles, so two inputs may not share one
    std::unordered_map<std::string, std::string> seen;
    for (const auto& path : paths) {
        const auto inserted = seen.emplace(work_id_from_path(path), path);
        if (!inserted.second) {
            throw ConfigError("Inputs '" + inserted.first->second + "' and '" + path +
                              "' share work id '" + inserted.first->first + "'");
        }
    }

    std::vector<WorkOutcome> outcomes(paths.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        while (true) {
            const std::size_t idx = next.fetch_add(1);
            if (idx >= paths.size()) break;

            const std::string& path = paths[idx];
            WorkOutcome& outcome = outcomes[idx];
            const std::string workId = work_id_from_path(path);
            std::string stage = "ingest";
            try {
                WorkAnalysisRequest request;
                request.workId = workId;
                request.title = title_from_work_id(workId);
                request.sourcePath = path;
                request.text = read_text_file(path);
                WorkAnalysis analysis = runPipeline(request, stage);
                if (analysis.work.sentences.empty()) {
                    outcome.failure = WorkFailure{workId, path, "segment", "no sentences"};
                } else {
                    outcome.analysis = std::move(analysis);
                }
            } catch (const std::exception& e) {
                outcome.failure = WorkFailure{workId, path, stage, e.what()};
            }
        }
    };

    const std::size_t numThreads = std::max<std::size_t>(1, std::min(config_.maxWorkers, paths.size()));
    std::printf("[FortuneEngine] Processing %zu works on %zu threads\n", paths.size(), numThreads);

    std::vector<std::thread> threads;
    threads.reserve(numThreads);
    for (std::size_t t = 0; t < numThreads; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& th : threads) {
        th.join();
    }

    // Export in input order once every outcome is known
    CorpusRunSummary summary;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        WorkOutcome& outcome = outcomes[i];
        if (outcome.analysis) {
            try {
                store_->save_work(*outcome.analysis);
                const WorkResult& result = outcome.analysis->summary;
                std::printf("[FortuneEngine] %s: %zu sentences, ultimate fortune %.4f\n",
                            result.workId.c_str(), result.sentenceCount, result.ultimateFortune);
                summary.results.push_back(result);
            } catch (const std::exception& e) {
                outcome.failure = WorkFailure{outcome.analysis->work.workId, paths[i], "export", e.what()};
            }
        }
        if (outcome.failure) {
            const WorkFailure& failure = *outcome.failure;
            std::fprintf(stderr, "[FortuneEngine] WARNING: %s failed at %s: %s\n",
                         failure.workId.c_str(), failure.stage.c_str(), failure.message.c_str());
            store_->save_failure(failure);
            summary.failures.push_back(failure);
        }
    }

    summary.ranking = aggregator_.rank(summary.results);
    store_->save_ranking(summary.ranking);
    std::printf("[FortuneEngine] Ranked %zu works (%zu failed)\n",
                summary.ranking.entries.size(), summary.failures.size());
    return summary;
}

}  // namespace arcfortune
