#pragma once

#include "arcfortune/Aggregator.h"
#include "arcfortune/Config.h"
#include "arcfortune/CurveEngine.h"
#include "arcfortune/Diagnostics.h"
#include "arcfortune/SQLiteStore.h"
#include "arcfortune/segmentation/Segmenter.h"
#include "arcfortune/sentiment/Scorer.h"

#include <memory>
#include <string>
#include <vector>

namespace arcfortune {

/**
 * FortuneEngine: Complete corpus pipeline
 *
 * Per work:  Ingest → Segment → Score → Curves → Diagnostics → Storage
 * Per run:   Aggregate → Ranking storage
 *
 * Works run on up to maxWorkers threads sharing the one classifier. A failure
 * in one work is recorded with the stage it happened in and never stops the
 * others. All database writes happen on the calling thread.
 */
class FortuneEngine {
  public:
    FortuneEngine(std::string databasePath,
                  PipelineConfig config,
                  std::shared_ptr<const sentiment::SentimentClassifier> classifier,
                  std::shared_ptr<const segmentation::SentenceSplitter> splitter);

    /**
     * Run the per-work pipeline on an in-memory text without storing it.
     * Throws ScoringError (or std::invalid_argument from the metrics) on failure.
     */
    WorkAnalysis analyze(const WorkAnalysisRequest& request) const;

    WorkAnalysis analyze_and_store(const WorkAnalysisRequest& request);

    /**
     * Process every file, store per-work artifacts and failures, then rank the
     * successful works and store the master bundle. A work with no retained
     * sentence fails at the "segment" stage and is not ranked.
     * Throws ConfigError before any work runs when two paths share a work id,
     * and AggregationError when no work succeeded.
     */
    CorpusRunSummary run_corpus(const std::vector<std::string>& paths);

    const PipelineConfig& config() const { return config_; }

  private:
    // `stage` names the step in progress when an exception escapes.
    WorkAnalysis runPipeline(const WorkAnalysisRequest& request, std::string& stage) const;

    PipelineConfig config_;

    segmentation::Segmenter segmenter_;
    sentiment::Scorer scorer_;

    CurveEngine curveEngine_;
    DiagnosticsEngine diagnostics_;
    Aggregator aggregator_;

    // Storage
    std::unique_ptr<SQLiteStore> store_;
};

}  // namespace arcfortune
