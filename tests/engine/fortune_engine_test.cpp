// End-to-end tests for the corpus pipeline.

#include "arcfortune/FortuneEngine.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "arcfortune/Errors.h"
#include "arcfortune/Utility.h"
#include "arcfortune/segmentation/SentenceSplitter.h"
#include "test_helpers.h"

namespace arcfortune {
namespace {

const char* kComedy = "All is well and all ends happily.\nThe lovers marry at the end.";
const char* kTragedy = "Every hope is lost in the dark. Exit.\n\nThe king dies alone tonight.";
const char* kPoisoned = "This text contains poison words here. And the rest is fine too.";
const char* kStageDirections = "Exit. Enter Ghost. Alarum.";

std::shared_ptr<test_helpers::TableClassifier> playClassifier() {
    return std::make_shared<test_helpers::TableClassifier>(
        std::map<std::string, Classification>{
            {"All is well and all ends happily.", {SentimentLabel::Positive, 0.9}},
            {"The lovers marry at the end.", {SentimentLabel::Positive, 0.8}},
            {"Every hope is lost in the dark.", {SentimentLabel::Negative, 0.9}},
            {"The king dies alone tonight.", {SentimentLabel::Negative, 0.7}},
            {"I am overjoyed and thrilled today.", {SentimentLabel::Positive, 0.95}},
            {"Nothing but despair and sorrow here.", {SentimentLabel::Negative, 0.90}},
        },
        "poison");
}

std::unique_ptr<FortuneEngine> makeEngine(const std::string& dbPath, PipelineConfig config = {}) {
    return std::make_unique<FortuneEngine>(dbPath, config, playClassifier(),
                                           std::make_shared<segmentation::RuleSentenceSplitter>());
}

const WorkFailure* findFailure(const CorpusRunSummary& summary, const std::string& workId) {
    for (const auto& f : summary.failures) {
        if (f.workId == workId) return &f;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Single work
// ---------------------------------------------------------------------------

TEST(FortuneEngineTest, AnalyzeShortWork) {
    test_helpers::TempPath db("engine.db");
    auto engine = makeEngine(db.str());

    WorkAnalysisRequest request;
    request.workId = "short_piece";
    request.text = "I am overjoyed and thrilled today. This is fine. Nothing but despair and sorrow here.";
    const auto analysis = engine->analyze(request);

    EXPECT_EQ(analysis.work.title, "Short Piece");
    ASSERT_EQ(analysis.work.sentences.size(), 2u);
    EXPECT_EQ(analysis.work.sentences[1].position, 1u);
    ASSERT_EQ(analysis.scores.size(), 2u);
    EXPECT_DOUBLE_EQ(analysis.scores[0], 0.95);
    EXPECT_DOUBLE_EQ(analysis.scores[1], -0.90);

    ASSERT_EQ(analysis.cumulative.running.values.size(), 2u);
    EXPECT_NEAR(analysis.cumulative.running.values[0], 0.95, 1e-12);
    EXPECT_NEAR(analysis.cumulative.running.values[1], 0.05, 1e-12);
    EXPECT_NEAR(analysis.summary.ultimateFortune, 0.05, 1e-12);

    // Two sentences are too few for a cubic fit.
    EXPECT_TRUE(analysis.cumulative.macroArc.omitted);
    EXPECT_FALSE(analysis.summary.macroArcFinal.has_value());
    EXPECT_FALSE(analysis.issues.empty());

    // analyze() does not store anything.
    SQLiteStore reader(db.str());
    EXPECT_FALSE(reader.load_work("short_piece").has_value());
}

TEST(FortuneEngineTest, AnalyzeEmptyWorkReportsIssue) {
    test_helpers::TempPath db("engine.db");
    auto engine = makeEngine(db.str());

    WorkAnalysisRequest request;
    request.workId = "stage_directions";
    request.text = kStageDirections;
    const auto analysis = engine->analyze(request);

    EXPECT_TRUE(analysis.work.sentences.empty());
    EXPECT_TRUE(analysis.scores.empty());
    EXPECT_DOUBLE_EQ(analysis.summary.ultimateFortune, 0.0);
    ASSERT_FALSE(analysis.issues.empty());
    EXPECT_EQ(analysis.issues.front().type, "EmptyWork");
}

TEST(FortuneEngineTest, CurvesMatchScoreLength) {
    test_helpers::TempPath db("engine.db");
    auto engine = makeEngine(db.str());

    std::string text;
    for (int i = 0; i < 30; ++i) text += "All is well and all ends happily. ";
    WorkAnalysisRequest request;
    request.workId = "long_comedy";
    request.text = text;
    const auto analysis = engine->analyze(request);

    ASSERT_EQ(analysis.scores.size(), 30u);
    for (const auto& c : analysis.volatility.rolling) EXPECT_EQ(c.values.size(), 30u);
    for (const auto& c : analysis.volatility.smoothed) EXPECT_EQ(c.values.size(), 30u);
    EXPECT_EQ(analysis.cumulative.running.values.size(), 30u);
    EXPECT_EQ(analysis.cumulative.macroArc.values.size(), 30u);
    EXPECT_EQ(analysis.cumulative.macroArc.window, 29u);
    ASSERT_TRUE(analysis.summary.macroArcFinal.has_value());
    EXPECT_NEAR(*analysis.summary.macroArcFinal, 27.0, 1e-6);
    EXPECT_NEAR(analysis.summary.ultimateFortune, 27.0, 1e-9);
}

// ---------------------------------------------------------------------------
// Corpus runs
// ---------------------------------------------------------------------------

TEST(FortuneEngineTest, RunCorpusRanksAndIsolatesFailures) {
    test_helpers::TempPath db("engine.db");
    test_helpers::TempPath comedy("comedy.txt");
    test_helpers::TempPath tragedy("tragedy.txt");
    test_helpers::TempPath empty("empty.txt");
    test_helpers::TempPath poisoned("poisoned.txt");
    test_helpers::TempPath missing("missing.txt");
    test_helpers::writeFile(comedy.str(), kComedy);
    test_helpers::writeFile(tragedy.str(), kTragedy);
    test_helpers::writeFile(empty.str(), "  \n\n ");
    test_helpers::writeFile(poisoned.str(), kPoisoned);

    auto engine = makeEngine(db.str());
    const auto summary =
        engine->run_corpus({tragedy.str(), missing.str(), comedy.str(), empty.str(), poisoned.str()});

    const std::string comedyId = work_id_from_path(comedy.str());
    const std::string tragedyId = work_id_from_path(tragedy.str());

    // Successful works in input order.
    ASSERT_EQ(summary.results.size(), 2u);
    EXPECT_EQ(summary.results[0].workId, tragedyId);
    EXPECT_EQ(summary.results[1].workId, comedyId);
    EXPECT_NEAR(summary.results[0].ultimateFortune, -1.6, 1e-12);
    EXPECT_NEAR(summary.results[1].ultimateFortune, 1.7, 1e-12);

    ASSERT_EQ(summary.failures.size(), 3u);
    const auto* missingFailure = findFailure(summary, work_id_from_path(missing.str()));
    ASSERT_NE(missingFailure, nullptr);
    EXPECT_EQ(missingFailure->stage, "ingest");
    const auto* emptyFailure = findFailure(summary, work_id_from_path(empty.str()));
    ASSERT_NE(emptyFailure, nullptr);
    EXPECT_EQ(emptyFailure->stage, "ingest");
    const auto* scoreFailure = findFailure(summary, work_id_from_path(poisoned.str()));
    ASSERT_NE(scoreFailure, nullptr);
    EXPECT_EQ(scoreFailure->stage, "score");

    ASSERT_EQ(summary.ranking.entries.size(), 2u);
    EXPECT_EQ(summary.ranking.entries[0].work.workId, comedyId);
    EXPECT_EQ(summary.ranking.entries[0].colorString, "rgb(44, 204, 40)");
    EXPECT_EQ(summary.ranking.entries[1].work.workId, tragedyId);
    EXPECT_EQ(summary.ranking.entries[1].colorString, "rgb(204, 40, 40)");

    SQLiteStore reader(db.str());
    EXPECT_EQ(reader.load_ranking().entries.size(), 2u);
    EXPECT_EQ(reader.load_failures().size(), 3u);
    EXPECT_EQ(reader.load_sentences(tragedyId).size(), 2u);
    const auto names = reader.load_bundle_names();
    EXPECT_NE(std::find(names.begin(), names.end(), comedyId + "_cumulative"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "index"), names.end());
}

TEST(FortuneEngineTest, WorkWithoutSentencesIsNotRanked) {
    test_helpers::TempPath db("engine.db");
    test_helpers::TempPath tragedy("tragedy.txt");
    test_helpers::TempPath directions("directions.txt");
    test_helpers::writeFile(tragedy.str(), kTragedy);
    test_helpers::writeFile(directions.str(), kStageDirections);

    auto engine = makeEngine(db.str());
    const auto summary = engine->run_corpus({tragedy.str(), directions.str()});

    const std::string directionsId = work_id_from_path(directions.str());
    ASSERT_EQ(summary.results.size(), 1u);
    ASSERT_EQ(summary.ranking.entries.size(), 1u);
    EXPECT_EQ(summary.ranking.entries[0].work.workId, work_id_from_path(tragedy.str()));

    const auto* failure = findFailure(summary, directionsId);
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->stage, "segment");
    EXPECT_EQ(failure->message, "no sentences");

    SQLiteStore reader(db.str());
    EXPECT_EQ(reader.load_ranking().entries.size(), 1u);
    EXPECT_FALSE(reader.load_work(directionsId).has_value());
}

TEST(FortuneEngineTest, CorpusOfEmptyWorksIsAnAggregationError) {
    test_helpers::TempPath db("engine.db");
    test_helpers::TempPath directions("directions.txt");
    test_helpers::writeFile(directions.str(), kStageDirections);

    auto engine = makeEngine(db.str());
    EXPECT_THROW(engine->run_corpus({directions.str()}), AggregationError);
}

TEST(FortuneEngineTest, SharedWorkIdRejectsTheRun) {
    test_helpers::TempPath db("engine.db");
    const auto base = std::filesystem::temp_directory_path() / "arcfortune_shared_work_id";
    std::filesystem::create_directories(base / "a");
    std::filesystem::create_directories(base / "b");
    const std::string first = (base / "a" / "hamlet.txt").string();
    const std::string second = (base / "b" / "hamlet.txt").string();
    test_helpers::writeFile(first, kComedy);
    test_helpers::writeFile(second, kTragedy);

    auto engine = makeEngine(db.str());
    EXPECT_THROW(engine->run_corpus({first, second}), ConfigError);

    SQLiteStore reader(db.str());
    EXPECT_FALSE(reader.load_work("hamlet").has_value());
    EXPECT_TRUE(reader.load_failures().empty());

    std::error_code ec;
    std::filesystem::remove_all(base, ec);
}

TEST(FortuneEngineTest, AllWorksFailingIsAnAggregationError) {
    test_helpers::TempPath db("engine.db");
    test_helpers::TempPath missing("missing.txt");
    test_helpers::TempPath poisoned("poisoned.txt");
    test_helpers::writeFile(poisoned.str(), kPoisoned);

    auto engine = makeEngine(db.str());
    EXPECT_THROW(engine->run_corpus({missing.str(), poisoned.str()}), AggregationError);

    SQLiteStore reader(db.str());
    EXPECT_EQ(reader.load_failures().size(), 2u);
    EXPECT_TRUE(reader.load_ranking().entries.empty());
}

TEST(FortuneEngineTest, WorkerCountDoesNotChangeResults) {
    test_helpers::TempPath comedy("comedy.txt");
    test_helpers::TempPath tragedy("tragedy.txt");
    test_helpers::TempPath comedy2("comedy_two.txt");
    test_helpers::TempPath tragedy2("tragedy_two.txt");
    test_helpers::writeFile(comedy.str(), kComedy);
    test_helpers::writeFile(tragedy.str(), kTragedy);
    test_helpers::writeFile(comedy2.str(), kComedy);
    test_helpers::writeFile(tragedy2.str(), kTragedy);
    const std::vector<std::string> paths{comedy.str(), tragedy.str(), comedy2.str(), tragedy2.str()};

    std::vector<CorpusRunSummary> runs;
    for (std::size_t workers : {1u, 4u}) {
        test_helpers::TempPath db("engine_" + std::to_string(workers) + ".db");
        PipelineConfig config;
        config.maxWorkers = workers;
        config.batchSize = 1;
        runs.push_back(makeEngine(db.str(), config)->run_corpus(paths));
    }

    ASSERT_EQ(runs[0].results.size(), runs[1].results.size());
    for (std::size_t i = 0; i < runs[0].results.size(); ++i) {
        EXPECT_EQ(runs[0].results[i].workId, runs[1].results[i].workId);
        EXPECT_DOUBLE_EQ(runs[0].results[i].ultimateFortune, runs[1].results[i].ultimateFortune);
    }
    ASSERT_EQ(runs[0].ranking.entries.size(), runs[1].ranking.entries.size());
    for (std::size_t i = 0; i < runs[0].ranking.entries.size(); ++i) {
        EXPECT_EQ(runs[0].ranking.entries[i].colorString, runs[1].ranking.entries[i].colorString);
    }
}

TEST(FortuneEngineTest, RejectsMissingCollaborators) {
    test_helpers::TempPath db("engine.db");
    EXPECT_THROW(FortuneEngine(db.str(), PipelineConfig{}, nullptr,
                               std::make_shared<segmentation::RuleSentenceSplitter>()),
                 std::invalid_argument);
}

}  // namespace
}  // namespace arcfortune
