#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arcfortune {

// ========== Text units ==========
struct Sentence {
    std::string rawText;                // unit as returned by the sentence splitter
    std::string text;                   // line breaks folded, surrounding whitespace stripped
    int wordCount{0};                   // whitespace tokens of text
    std::size_t position{0};            // 0-based, contiguous after filtering
};

struct Work {
    std::string workId;                 // file stem, e.g. "romeo_and_juliet"
    std::string title;                  // display title, e.g. "Romeo And Juliet"
    std::string sourcePath;
    std::vector<Sentence> sentences;    // retained sentences only
};

// ========== Classification ==========
enum class SentimentLabel {
    Positive,
    Negative
};

struct Classification {
    SentimentLabel label{SentimentLabel::Positive};
    double confidence{0.0};             // [0,1]
};

// ========== Curves ==========
enum class CurveKind {
    RawScore,
    Rolling,                // centered moving average of raw scores
    Smoothed,               // Savitzky-Golay of raw scores
    Cumulative,             // running sum of raw scores
    CumulativeRolling,
    CumulativeSmoothed,
    MacroArc                // Savitzky-Golay of the running sum at the macro window
};

struct CurveSeries {
    CurveKind kind{CurveKind::RawScore};
    std::size_t requestedWindow{0};     // 0 for unwindowed curves
    std::size_t window{0};              // effective window (0 when omitted)
    int degree{0};                      // polynomial degree, smoothed kinds only
    bool omitted{false};                // no valid window for this series length
    std::vector<double> values;         // same length as the score series; NaN = missing
};

struct VolatilityCurves {
    std::vector<CurveSeries> rolling;   // one per configured rolling window
    std::vector<CurveSeries> smoothed;  // one per configured (window, degree) pair
};

struct CumulativeTrack {
    CurveSeries running;                // cumulative[i] = sum(scores[0..i])
    CurveSeries macroArc;
    std::vector<CurveSeries> secondary; // scene-level smoothing, act-level rolling
};

// ========== Diagnostics ==========
struct WorkIssue {
    std::string type;                   // e.g. "SmoothingOmitted", "RollingUndefined"
    std::string curve;                  // curve name, empty for work-level issues
    double severity{0.0};               // [0,1]
    std::string explanation;
};

struct WorkFailure {
    std::string workId;
    std::string sourcePath;
    std::string stage;                  // "ingest" / "segment" / "score" / "metrics" / "export"
    std::string message;
};

// ========== Results ==========
struct WorkResult {
    std::string workId;
    std::string title;
    double ultimateFortune{0.0};        // final raw cumulative value
    std::optional<double> macroArcFinal;
    std::size_t sentenceCount{0};
};

struct RgbColor {
    int r{0};
    int g{0};
    int b{0};
};

struct RankedWork {
    std::size_t rank{0};                // 0 = most positive
    WorkResult work;
    double hue{0.0};                    // HSV hue in [0,1]
    RgbColor color;
    std::string colorString;            // "rgb(r, g, b)"
};

struct CorpusRanking {
    std::vector<RankedWork> entries;    // non-increasing ultimateFortune
};

struct WorkAnalysisRequest {
    std::string workId;
    std::string title;
    std::string sourcePath;             // optional for in-memory texts
    std::string text;
};

struct WorkAnalysis {
    Work work;
    std::vector<double> scores;         // index-aligned with work.sentences
    VolatilityCurves volatility;
    CumulativeTrack cumulative;
    std::vector<WorkIssue> issues;
    WorkResult summary;
};

struct CorpusRunSummary {
    std::vector<WorkResult> results;    // successful works, input order
    std::vector<WorkFailure> failures;
    CorpusRanking ranking;
};

}  // namespace arcfortune
