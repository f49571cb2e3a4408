#include "arcfortune/Diagnostics.h"
#include "arcfortune/Smoothing.h"
#include "arcfortune/Utility.h"

#include <algorithm>
#include <string>
#include <vector>

namespace {

using arcfortune::CurveKind;
using arcfortune::CurveSeries;
using arcfortune::WorkIssue;

inline double clamp01(double x) { return std::min(1.0, std::max(0.0, x)); }

bool is_smoothed(CurveKind kind) {
    return kind == CurveKind::Smoothed || kind == CurveKind::CumulativeSmoothed || kind == CurveKind::MacroArc;
}

bool is_rolling(CurveKind kind) {
    return kind == CurveKind::Rolling || kind == CurveKind::CumulativeRolling;
}

void check_curve(const CurveSeries& curve, std::size_t length, std::vector<WorkIssue>& out) {
    const std::string name = arcfortune::curve_name(curve);

    if (is_smoothed(curve.kind)) {
        if (curve.omitted) {
            out.push_back(WorkIssue{
                "SmoothingOmitted", name, 1.0,
                "Series of " + std::to_string(length) + " sentences is too short for a degree-" +
                    std::to_string(curve.degree) + " smoothing window"});
        } else if (curve.requestedWindow > 0 && curve.window < curve.requestedWindow) {
            const double severity =
                clamp01(1.0 - static_cast<double>(curve.window) / static_cast<double>(curve.requestedWindow));
            out.push_back(WorkIssue{
                "SmoothingWindowReduced", name, severity,
                "Window reduced from " + std::to_string(curve.requestedWindow) + " to " +
                    std::to_string(curve.window) + " for " + std::to_string(length) + " sentences"});
        }
        return;
    }

    if (is_rolling(curve.kind) && !curve.values.empty()) {
        const bool allMissing = std::all_of(curve.values.begin(), curve.values.end(),
                                            [](double v) { return arcfortune::is_missing(v); });
        if (allMissing) {
            out.push_back(WorkIssue{
                "RollingUndefined", name, 1.0,
                "Window of " + std::to_string(curve.window) + " exceeds the " + std::to_string(length) +
                    " available sentences"});
        }
    }
}

}  // namespace

namespace arcfortune {

std::vector<WorkIssue> DiagnosticsEngine::detect(const WorkAnalysis& analysis) const {
    std::vector<WorkIssue> issues;
    const std::size_t length = analysis.scores.size();

    if (analysis.work.sentences.empty()) {
        issues.push_back(WorkIssue{"EmptyWork", "", 1.0, "No sentence passed the word-count filter"});
    }

    for (const auto& c : analysis.volatility.rolling) check_curve(c, length, issues);
    for (const auto& c : analysis.volatility.smoothed) check_curve(c, length, issues);
    check_curve(analysis.cumulative.macroArc, length, issues);
    for (const auto& c : analysis.cumulative.secondary) check_curve(c, length, issues);

    return issues;
}

}  // namespace arcfortune
