#include "arcfortune/CurveEngine.h"
#include "arcfortune/CoreContract.h"
#include "arcfortune/Smoothing.h"

#include <utility>

namespace arcfortune {

CurveEngine::CurveEngine(const PipelineConfig& config)
    : rollingWindows_(config.rollingWindows),
      smoothing_(config.smoothing),
      macroWindow_(config.macroWindow),
      macroDegree_(config.macroDegree) {}

CurveSeries CurveEngine::buildRollingCurve(CurveKind kind, const std::vector<double>& x, std::size_t window) const {
    CurveSeries curve;
    curve.kind = kind;
    curve.requestedWindow = window;
    curve.window = window;
    curve.values = centered_rolling_mean(x, window);
    return curve;
}

CurveSeries CurveEngine::buildSmoothedCurve(CurveKind kind, const std::vector<double>& x,
                                            std::size_t targetWindow, int degree) const {
    CurveSeries curve;
    curve.kind = kind;
    curve.requestedWindow = targetWindow;
    curve.degree = degree;

    const auto window = valid_window(targetWindow, degree, x.size());
    if (!window) {
        curve.omitted = true;
        return curve;
    }
    curve.window = *window;
    curve.values = savgol_filter(x, *window, degree);
    return curve;
}

VolatilityCurves CurveEngine::build_volatility(const std::vector<double>& scores) const {
    VolatilityCurves out;
    out.rolling.reserve(rollingWindows_.size());
    for (std::size_t w : rollingWindows_) {
        out.rolling.push_back(buildRollingCurve(CurveKind::Rolling, scores, w));
    }
    out.smoothed.reserve(smoothing_.size());
    for (const auto& spec : smoothing_) {
        out.smoothed.push_back(buildSmoothedCurve(CurveKind::Smoothed, scores, spec.window, spec.degree));
    }
    return out;
}

CumulativeTrack CurveEngine::build_cumulative(const std::vector<double>& scores) const {
    CumulativeTrack track;

    // Step 1: running sum (the additive walk)
    track.running.kind = CurveKind::Cumulative;
    track.running.values = cumulative_sum(scores);

    // Step 2: Macro Arc, the overall trajectory of the work
    track.macroArc = buildSmoothedCurve(CurveKind::MacroArc, track.running.values, macroWindow_, macroDegree_);

    // Step 3: scene-level flow and act-level trajectory of the walk
    track.secondary.push_back(buildSmoothedCurve(CurveKind::CumulativeSmoothed, track.running.values,
                                                 contract::CUMULATIVE_SAVGOL_WINDOW, contract::SAVGOL_DEGREE));
    track.secondary.push_back(buildRollingCurve(CurveKind::CumulativeRolling, track.running.values,
                                                contract::CUMULATIVE_ROLLING_WINDOW));
    return track;
}

}  // namespace arcfortune
