#pragma once

#include "arcfortune/Config.h"
#include "arcfortune/FortuneTypes.h"

#include <vector>

namespace arcfortune {

/**
 * CurveEngine: Build the two metric families from one work's score series
 *
 * Volatility family: centered moving averages and Savitzky-Golay curves of the
 * raw scores (localized mood).
 * Cumulative family: running sum of the raw scores plus its Macro Arc and the
 * secondary act/scene views (additive fortune).
 *
 * Every produced curve has the same length as the score series. Smoothing
 * windows are chosen per call with valid_window(); a curve with no valid
 * window is returned with omitted = true and no values.
 */
class CurveEngine {
  public:
    explicit CurveEngine(const PipelineConfig& config);

    VolatilityCurves build_volatility(const std::vector<double>& scores) const;
    CumulativeTrack build_cumulative(const std::vector<double>& scores) const;

  private:
    CurveSeries buildRollingCurve(CurveKind kind, const std::vector<double>& x, std::size_t window) const;
    CurveSeries buildSmoothedCurve(CurveKind kind, const std::vector<double>& x,
                                   std::size_t targetWindow, int degree) const;

    std::vector<std::size_t> rollingWindows_;
    std::vector<SmoothingSpec> smoothing_;
    std::size_t macroWindow_;
    int macroDegree_;
};

}  // namespace arcfortune
