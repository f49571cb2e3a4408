#pragma once

#include "arcfortune/FortuneTypes.h"

#include <vector>

namespace arcfortune {

/**
 * DiagnosticsEngine: non-fatal findings about one analyzed work
 *
 *   - EmptyWork:              no sentence survived segmentation
 *   - SmoothingOmitted:       series too short for any valid smoothing window
 *   - SmoothingWindowReduced: effective window below the requested one
 *                             (severity = 1 - effective / requested)
 *   - RollingUndefined:       moving average missing at every position
 */
class DiagnosticsEngine {
  public:
    std::vector<WorkIssue> detect(const WorkAnalysis& analysis) const;
};

}  // namespace arcfortune
