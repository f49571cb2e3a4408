#pragma once

#include "arcfortune/FortuneTypes.h"

#include <cstddef>
#include <string>
#include <vector>

namespace arcfortune {

/**
 * Aggregator: corpus ranking and rank colors
 *
 * Works are sorted by ultimateFortune descending; equal values keep their
 * input order. Rank r of N maps to t = r / (N - 1) (t = 0 when N = 1) and
 * hue 0.33 - 0.33 t, so the most positive work is green and the least
 * positive red.
 */
class Aggregator {
  public:
    // Throws AggregationError when results is empty.
    CorpusRanking rank(const std::vector<WorkResult>& results) const;

    static double rank_hue(std::size_t rank, std::size_t total);
    // Channels are floor(component * 255).
    static RgbColor hsv_to_rgb(double h, double s, double v);
    static std::string to_css(const RgbColor& color);
};

}  // namespace arcfortune
