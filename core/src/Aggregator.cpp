#include "arcfortune/Aggregator.h"
#include "arcfortune/CoreContract.h"
#include "arcfortune/Errors.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace arcfortune {

double Aggregator::rank_hue(std::size_t rank, std::size_t total) {
    const double denom = static_cast<double>(std::max<std::size_t>(1, total > 0 ? total - 1 : 0));
    const double t = std::clamp(static_cast<double>(rank) / denom, 0.0, 1.0);
    return contract::HUE_POSITIVE + (contract::HUE_NEGATIVE - contract::HUE_POSITIVE) * t;
}

RgbColor Aggregator::hsv_to_rgb(double h, double s, double v) {
    double r = v;
    double g = v;
    double b = v;
    if (s > 0.0) {
        const int sector = static_cast<int>(h * 6.0);
        const double f = h * 6.0 - sector;
        const double p = v * (1.0 - s);
        const double q = v * (1.0 - s * f);
        const double t = v * (1.0 - s * (1.0 - f));
        switch (((sector % 6) + 6) % 6) {
            case 0: r = v; g = t; b = p; break;
            case 1: r = q; g = v; b = p; break;
            case 2: r = p; g = v; b = t; break;
            case 3: r = p; g = q; b = v; break;
            case 4: r = t; g = p; b = v; break;
            default: r = v; g = p; b = q; break;
        }
    }
    return RgbColor{static_cast<int>(r * 255.0), static_cast<int>(g * 255.0), static_cast<int>(b * 255.0)};
}

std::string Aggregator::to_css(const RgbColor& color) {
    return "rgb(" + std::to_string(color.r) + ", " + std::to_string(color.g) + ", " + std::to_string(color.b) + ")";
}

CorpusRanking Aggregator::rank(const std::vector<WorkResult>& results) const {
    if (results.empty()) {
        throw AggregationError("No work was processed successfully; nothing to rank");
    }

    std::vector<std::size_t> order(results.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return results[a].ultimateFortune > results[b].ultimateFortune;
    });

    CorpusRanking ranking;
    ranking.entries.reserve(order.size());
    for (std::size_t r = 0; r < order.size(); ++r) {
        RankedWork entry;
        entry.rank = r;
        entry.work = results[order[r]];
        entry.hue = rank_hue(r, order.size());
        entry.color = hsv_to_rgb(entry.hue, contract::COLOR_SATURATION, contract::COLOR_VALUE);
        entry.colorString = to_css(entry.color);
        ranking.entries.push_back(std::move(entry));
    }
    return ranking;
}

}  // namespace arcfortune
