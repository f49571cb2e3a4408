#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace arcfortune {

// ---------- missing values ----------
// Curves mark undefined positions with quiet NaN.
double missing_value();
bool is_missing(double x);

// ---------- window selection ----------
// Largest odd window <= min(target, length) that is >= degree + 1.
// nullopt when the series is too short for any valid window.
std::optional<std::size_t> valid_window(std::size_t target, int degree, std::size_t length);

// ---------- moving average ----------
// Centered mean over exactly `window` samples [i - window/2, i + (window-1)/2].
// Positions where that window leaves the series are missing.
std::vector<double> centered_rolling_mean(const std::vector<double>& x, std::size_t window);

// ---------- Savitzky-Golay ----------
// Convolution weights for the fitted centre value of an odd window.
std::vector<double> savgol_coefficients(std::size_t window, int degree);

// Least-squares polynomial smoothing. The first/last window/2 samples are
// evaluated on the polynomial fitted to the first/last full window.
// Throws std::invalid_argument unless window is odd, > degree, and <= x.size().
std::vector<double> savgol_filter(const std::vector<double>& x, std::size_t window, int degree);

// ---------- accumulation ----------
std::vector<double> cumulative_sum(const std::vector<double>& x);

} // namespace arcfortune
