#include "arcfortune/Smoothing.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace arcfortune {

namespace {

using Matrix = std::vector<std::vector<double>>;

// Gaussian elimination with partial pivoting; A is (n x n), b has n entries.
std::vector<double> solve_linear(Matrix A, std::vector<double> b) {
    const std::size_t n = b.size();
    for (std::size_t col = 0; col < n; ++col) {
        std::size_t pivot = col;
        for (std::size_t row = col + 1; row < n; ++row) {
            if (std::abs(A[row][col]) > std::abs(A[pivot][col])) pivot = row;
        }
        if (std::abs(A[pivot][col]) < 1e-300) {
            throw std::runtime_error("singular normal equations in polynomial fit");
        }
        std::swap(A[col], A[pivot]);
        std::swap(b[col], b[pivot]);
        for (std::size_t row = col + 1; row < n; ++row) {
            const double f = A[row][col] / A[col][col];
            if (f == 0.0) continue;
            for (std::size_t k = col; k < n; ++k) A[row][k] -= f * A[col][k];
            b[row] -= f * b[col];
        }
    }
    std::vector<double> x(n, 0.0);
    for (std::size_t i = n; i-- > 0;) {
        double acc = b[i];
        for (std::size_t k = i + 1; k < n; ++k) acc -= A[i][k] * x[k];
        x[i] = acc / A[i][i];
    }
    return x;
}

// Window positions k = 0..window-1 mapped to x = (k - half) / scale in [-1, 1].
// Scaling keeps the normal equations well conditioned for wide windows.
double window_scale(std::size_t window) {
    const std::size_t half = window / 2;
    return half > 0 ? static_cast<double>(half) : 1.0;
}

double window_x(std::size_t k, std::size_t window) {
    const double half = static_cast<double>(window / 2);
    return (static_cast<double>(k) - half) / window_scale(window);
}

Matrix normal_matrix(std::size_t window, int degree) {
    const std::size_t m = static_cast<std::size_t>(degree) + 1;
    Matrix ata(m, std::vector<double>(m, 0.0));
    for (std::size_t k = 0; k < window; ++k) {
        const double x = window_x(k, window);
        std::vector<double> pw(2 * m - 1, 1.0);
        for (std::size_t p = 1; p < pw.size(); ++p) pw[p] = pw[p - 1] * x;
        for (std::size_t r = 0; r < m; ++r) {
            for (std::size_t c = 0; c < m; ++c) ata[r][c] += pw[r + c];
        }
    }
    return ata;
}

// Polynomial coefficients (in window_x coordinates) fitted to y[first .. first+window).
std::vector<double> fit_window(const std::vector<double>& y, std::size_t first, std::size_t window, int degree) {
    const std::size_t m = static_cast<std::size_t>(degree) + 1;
    std::vector<double> aty(m, 0.0);
    for (std::size_t k = 0; k < window; ++k) {
        const double x = window_x(k, window);
        double p = 1.0;
        for (std::size_t r = 0; r < m; ++r) {
            aty[r] += p * y[first + k];
            p *= x;
        }
    }
    return solve_linear(normal_matrix(window, degree), std::move(aty));
}

double eval_poly(const std::vector<double>& coeffs, double x) {
    double acc = 0.0;
    for (std::size_t r = coeffs.size(); r-- > 0;) acc = acc * x + coeffs[r];
    return acc;
}

void check_savgol_args(std::size_t window, int degree, std::size_t length) {
    if (degree < 0) throw std::invalid_argument("savgol: negative degree");
    if (window % 2 == 0) throw std::invalid_argument("savgol: window must be odd, got " + std::to_string(window));
    if (window <= static_cast<std::size_t>(degree)) {
        throw std::invalid_argument("savgol: window " + std::to_string(window) + " must exceed degree " + std::to_string(degree));
    }
    if (window > length) {
        throw std::invalid_argument("savgol: window " + std::to_string(window) + " exceeds series length " + std::to_string(length));
    }
}

} // namespace

double missing_value() { return std::numeric_limits<double>::quiet_NaN(); }

bool is_missing(double x) { return std::isnan(x); }

std::optional<std::size_t> valid_window(std::size_t target, int degree, std::size_t length) {
    if (degree < 0) return std::nullopt;
    std::size_t w = std::min(target, length);
    if (w % 2 == 0) {
        if (w == 0) return std::nullopt;
        --w;
    }
    if (w < static_cast<std::size_t>(degree) + 1) return std::nullopt;
    return w;
}

std::vector<double> centered_rolling_mean(const std::vector<double>& x, std::size_t window) {
    const std::size_t n = x.size();
    std::vector<double> y(n, missing_value());
    if (window == 0 || window > n) return y;

    const std::size_t lead = window / 2;        // samples before i
    const std::size_t trail = (window - 1) / 2; // samples after i

    // Running sum over the current window; the first defined centre is i = lead.
    double acc = 0.0;
    for (std::size_t j = 0; j < window; ++j) acc += x[j];
    for (std::size_t i = lead; i + trail < n; ++i) {
        if (i > lead) {
            acc += x[i + trail];
            acc -= x[i - lead - 1];
        }
        y[i] = acc / static_cast<double>(window);
    }
    return y;
}

std::vector<double> savgol_coefficients(std::size_t window, int degree) {
    check_savgol_args(window, degree, window);
    const std::size_t m = static_cast<std::size_t>(degree) + 1;

    // Centre value is coefficient a0, so weights are A (A^T A)^{-1} e0.
    std::vector<double> e0(m, 0.0);
    e0[0] = 1.0;
    const auto g = solve_linear(normal_matrix(window, degree), std::move(e0));

    std::vector<double> c(window, 0.0);
    for (std::size_t k = 0; k < window; ++k) {
        const double x = window_x(k, window);
        double p = 1.0;
        double acc = 0.0;
        for (std::size_t r = 0; r < m; ++r) {
            acc += g[r] * p;
            p *= x;
        }
        c[k] = acc;
    }
    return c;
}

std::vector<double> savgol_filter(const std::vector<double>& x, std::size_t window, int degree) {
    const std::size_t n = x.size();
    check_savgol_args(window, degree, n);

    const std::size_t half = window / 2;
    const auto c = savgol_coefficients(window, degree);
    std::vector<double> y(n, 0.0);

    for (std::size_t i = half; i + half < n; ++i) {
        double acc = 0.0;
        const std::size_t first = i - half;
        for (std::size_t k = 0; k < window; ++k) acc += c[k] * x[first + k];
        y[i] = acc;
    }

    // Edges: evaluate the polynomial fitted to the first / last full window.
    const auto head = fit_window(x, 0, window, degree);
    for (std::size_t i = 0; i < half; ++i) y[i] = eval_poly(head, window_x(i, window));

    const std::size_t tailFirst = n - window;
    const auto tail = fit_window(x, tailFirst, window, degree);
    for (std::size_t i = n - half; i < n; ++i) y[i] = eval_poly(tail, window_x(i - tailFirst, window));

    return y;
}

std::vector<double> cumulative_sum(const std::vector<double>& x) {
    std::vector<double> y(x.size(), 0.0);
    double acc = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        acc += x[i];
        y[i] = acc;
    }
    return y;
}

} // namespace arcfortune
