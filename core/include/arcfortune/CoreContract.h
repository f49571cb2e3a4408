#pragma once

/**
 * CoreContract.h - ArcFortune Core System Constants
 *
 * This file defines all contract-level constants for the ArcFortune system.
 * These constants are PART OF THE SYSTEM CONTRACT and should NOT be changed
 * without understanding the implications for:
 *   - Reproducibility of exported curves across versions
 *   - Bundle names the external viewer resolves
 *   - Ranking colors of previously rendered corpora
 *
 * VERSION: 1.0.0
 */

#include <cstddef>

namespace arcfortune {
namespace contract {

// ============================================================================
// Segmentation
// ============================================================================

/**
 * MIN_WORDS_EXCLUSIVE - Sentence retention threshold
 *
 * A sentence is retained only if its whitespace word count is strictly greater
 * than this value. Removes bare speaker names, short stage directions and
 * interjections ("Exit.", "O, woe!").
 */
constexpr int MIN_WORDS_EXCLUSIVE = 3;

// ============================================================================
// Volatility family (raw score curves)
// ============================================================================

/**
 * Centered moving average windows (sentences).
 *
 *   - ROLLING_WINDOW_SCENE: scene-level mood (20 sentences)
 *   - ROLLING_WINDOW_ACT:   act-level mood (100 sentences)
 *
 * Positions where the full window does not fit are exported as missing (NaN).
 */
constexpr std::size_t ROLLING_WINDOW_SCENE = 20;
constexpr std::size_t ROLLING_WINDOW_ACT = 100;

/**
 * Savitzky-Golay (local polynomial) smoothing.
 *
 * The window is an upper bound: valid_window() reduces it to the largest odd
 * window that fits the series, or omits the curve when the series is shorter
 * than SAVGOL_DEGREE + 1.
 */
constexpr std::size_t SAVGOL_WINDOW_SCENE = 51;
constexpr std::size_t SAVGOL_WINDOW_MACRO = 201;
constexpr int SAVGOL_DEGREE = 3;

// ============================================================================
// Cumulative family (additive fortune)
// ============================================================================

/**
 * MACRO_ARC_MAX_WINDOW - Target window of the Macro Arc (cumulative Savitzky-Golay)
 */
constexpr std::size_t MACRO_ARC_MAX_WINDOW = 201;

// Secondary cumulative views carried in the cumulative bundle.
constexpr std::size_t CUMULATIVE_SAVGOL_WINDOW = 51;
constexpr std::size_t CUMULATIVE_ROLLING_WINDOW = 100;

// ============================================================================
// Ranking colors
// ============================================================================

/**
 * Rank r of N is normalized to t = r / (N - 1) and mapped to
 *   hue = HUE_POSITIVE + (HUE_NEGATIVE - HUE_POSITIVE) * t
 * in HSV space at fixed saturation/value.
 *
 * 0.33 is green, 0.0 is red; yellow/orange lies in between.
 */
constexpr double HUE_POSITIVE = 0.33;
constexpr double HUE_NEGATIVE = 0.0;
constexpr double COLOR_SATURATION = 0.8;
constexpr double COLOR_VALUE = 0.8;

// ============================================================================
// Scoring resources
// ============================================================================

constexpr std::size_t DEFAULT_BATCH_SIZE = 32;
constexpr int DEFAULT_MAX_RETRIES = 2;
constexpr std::size_t DEFAULT_MAX_WORKERS = 5;

// ============================================================================
// Export naming
// ============================================================================

/**
 * Bundle names resolved by the external viewer:
 *   {work_id}_original    volatility view
 *   {work_id}_cumulative  cumulative view
 *   index                 corpus master view
 */
constexpr const char* VOLATILITY_BUNDLE_SUFFIX = "_original";
constexpr const char* CUMULATIVE_BUNDLE_SUFFIX = "_cumulative";
constexpr const char* MASTER_BUNDLE_NAME = "index";

// ============================================================================
// Version Tracking
// ============================================================================

/**
 * CORE_CONTRACT_VERSION - Semantic version of this contract
 *
 * Stored in the schema_version table of every artifact database.
 */
constexpr const char* CORE_CONTRACT_VERSION = "1.0.0";

} // namespace contract
} // namespace arcfortune
