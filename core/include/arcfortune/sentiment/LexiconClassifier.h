#pragma once

#include "arcfortune/sentiment/SentimentClassifier.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace arcfortune {
namespace sentiment {

// ========== Valence rule constants ==========
inline constexpr double kBoosterIncrement = 0.293;
inline constexpr double kBoosterDecrement = -0.293;
inline constexpr double kCapsIncrement = 0.733;
inline constexpr double kNegationScalar = -0.74;
inline constexpr double kDampSecond = 0.95;     // modifier two tokens back
inline constexpr double kDampThird = 0.9;       // modifier three tokens back
inline constexpr double kButBefore = 0.5;
inline constexpr double kButAfter = 1.5;
inline constexpr double kNeverFactor = 1.25;
inline constexpr double kNormalizeAlpha = 15.0;

/**
 * LexiconClassifier: rule-based valence classifier over a word lexicon
 *
 * Lexicon file format: one entry per line, "token<TAB>valence[<TAB>...]".
 * Lines that do not parse are skipped.
 *
 * Per sentence:
 *   1. Whitespace tokens, surrounding punctuation stripped, single characters dropped
 *   2. Each lexicon hit contributes its valence, adjusted by ALL-CAPS emphasis,
 *      boosters/dampeners and negations within three preceding tokens, and "least"
 *   3. Valences before "but" are halved, after it scaled by 1.5
 *   4. compound = sum / sqrt(sum^2 + 15), clamped to [-1, 1]
 *
 * Label is Positive when compound >= 0; confidence = |compound|.
 */
class LexiconClassifier : public SentimentClassifier {
public:
    explicit LexiconClassifier(std::unordered_map<std::string, double> lexicon);

    // Throws ClassifierError if the file cannot be opened or yields no entries.
    static std::unique_ptr<LexiconClassifier> load(const std::string& path);

    std::vector<Classification> classify(const std::vector<std::string>& texts) const override;
    std::string name() const override { return "lexicon"; }

    double compound(const std::string& text) const;
    std::size_t size() const { return lexicon_.size(); }

private:
    double tokenValence(const std::vector<std::string>& tokens,
                        const std::vector<std::string>& lower,
                        std::size_t i,
                        bool capsDifferential) const;
    bool inLexicon(const std::string& lowerToken) const;

    std::unordered_map<std::string, double> lexicon_;
};

}  // namespace sentiment
}  // namespace arcfortune
