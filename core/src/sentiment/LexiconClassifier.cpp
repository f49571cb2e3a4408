#include "arcfortune/sentiment/LexiconClassifier.h"
#include "arcfortune/Errors.h"
#include "arcfortune/Utility.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <unordered_set>
#include <utility>

namespace arcfortune {
namespace sentiment {

namespace {

const std::unordered_set<std::string>& negations() {
    static const std::unordered_set<std::string> words{
        "aint", "arent", "cannot", "cant", "couldnt", "darent", "didnt", "doesnt",
        "dont", "hadnt", "hasnt", "havent", "isnt", "mightnt", "mustnt", "neither",
        "neednt", "never", "none", "nope", "nor", "not", "nothing", "nowhere",
        "oughtnt", "shant", "shouldnt", "uhuh", "wasnt", "werent", "uh-uh", "without",
        "wont", "wouldnt", "rarely", "seldom", "despite"};
    return words;
}

const std::unordered_map<std::string, double>& boosters() {
    static const std::unordered_map<std::string, double> words{
        {"absolutely", kBoosterIncrement}, {"amazingly", kBoosterIncrement},
        {"awfully", kBoosterIncrement}, {"completely", kBoosterIncrement},
        {"considerably", kBoosterIncrement}, {"decidedly", kBoosterIncrement},
        {"deeply", kBoosterIncrement}, {"enormously", kBoosterIncrement},
        {"entirely", kBoosterIncrement}, {"especially", kBoosterIncrement},
        {"exceptionally", kBoosterIncrement}, {"extremely", kBoosterIncrement},
        {"fabulously", kBoosterIncrement}, {"fully", kBoosterIncrement},
        {"greatly", kBoosterIncrement}, {"highly", kBoosterIncrement},
        {"hugely", kBoosterIncrement}, {"incredibly", kBoosterIncrement},
        {"intensely", kBoosterIncrement}, {"more", kBoosterIncrement},
        {"most", kBoosterIncrement}, {"particularly", kBoosterIncrement},
        {"purely", kBoosterIncrement}, {"quite", kBoosterIncrement},
        {"really", kBoosterIncrement}, {"remarkably", kBoosterIncrement},
        {"so", kBoosterIncrement}, {"substantially", kBoosterIncrement},
        {"thoroughly", kBoosterIncrement}, {"totally", kBoosterIncrement},
        {"tremendously", kBoosterIncrement}, {"truly", kBoosterIncrement},
        {"unusually", kBoosterIncrement}, {"utterly", kBoosterIncrement},
        {"very", kBoosterIncrement},
        {"almost", kBoosterDecrement}, {"barely", kBoosterDecrement},
        {"hardly", kBoosterDecrement}, {"kinda", kBoosterDecrement},
        {"less", kBoosterDecrement}, {"little", kBoosterDecrement},
        {"marginally", kBoosterDecrement}, {"occasionally", kBoosterDecrement},
        {"partly", kBoosterDecrement}, {"scarcely", kBoosterDecrement},
        {"slightly", kBoosterDecrement}, {"somewhat", kBoosterDecrement},
        {"sorta", kBoosterDecrement}};
    return words;
}

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

std::string strip_punctuation(const std::string& token) {
    std::size_t a = 0;
    std::size_t b = token.size();
    while (a < b && std::ispunct(static_cast<unsigned char>(token[a]))) ++a;
    while (b > a && std::ispunct(static_cast<unsigned char>(token[b - 1]))) --b;
    return token.substr(a, b - a);
}

bool is_negated(const std::string& lower) {
    return negations().count(lower) > 0 || lower.find("n't") != std::string::npos;
}

// At least one letter, and every letter upper case.
bool is_all_caps(const std::string& token) {
    bool cased = false;
    for (char c : token) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::islower(uc)) return false;
        if (std::isupper(uc)) cased = true;
    }
    return cased;
}

bool caps_differential(const std::vector<std::string>& tokens) {
    const auto caps = std::count_if(tokens.begin(), tokens.end(), is_all_caps);
    return caps > 0 && static_cast<std::size_t>(caps) < tokens.size();
}

double scalar_inc_dec(const std::string& token, const std::string& lower, double valence, bool capsDiff) {
    const auto it = boosters().find(lower);
    if (it == boosters().end()) return 0.0;

    double scalar = it->second;
    if (valence < 0.0) scalar = -scalar;
    if (is_all_caps(token) && capsDiff) {
        scalar += (valence > 0.0) ? kCapsIncrement : -kCapsIncrement;
    }
    return scalar;
}

void negation_check(double& valence, const std::vector<std::string>& lower, std::size_t start, std::size_t i) {
    const std::string& prev = lower[i - (start + 1)];
    switch (start) {
        case 0:
            if (is_negated(prev)) valence *= kNegationScalar;
            break;
        case 1:
            if (lower[i - 2] == "never" && (lower[i - 1] == "so" || lower[i - 1] == "this")) {
                valence *= kNeverFactor;
            } else if (lower[i - 2] == "without" && lower[i - 1] == "doubt") {
                // idiom, not a negation
            } else if (is_negated(prev)) {
                valence *= kNegationScalar;
            }
            break;
        case 2:
            if (lower[i - 3] == "never" &&
                (lower[i - 2] == "so" || lower[i - 2] == "this" || lower[i - 1] == "so" || lower[i - 1] == "this")) {
                valence *= kNeverFactor;
            } else if (lower[i - 3] == "without" && (lower[i - 2] == "doubt" || lower[i - 1] == "doubt")) {
                // idiom, not a negation
            } else if (is_negated(prev)) {
                valence *= kNegationScalar;
            }
            break;
        default:
            break;
    }
}

void but_check(const std::vector<std::string>& lower, std::vector<double>& sentiments) {
    const auto it = std::find(lower.begin(), lower.end(), "but");
    if (it == lower.end()) return;
    const auto butIndex = static_cast<std::size_t>(it - lower.begin());
    for (std::size_t k = 0; k < sentiments.size(); ++k) {
        if (k < butIndex) {
            sentiments[k] *= kButBefore;
        } else if (k > butIndex) {
            sentiments[k] *= kButAfter;
        }
    }
}

double normalize(double score) {
    const double norm = score / std::sqrt(score * score + kNormalizeAlpha);
    return std::clamp(norm, -1.0, 1.0);
}

}  // namespace

LexiconClassifier::LexiconClassifier(std::unordered_map<std::string, double> lexicon)
    : lexicon_(std::move(lexicon)) {}

std::unique_ptr<LexiconClassifier> LexiconClassifier::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ClassifierError("Could not open sentiment lexicon: '" + path + "'");
    }

    std::unordered_map<std::string, double> lexicon;
    std::string line;
    while (std::getline(in, line)) {
        const auto tab = line.find('\t');
        if (tab == std::string::npos || tab == 0) continue;

        const std::string token = to_lower(line.substr(0, tab));
        const std::string rest = line.substr(tab + 1);
        char* end = nullptr;
        const double valence = std::strtod(rest.c_str(), &end);
        if (end == rest.c_str() || !std::isfinite(valence)) continue;

        lexicon[token] = valence;
    }

    if (lexicon.empty()) {
        throw ClassifierError("Sentiment lexicon has no entries: '" + path + "'");
    }
    return std::make_unique<LexiconClassifier>(std::move(lexicon));
}

bool LexiconClassifier::inLexicon(const std::string& lowerToken) const {
    return lexicon_.find(lowerToken) != lexicon_.end();
}

double LexiconClassifier::tokenValence(const std::vector<std::string>& tokens,
                                       const std::vector<std::string>& lower,
                                       std::size_t i,
                                       bool capsDifferential) const {
    // Modifiers carry no valence of their own.
    if (boosters().count(lower[i]) > 0) return 0.0;
    if (lower[i] == "kind" && i + 1 < lower.size() && lower[i + 1] == "of") return 0.0;

    const auto it = lexicon_.find(lower[i]);
    if (it == lexicon_.end()) return 0.0;

    double valence = it->second;

    // "no" directly before another lexicon word acts only as a negation.
    if (lower[i] == "no" && i + 1 < lower.size() && inLexicon(lower[i + 1])) {
        valence = 0.0;
    }

    if (is_all_caps(tokens[i]) && capsDifferential) {
        valence += (valence > 0.0) ? kCapsIncrement : -kCapsIncrement;
    }

    for (std::size_t start = 0; start < 3; ++start) {
        if (i <= start) break;
        const std::size_t prev = i - (start + 1);
        if (inLexicon(lower[prev])) continue;

        double s = scalar_inc_dec(tokens[prev], lower[prev], valence, capsDifferential);
        if (start == 1) {
            s *= kDampSecond;
        } else if (start == 2) {
            s *= kDampThird;
        }
        valence += s;
        negation_check(valence, lower, start, i);
    }

    // "least happy" negates; "at least" / "very least" do not.
    if (i > 0 && lower[i - 1] == "least" && !inLexicon(lower[i - 1])) {
        if (i < 2 || (lower[i - 2] != "at" && lower[i - 2] != "very")) {
            valence *= kNegationScalar;
        }
    }
    return valence;
}

double LexiconClassifier::compound(const std::string& text) const {
    std::vector<std::string> tokens;
    for (const auto& raw : split_whitespace(text)) {
        std::string token = strip_punctuation(raw);
        if (token.size() > 1) tokens.push_back(std::move(token));
    }
    if (tokens.empty()) return 0.0;

    std::vector<std::string> lower;
    lower.reserve(tokens.size());
    for (const auto& t : tokens) lower.push_back(to_lower(t));

    const bool capsDiff = caps_differential(tokens);
    std::vector<double> sentiments;
    sentiments.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        sentiments.push_back(tokenValence(tokens, lower, i, capsDiff));
    }
    but_check(lower, sentiments);

    double sum = 0.0;
    for (double s : sentiments) sum += s;
    return normalize(sum);
}

std::vector<Classification> LexiconClassifier::classify(const std::vector<std::string>& texts) const {
    std::vector<Classification> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        const double c = compound(text);
        Classification result;
        result.label = (c >= 0.0) ? SentimentLabel::Positive : SentimentLabel::Negative;
        result.confidence = std::fabs(c);
        out.push_back(result);
    }
    return out;
}

}  // namespace sentiment
}  // namespace arcfortune
