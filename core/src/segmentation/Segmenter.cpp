#include "arcfortune/segmentation/Segmenter.h"
#include "arcfortune/Utility.h"

#include <stdexcept>
#include <utility>

namespace arcfortune {
namespace segmentation {

Segmenter::Segmenter(std::shared_ptr<const SentenceSplitter> splitter, int minWords)
    : splitter_(std::move(splitter)), minWords_(minWords) {
    if (!splitter_) {
        throw std::invalid_argument("Segmenter requires a sentence splitter");
    }
}

std::string Segmenter::clean(const std::string& unit) {
    const std::string stripped = trim(unit);
    std::string out;
    out.reserve(stripped.size());
    for (std::size_t i = 0; i < stripped.size(); ++i) {
        const char c = stripped[i];
        if (c == '\r') {
            // "\r\n" folds to a single space with the '\n'.
            if (i + 1 < stripped.size() && stripped[i + 1] == '\n') continue;
            out.push_back(' ');
        } else if (c == '\n') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

int Segmenter::count_words(const std::string& text) {
    return static_cast<int>(split_whitespace(text).size());
}

std::vector<Sentence> Segmenter::segment(const std::string& rawText) const {
    std::vector<Sentence> sentences;
    if (rawText.empty()) return sentences;

    for (auto& unit : splitter_->split(rawText)) {
        std::string text = clean(unit);
        const int words = count_words(text);
        if (words <= minWords_) continue;

        Sentence s;
        s.rawText = std::move(unit);
        s.text = std::move(text);
        s.wordCount = words;
        s.position = sentences.size();
        sentences.push_back(std::move(s));
    }
    return sentences;
}

}  // namespace segmentation
}  // namespace arcfortune
