#pragma once

#include "arcfortune/FortuneTypes.h"
#include "arcfortune/segmentation/SentenceSplitter.h"

#include <memory>
#include <string>
#include <vector>

namespace arcfortune {
namespace segmentation {

/**
 * Segmenter: raw work text -> ordered, cleaned sentences
 *
 * Each unit from the splitter has its line breaks folded into spaces and
 * surrounding whitespace stripped; units with minWords or fewer whitespace
 * tokens are dropped. Surviving sentences are re-indexed 0..N-1 in source
 * order. Empty input, or input where nothing survives, yields an empty vector.
 */
class Segmenter {
public:
    Segmenter(std::shared_ptr<const SentenceSplitter> splitter, int minWords);

    std::vector<Sentence> segment(const std::string& rawText) const;

    static std::string clean(const std::string& unit);
    static int count_words(const std::string& text);

private:
    std::shared_ptr<const SentenceSplitter> splitter_;
    int minWords_;
};

}  // namespace segmentation
}  // namespace arcfortune
