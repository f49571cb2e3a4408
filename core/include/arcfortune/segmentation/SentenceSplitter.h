#pragma once

#include <string>
#include <vector>

namespace arcfortune {
namespace segmentation {

/**
 * SentenceSplitter: sentence-boundary capability
 *
 * Returns the sentence-level units of a text in source order, unmodified
 * (line breaks and surrounding whitespace are left for the Segmenter).
 * Implementations must be safe to call concurrently on a const instance.
 */
class SentenceSplitter {
public:
    virtual ~SentenceSplitter() = default;

    virtual std::vector<std::string> split(const std::string& text) const = 0;
};

/**
 * RuleSentenceSplitter: punctuation-driven default splitter
 *
 * A unit ends after '.', '!' or '?' together with any directly following
 * terminal punctuation and closing quotes/brackets, or at a blank line.
 * "Mr." / "Mrs." / "Ms." / "Dr." / "St." do not end a unit.
 */
class RuleSentenceSplitter : public SentenceSplitter {
public:
    RuleSentenceSplitter() = default;

    std::vector<std::string> split(const std::string& text) const override;
};

}  // namespace segmentation
}  // namespace arcfortune
