#pragma once

#include "arcfortune/FortuneTypes.h"

#include <string>
#include <vector>

namespace arcfortune {
namespace sentiment {

/**
 * SentimentClassifier: binary POSITIVE/NEGATIVE classification capability
 *
 * classify() returns exactly one Classification per input text, in input
 * order, each with confidence in [0,1]. Failures that may succeed on a retry
 * are reported as TransientClassifierError, anything else as ClassifierError.
 *
 * One loaded instance is shared read-only by every worker, so classify() must
 * be safe to call concurrently.
 */
class SentimentClassifier {
public:
    virtual ~SentimentClassifier() = default;

    virtual std::vector<Classification> classify(const std::vector<std::string>& texts) const = 0;
    virtual std::string name() const = 0;
};

}  // namespace sentiment
}  // namespace arcfortune
