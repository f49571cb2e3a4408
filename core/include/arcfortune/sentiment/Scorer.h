#pragma once

#include "arcfortune/FortuneTypes.h"
#include "arcfortune/sentiment/SentimentClassifier.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace arcfortune {
namespace sentiment {

/**
 * Scorer: Sentences -> bipolar score series
 *
 * Sentences are classified in batches of batchSize; score i always belongs
 * to sentence i. A TransientClassifierError on a batch is retried up to
 * maxRetries times. Any other failure, a result count that differs from the
 * batch, or a confidence outside [0,1] throws ScoringError.
 */
class Scorer {
public:
    Scorer(std::shared_ptr<const SentimentClassifier> classifier, std::size_t batchSize, int maxRetries);

    std::vector<double> score(const std::vector<Sentence>& sentences) const;

    // Positive -> +confidence, Negative -> -confidence
    static double to_bipolar(const Classification& c);

private:
    std::vector<Classification> classifyBatch(const std::vector<std::string>& batch, std::size_t offset) const;

    std::shared_ptr<const SentimentClassifier> classifier_;
    std::size_t batchSize_;
    int maxRetries_;
};

}  // namespace sentiment
}  // namespace arcfortune
