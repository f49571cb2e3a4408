#include "arcfortune/sentiment/Scorer.h"
#include "arcfortune/Errors.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

namespace arcfortune {
namespace sentiment {

Scorer::Scorer(std::shared_ptr<const SentimentClassifier> classifier, std::size_t batchSize, int maxRetries)
    : classifier_(std::move(classifier)), batchSize_(batchSize), maxRetries_(maxRetries) {
    if (!classifier_) {
        throw std::invalid_argument("Scorer requires a classifier");
    }
    if (batchSize_ == 0) {
        throw std::invalid_argument("Scorer batch size must be positive");
    }
    if (maxRetries_ < 0) {
        throw std::invalid_argument("Scorer retry count must not be negative");
    }
}

double Scorer::to_bipolar(const Classification& c) {
    return c.label == SentimentLabel::Positive ? c.confidence : -c.confidence;
}

std::vector<Classification> Scorer::classifyBatch(const std::vector<std::string>& batch, std::size_t offset) const {
    for (int attempt = 0;; ++attempt) {
        try {
            return classifier_->classify(batch);
        } catch (const TransientClassifierError& e) {
            if (attempt >= maxRetries_) {
                throw ScoringError("Classifier failed on sentences " + std::to_string(offset) + ".." +
                                   std::to_string(offset + batch.size() - 1) + " after " +
                                   std::to_string(maxRetries_) + " retries: " + e.what());
            }
            std::fprintf(stderr, "[Scorer] WARNING: transient classifier failure (attempt %d/%d): %s\n",
                         attempt + 1, maxRetries_ + 1, e.what());
        } catch (const ClassifierError& e) {
            throw ScoringError(std::string("Classifier failed: ") + e.what());
        }
    }
}

std::vector<double> Scorer::score(const std::vector<Sentence>& sentences) const {
    std::vector<double> scores;
    scores.reserve(sentences.size());

    std::vector<std::string> batch;
    batch.reserve(std::min(batchSize_, sentences.size()));

    for (std::size_t offset = 0; offset < sentences.size(); offset += batchSize_) {
        const std::size_t end = std::min(offset + batchSize_, sentences.size());
        batch.clear();
        for (std::size_t i = offset; i < end; ++i) {
            batch.push_back(sentences[i].text);
        }

        const auto results = classifyBatch(batch, offset);
        if (results.size() != batch.size()) {
            throw ScoringError("Classifier returned " + std::to_string(results.size()) + " results for a batch of " +
                               std::to_string(batch.size()));
        }

        for (std::size_t k = 0; k < results.size(); ++k) {
            const double confidence = results[k].confidence;
            if (!(confidence >= 0.0 && confidence <= 1.0)) {
                throw ScoringError("Confidence out of range for sentence " + std::to_string(offset + k) + ": " +
                                   std::to_string(confidence));
            }
            scores.push_back(to_bipolar(results[k]));
        }
    }
    return scores;
}

}  // namespace sentiment
}  // namespace arcfortune
