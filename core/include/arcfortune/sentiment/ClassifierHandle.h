#pragma once

#include "arcfortune/sentiment/SentimentClassifier.h"

#include <functional>
#include <memory>
#include <mutex>

namespace arcfortune {
namespace sentiment {

/**
 * ClassifierHandle: explicit lifecycle for the process-wide classifier
 *
 * acquire() runs the loader once and hands out the same shared instance to
 * every caller until release(). Loader exceptions and a null result surface as
 * ClassifierError. Destroying the handle releases the classifier; workers that
 * still hold the shared_ptr keep it alive until they finish.
 */
class ClassifierHandle {
public:
    using Loader = std::function<std::unique_ptr<SentimentClassifier>()>;

    explicit ClassifierHandle(Loader loader);
    ~ClassifierHandle();

    ClassifierHandle(const ClassifierHandle&) = delete;
    ClassifierHandle& operator=(const ClassifierHandle&) = delete;

    std::shared_ptr<const SentimentClassifier> acquire();
    void release();
    bool loaded() const;

private:
    Loader loader_;
    mutable std::mutex mutex_;
    std::shared_ptr<const SentimentClassifier> classifier_;
};

}  // namespace sentiment
}  // namespace arcfortune
