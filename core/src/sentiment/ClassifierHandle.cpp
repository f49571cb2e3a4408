#include "arcfortune/sentiment/ClassifierHandle.h"
#include "arcfortune/Errors.h"

#include <exception>
#include <string>
#include <utility>

namespace arcfortune {
namespace sentiment {

ClassifierHandle::ClassifierHandle(Loader loader) : loader_(std::move(loader)) {}

ClassifierHandle::~ClassifierHandle() {
    release();
}

std::shared_ptr<const SentimentClassifier> ClassifierHandle::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (classifier_) {
        return classifier_;
    }
    if (!loader_) {
        throw ClassifierError("No classifier loader configured");
    }

    std::unique_ptr<SentimentClassifier> loaded;
    try {
        loaded = loader_();
    } catch (const ClassifierError&) {
        throw;
    } catch (const std::exception& e) {
        throw ClassifierError(std::string("Classifier failed to load: ") + e.what());
    }
    if (!loaded) {
        throw ClassifierError("Classifier loader returned no classifier");
    }

    classifier_ = std::move(loaded);
    return classifier_;
}

void ClassifierHandle::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    classifier_.reset();
}

bool ClassifierHandle::loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return classifier_ != nullptr;
}

}  // namespace sentiment
}  // namespace arcfortune
