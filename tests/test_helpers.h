#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "arcfortune/Errors.h"
#include "arcfortune/FortuneTypes.h"
#include "arcfortune/sentiment/SentimentClassifier.h"

namespace test_helpers {

/// @brief Classifier that looks each text up in a fixed table.
/// Unknown texts classify as Positive with confidence 0. Texts containing
/// `poison` (when set) make the whole batch fail with ClassifierError.
class TableClassifier : public arcfortune::sentiment::SentimentClassifier {
  public:
    explicit TableClassifier(std::map<std::string, arcfortune::Classification> table = {},
                             std::string poison = {})
        : table_(std::move(table)), poison_(std::move(poison)) {}

    std::vector<arcfortune::Classification> classify(const std::vector<std::string>& texts) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batchSizes_.push_back(texts.size());
        }
        std::vector<arcfortune::Classification> out;
        for (const auto& text : texts) {
            if (!poison_.empty() && text.find(poison_) != std::string::npos) {
                throw arcfortune::ClassifierError("model rejected input");
            }
            const auto it = table_.find(text);
            out.push_back(it != table_.end() ? it->second : arcfortune::Classification{});
        }
        return out;
    }

    std::string name() const override { return "table"; }

    std::vector<std::size_t> batchSizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return batchSizes_;
    }

  private:
    std::map<std::string, arcfortune::Classification> table_;
    std::string poison_;
    mutable std::mutex mutex_;
    mutable std::vector<std::size_t> batchSizes_;
};

/// @brief Scores each text by its position in the call sequence: the k-th text
/// seen overall is Positive with confidence k / 1000.
class SequenceClassifier : public arcfortune::sentiment::SentimentClassifier {
  public:
    std::vector<arcfortune::Classification> classify(const std::vector<std::string>& texts) const override {
        std::vector<arcfortune::Classification> out;
        for (std::size_t i = 0; i < texts.size(); ++i) {
            const int k = seen_.fetch_add(1);
            out.push_back({arcfortune::SentimentLabel::Positive, static_cast<double>(k) / 1000.0});
        }
        return out;
    }
    std::string name() const override { return "sequence"; }

  private:
    mutable std::atomic<int> seen_{0};
};

/// @brief Fails the first `failures` calls with TransientClassifierError.
class FlakyClassifier : public arcfortune::sentiment::SentimentClassifier {
  public:
    explicit FlakyClassifier(int failures) : remaining_(failures) {}

    std::vector<arcfortune::Classification> classify(const std::vector<std::string>& texts) const override {
        ++calls_;
        if (remaining_.fetch_sub(1) > 0) {
            throw arcfortune::TransientClassifierError("temporarily unavailable");
        }
        return std::vector<arcfortune::Classification>(texts.size(),
                                                       {arcfortune::SentimentLabel::Negative, 0.5});
    }
    std::string name() const override { return "flaky"; }

    int calls() const { return calls_.load(); }

  private:
    mutable std::atomic<int> remaining_;
    mutable std::atomic<int> calls_{0};
};

/// @brief Returns a fixed, possibly malformed, result for every batch.
class FixedResultClassifier : public arcfortune::sentiment::SentimentClassifier {
  public:
    explicit FixedResultClassifier(std::vector<arcfortune::Classification> results)
        : results_(std::move(results)) {}

    std::vector<arcfortune::Classification> classify(const std::vector<std::string>&) const override {
        return results_;
    }
    std::string name() const override { return "fixed"; }

  private:
    std::vector<arcfortune::Classification> results_;
};

/// @brief Temporary file path removed (with SQLite side files) on destruction.
class TempPath {
  public:
    explicit TempPath(const std::string& suffix) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string stem = "arcfortune_";
        if (info) {
            stem += std::string(info->test_suite_name()) + "_" + info->name() + "_";
        }
        path_ = (std::filesystem::temp_directory_path() / (stem + suffix)).string();
        cleanup();
    }
    ~TempPath() { cleanup(); }

    TempPath(const TempPath&) = delete;
    TempPath& operator=(const TempPath&) = delete;

    const std::string& str() const { return path_; }

  private:
    void cleanup() const {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_ + "-wal", ec);
        std::filesystem::remove(path_ + "-shm", ec);
    }

    std::string path_;
};

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline arcfortune::Sentence makeSentence(const std::string& text, std::size_t position) {
    arcfortune::Sentence s;
    s.rawText = text;
    s.text = text;
    s.wordCount = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != ' ' && (i == 0 || text[i - 1] == ' ')) ++s.wordCount;
    }
    s.position = position;
    return s;
}

}  // namespace test_helpers
