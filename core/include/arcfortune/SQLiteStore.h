#pragma once

#include "arcfortune/FortuneTypes.h"

#include <sqlite3.h>

#include <optional>
#include <string>
#include <vector>

namespace arcfortune {

/**
 * SQLiteStore: artifact database for one or more corpus runs
 *
 * Per work:  works row, sentences, `{work_id}_original` and
 *            `{work_id}_cumulative` bundles with their curves, issues.
 * Per run:   `index` bundle with the ranking, failures.
 *
 * Curves are float32 BLOBs; missing values are stored as NaN. Saving a work
 * id that already exists replaces all of its artifacts. Recording a failure
 * removes any artifacts stored for that work id, and saving the work clears
 * its failure.
 */
class SQLiteStore {
  public:
    explicit SQLiteStore(const std::string& path);
    ~SQLiteStore();

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    void initialize();

    void save_work(const WorkAnalysis& analysis);
    void save_failure(const WorkFailure& failure);
    void save_ranking(const CorpusRanking& ranking);

    // Read-back
    std::optional<WorkResult> load_work(const std::string& workId) const;
    std::vector<Sentence> load_sentences(const std::string& workId) const;
    std::optional<CurveSeries> load_curve(const std::string& bundle, const std::string& curveName) const;
    std::vector<std::string> load_bundle_names() const;
    std::vector<WorkIssue> load_issues(const std::string& workId) const;
    CorpusRanking load_ranking() const;
    std::vector<WorkFailure> load_failures() const;

  private:
    long long insertBundle(const std::string& name, const std::string& kind, std::optional<long long> workRow);
    void insertCurve(long long bundleRow, const CurveSeries& curve);

    sqlite3* db_{nullptr};
};

}  // namespace arcfortune
