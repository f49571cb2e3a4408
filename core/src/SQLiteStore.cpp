#include "arcfortune/SQLiteStore.h"

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

#include "arcfortune/CoreContract.h"
#include "arcfortune/Utility.h"

namespace arcfortune {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(message);
    }
}

Statement prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    return Statement(stmt);
}

void step_done_or_throw(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(sqlite3_errmsg(db));
    }
    sqlite3_reset(stmt);
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<double>& value) {
    if (value) {
        sqlite3_bind_double(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

std::optional<double> column_optional(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(stmt, col);
}

// Delete every row of `table` whose `column` equals `row`.
void delete_where(sqlite3* db, const std::string& table, const std::string& column, long long row) {
    auto stmt = prepare_or_throw(db, "DELETE FROM " + table + " WHERE " + column + "=?;");
    sqlite3_bind_int64(stmt.get(), 1, row);
    step_done_or_throw(db, stmt.get());
}

}  // namespace

SQLiteStore::SQLiteStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite database at " + path + ": " + message);
    }
}

SQLiteStore::~SQLiteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SQLiteStore::initialize() {
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;

        CREATE TABLE IF NOT EXISTS schema_version (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            contract_version TEXT NOT NULL,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE TABLE IF NOT EXISTS works (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            work_id TEXT NOT NULL UNIQUE,
            title TEXT NOT NULL,
            source_path TEXT,
            sentence_count INTEGER NOT NULL,
            ultimate_fortune REAL NOT NULL,
            macro_arc_final REAL,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE TRIGGER IF NOT EXISTS update_works_timestamp
            AFTER UPDATE ON works FOR EACH ROW
        BEGIN
            UPDATE works SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;
        END;

        CREATE TABLE IF NOT EXISTS sentences (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            work_fk INTEGER NOT NULL,
            position INTEGER NOT NULL,
            text TEXT NOT NULL,
            raw_text TEXT NOT NULL,
            word_count INTEGER NOT NULL,
            raw_score REAL NOT NULL,
            FOREIGN KEY(work_fk) REFERENCES works(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_sentences_work ON sentences(work_fk, position);

        -- Named views consumed by the viewer: {work_id}_original, {work_id}_cumulative, index
        CREATE TABLE IF NOT EXISTS bundles (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            kind TEXT NOT NULL,
            work_fk INTEGER,
            FOREIGN KEY(work_fk) REFERENCES works(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS curves (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            bundle_fk INTEGER NOT NULL,
            curve_name TEXT NOT NULL,
            curve_type TEXT NOT NULL,
            requested_window INTEGER NOT NULL,
            effective_window INTEGER NOT NULL,
            degree INTEGER NOT NULL,
            length INTEGER NOT NULL,
            omitted INTEGER NOT NULL DEFAULT 0,
            data_blob BLOB NOT NULL,
            FOREIGN KEY(bundle_fk) REFERENCES bundles(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_curves_bundle ON curves(bundle_fk);

        CREATE TABLE IF NOT EXISTS issues (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            work_fk INTEGER NOT NULL,
            type TEXT NOT NULL,
            curve TEXT,
            severity REAL NOT NULL,
            explanation TEXT,
            FOREIGN KEY(work_fk) REFERENCES works(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_issues_work ON issues(work_fk);

        CREATE TABLE IF NOT EXISTS failures (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            work_id TEXT NOT NULL,
            source_path TEXT,
            stage TEXT NOT NULL,
            message TEXT NOT NULL,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP
        );

        CREATE TABLE IF NOT EXISTS ranking (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            bundle_fk INTEGER NOT NULL,
            rank INTEGER NOT NULL,
            work_id TEXT NOT NULL,
            title TEXT NOT NULL,
            ultimate_fortune REAL NOT NULL,
            macro_arc_final REAL,
            hue REAL NOT NULL,
            color_r INTEGER NOT NULL,
            color_g INTEGER NOT NULL,
            color_b INTEGER NOT NULL,
            color TEXT NOT NULL,
            FOREIGN KEY(bundle_fk) REFERENCES bundles(id) ON DELETE CASCADE
        );
    )SQL";

    exec_or_throw(db_, schema);

    auto stmt = prepare_or_throw(db_,
        "INSERT INTO schema_version (id, contract_version) VALUES (1, ?) "
        "ON CONFLICT(id) DO UPDATE SET contract_version=excluded.contract_version, updated_at=CURRENT_TIMESTAMP;");
    bind_text(stmt.get(), 1, contract::CORE_CONTRACT_VERSION);
    step_done_or_throw(db_, stmt.get());
}

long long SQLiteStore::insertBundle(const std::string& name, const std::string& kind, std::optional<long long> workRow) {
    auto stmt = prepare_or_throw(db_, "INSERT INTO bundles (name, kind, work_fk) VALUES (?,?,?);");
    bind_text(stmt.get(), 1, name);
    bind_text(stmt.get(), 2, kind);
    if (workRow) {
        sqlite3_bind_int64(stmt.get(), 3, *workRow);
    } else {
        sqlite3_bind_null(stmt.get(), 3);
    }
    step_done_or_throw(db_, stmt.get());
    return sqlite3_last_insert_rowid(db_);
}

void SQLiteStore::insertCurve(long long bundleRow, const CurveSeries& curve) {
    auto stmt = prepare_or_throw(db_,
        "INSERT INTO curves (bundle_fk, curve_name, curve_type, requested_window, effective_window, degree, length, "
        "omitted, data_blob) VALUES (?,?,?,?,?,?,?,?,?);");

    const std::string name = curve_name(curve);
    const std::string kindString = curve_kind_to_string(curve.kind);

    // Serialize values to BLOB (float array, NaN = missing)
    std::vector<float> float_values(curve.values.begin(), curve.values.end());
    const int blob_size = static_cast<int>(float_values.size() * sizeof(float));

    sqlite3_bind_int64(stmt.get(), 1, bundleRow);
    bind_text(stmt.get(), 2, name);
    bind_text(stmt.get(), 3, kindString);
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(curve.requestedWindow));
    sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(curve.window));
    sqlite3_bind_int(stmt.get(), 6, curve.degree);
    sqlite3_bind_int64(stmt.get(), 7, static_cast<sqlite3_int64>(curve.values.size()));
    sqlite3_bind_int(stmt.get(), 8, curve.omitted ? 1 : 0);
    if (float_values.empty()) {
        sqlite3_bind_zeroblob(stmt.get(), 9, 0);
    } else {
        sqlite3_bind_blob(stmt.get(), 9, float_values.data(), blob_size, SQLITE_TRANSIENT);
    }
    step_done_or_throw(db_, stmt.get());
}

void SQLiteStore::save_work(const WorkAnalysis& analysis) {
    const Work& work = analysis.work;
    if (analysis.scores.size() != work.sentences.size()) {
        throw std::runtime_error("Score series of '" + work.workId + "' is not aligned with its sentences");
    }

    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        // Upsert work record on work_id
        long long work_row = -1;
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO works (work_id, title, source_path, sentence_count, ultimate_fortune, macro_arc_final) "
                "VALUES (?,?,?,?,?,?) "
                "ON CONFLICT(work_id) DO UPDATE SET "
                "title=excluded.title, source_path=excluded.source_path, sentence_count=excluded.sentence_count, "
                "ultimate_fortune=excluded.ultimate_fortune, macro_arc_final=excluded.macro_arc_final "
                "RETURNING id;");

            bind_text(stmt.get(), 1, work.workId);
            bind_text(stmt.get(), 2, work.title);
            bind_text(stmt.get(), 3, work.sourcePath);
            sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(work.sentences.size()));
            sqlite3_bind_double(stmt.get(), 5, analysis.summary.ultimateFortune);
            bind_optional(stmt.get(), 6, analysis.summary.macroArcFinal);

            if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
                work_row = sqlite3_column_int64(stmt.get(), 0);
            }
        }

        if (work_row < 0) {
            throw std::runtime_error("Failed to insert/get work row for '" + work.workId + "'");
        }

        // Delete existing artifacts for this work
        {
            auto stmt = prepare_or_throw(db_,
                "DELETE FROM curves WHERE bundle_fk IN (SELECT id FROM bundles WHERE work_fk=?);");
            sqlite3_bind_int64(stmt.get(), 1, work_row);
            step_done_or_throw(db_, stmt.get());
        }
        delete_where(db_, "bundles", "work_fk", work_row);
        delete_where(db_, "sentences", "work_fk", work_row);
        delete_where(db_, "issues", "work_fk", work_row);
        {
            auto stmt = prepare_or_throw(db_, "DELETE FROM failures WHERE work_id=?;");
            bind_text(stmt.get(), 1, work.workId);
            step_done_or_throw(db_, stmt.get());
        }

        // Insert sentences with their raw scores
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO sentences (work_fk, position, text, raw_text, word_count, raw_score) VALUES (?,?,?,?,?,?);");
            for (std::size_t i = 0; i < work.sentences.size(); ++i) {
                const Sentence& s = work.sentences[i];
                sqlite3_bind_int64(stmt.get(), 1, work_row);
                sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(s.position));
                bind_text(stmt.get(), 3, s.text);
                bind_text(stmt.get(), 4, s.rawText);
                sqlite3_bind_int(stmt.get(), 5, s.wordCount);
                sqlite3_bind_double(stmt.get(), 6, analysis.scores[i]);
                step_done_or_throw(db_, stmt.get());
            }
        }

        // Volatility bundle: raw scores + moving averages + smoothed curves
        {
            const long long bundle =
                insertBundle(work.workId + contract::VOLATILITY_BUNDLE_SUFFIX, "volatility", work_row);

            CurveSeries raw;
            raw.kind = CurveKind::RawScore;
            raw.values = analysis.scores;
            insertCurve(bundle, raw);

            for (const auto& curve : analysis.volatility.rolling) insertCurve(bundle, curve);
            for (const auto& curve : analysis.volatility.smoothed) insertCurve(bundle, curve);
        }

        // Cumulative bundle: running sum + Macro Arc + secondary views
        {
            const long long bundle =
                insertBundle(work.workId + contract::CUMULATIVE_BUNDLE_SUFFIX, "cumulative", work_row);

            insertCurve(bundle, analysis.cumulative.running);
            insertCurve(bundle, analysis.cumulative.macroArc);
            for (const auto& curve : analysis.cumulative.secondary) insertCurve(bundle, curve);
        }

        // Insert issues
        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO issues (work_fk, type, curve, severity, explanation) VALUES (?,?,?,?,?);");
            for (const auto& issue : analysis.issues) {
                sqlite3_bind_int64(stmt.get(), 1, work_row);
                bind_text(stmt.get(), 2, issue.type);
                bind_text(stmt.get(), 3, issue.curve);
                sqlite3_bind_double(stmt.get(), 4, issue.severity);
                bind_text(stmt.get(), 5, issue.explanation);
                step_done_or_throw(db_, stmt.get());
            }
        }

        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        exec_or_throw(db_, "ROLLBACK;");
        throw;
    }
}

void SQLiteStore::save_failure(const WorkFailure& failure) {
    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        {
            auto stmt = prepare_or_throw(db_, "DELETE FROM failures WHERE work_id=?;");
            bind_text(stmt.get(), 1, failure.workId);
            step_done_or_throw(db_, stmt.get());
        }

        // Artifacts of an earlier successful run of this work are stale now
        long long work_row = -1;
        {
            auto stmt = prepare_or_throw(db_, "SELECT id FROM works WHERE work_id=?;");
            bind_text(stmt.get(), 1, failure.workId);
            if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
                work_row = sqlite3_column_int64(stmt.get(), 0);
            }
        }
        if (work_row >= 0) {
            {
                auto stmt = prepare_or_throw(db_,
                    "DELETE FROM curves WHERE bundle_fk IN (SELECT id FROM bundles WHERE work_fk=?);");
                sqlite3_bind_int64(stmt.get(), 1, work_row);
                step_done_or_throw(db_, stmt.get());
            }
            delete_where(db_, "bundles", "work_fk", work_row);
            delete_where(db_, "sentences", "work_fk", work_row);
            delete_where(db_, "issues", "work_fk", work_row);
            delete_where(db_, "works", "id", work_row);
        }

        {
            auto stmt = prepare_or_throw(db_,
                "INSERT INTO failures (work_id, source_path, stage, message) VALUES (?,?,?,?);");
            bind_text(stmt.get(), 1, failure.workId);
            bind_text(stmt.get(), 2, failure.sourcePath);
            bind_text(stmt.get(), 3, failure.stage);
            bind_text(stmt.get(), 4, failure.message);
            step_done_or_throw(db_, stmt.get());
        }
        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        exec_or_throw(db_, "ROLLBACK;");
        throw;
    }
}

void SQLiteStore::save_ranking(const CorpusRanking& ranking) {
    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        // The master bundle always reflects the latest run only
        exec_or_throw(db_, "DELETE FROM ranking;");
        {
            auto stmt = prepare_or_throw(db_, "DELETE FROM bundles WHERE name=?;");
            bind_text(stmt.get(), 1, contract::MASTER_BUNDLE_NAME);
            step_done_or_throw(db_, stmt.get());
        }

        const long long bundle = insertBundle(contract::MASTER_BUNDLE_NAME, "master", std::nullopt);

        auto stmt = prepare_or_throw(db_,
            "INSERT INTO ranking (bundle_fk, rank, work_id, title, ultimate_fortune, macro_arc_final, hue, "
            "color_r, color_g, color_b, color) VALUES (?,?,?,?,?,?,?,?,?,?,?);");
        for (const auto& entry : ranking.entries) {
            sqlite3_bind_int64(stmt.get(), 1, bundle);
            sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(entry.rank));
            bind_text(stmt.get(), 3, entry.work.workId);
            bind_text(stmt.get(), 4, entry.work.title);
            sqlite3_bind_double(stmt.get(), 5, entry.work.ultimateFortune);
            bind_optional(stmt.get(), 6, entry.work.macroArcFinal);
            sqlite3_bind_double(stmt.get(), 7, entry.hue);
            sqlite3_bind_int(stmt.get(), 8, entry.color.r);
            sqlite3_bind_int(stmt.get(), 9, entry.color.g);
            sqlite3_bind_int(stmt.get(), 10, entry.color.b);
            bind_text(stmt.get(), 11, entry.colorString);
            step_done_or_throw(db_, stmt.get());
        }

        exec_or_throw(db_, "COMMIT;");
    } catch (...) {
        exec_or_throw(db_, "ROLLBACK;");
        throw;
    }
}

std::optional<WorkResult> SQLiteStore::load_work(const std::string& workId) const {
    auto stmt = prepare_or_throw(db_,
        "SELECT work_id, title, ultimate_fortune, macro_arc_final, sentence_count FROM works WHERE work_id=?;");
    bind_text(stmt.get(), 1, workId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    WorkResult result;
    result.workId = column_string(stmt.get(), 0);
    result.title = column_string(stmt.get(), 1);
    result.ultimateFortune = sqlite3_column_double(stmt.get(), 2);
    result.macroArcFinal = column_optional(stmt.get(), 3);
    result.sentenceCount = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 4));
    return result;
}

std::vector<Sentence> SQLiteStore::load_sentences(const std::string& workId) const {
    auto stmt = prepare_or_throw(db_,
        "SELECT s.position, s.text, s.raw_text, s.word_count FROM sentences s "
        "JOIN works w ON s.work_fk = w.id WHERE w.work_id=? ORDER BY s.position;");
    bind_text(stmt.get(), 1, workId);

    std::vector<Sentence> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        Sentence s;
        s.position = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
        s.text = column_string(stmt.get(), 1);
        s.rawText = column_string(stmt.get(), 2);
        s.wordCount = sqlite3_column_int(stmt.get(), 3);
        out.push_back(std::move(s));
    }
    return out;
}

std::optional<CurveSeries> SQLiteStore::load_curve(const std::string& bundle, const std::string& curveName) const {
    auto stmt = prepare_or_throw(db_,
        "SELECT c.curve_type, c.requested_window, c.effective_window, c.degree, c.length, c.omitted, c.data_blob "
        "FROM curves c JOIN bundles b ON c.bundle_fk = b.id WHERE b.name=? AND c.curve_name=?;");
    bind_text(stmt.get(), 1, bundle);
    bind_text(stmt.get(), 2, curveName);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    CurveSeries curve;
    curve.kind = curve_kind_from_string(column_string(stmt.get(), 0));
    curve.requestedWindow = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 1));
    curve.window = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 2));
    curve.degree = sqlite3_column_int(stmt.get(), 3);
    const auto length = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 4));
    curve.omitted = sqlite3_column_int(stmt.get(), 5) != 0;

    const void* blob = sqlite3_column_blob(stmt.get(), 6);
    const auto bytes = static_cast<std::size_t>(sqlite3_column_bytes(stmt.get(), 6));
    if (bytes != length * sizeof(float)) {
        throw std::runtime_error("Corrupt curve blob for " + bundle + "/" + curveName);
    }
    std::vector<float> float_values(length);
    if (length > 0) {
        std::memcpy(float_values.data(), blob, bytes);
    }
    curve.values.assign(float_values.begin(), float_values.end());
    return curve;
}

std::vector<std::string> SQLiteStore::load_bundle_names() const {
    auto stmt = prepare_or_throw(db_, "SELECT name FROM bundles ORDER BY id;");
    std::vector<std::string> names;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        names.push_back(column_string(stmt.get(), 0));
    }
    return names;
}

std::vector<WorkIssue> SQLiteStore::load_issues(const std::string& workId) const {
    auto stmt = prepare_or_throw(db_,
        "SELECT i.type, i.curve, i.severity, i.explanation FROM issues i "
        "JOIN works w ON i.work_fk = w.id WHERE w.work_id=? ORDER BY i.id;");
    bind_text(stmt.get(), 1, workId);

    std::vector<WorkIssue> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        WorkIssue issue;
        issue.type = column_string(stmt.get(), 0);
        issue.curve = column_string(stmt.get(), 1);
        issue.severity = sqlite3_column_double(stmt.get(), 2);
        issue.explanation = column_string(stmt.get(), 3);
        out.push_back(std::move(issue));
    }
    return out;
}

CorpusRanking SQLiteStore::load_ranking() const {
    auto stmt = prepare_or_throw(db_,
        "SELECT r.rank, r.work_id, r.title, r.ultimate_fortune, r.macro_arc_final, r.hue, "
        "r.color_r, r.color_g, r.color_b, r.color, COALESCE(w.sentence_count, 0) "
        "FROM ranking r LEFT JOIN works w ON w.work_id = r.work_id ORDER BY r.rank;");

    CorpusRanking ranking;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        RankedWork entry;
        entry.rank = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
        entry.work.workId = column_string(stmt.get(), 1);
        entry.work.title = column_string(stmt.get(), 2);
        entry.work.ultimateFortune = sqlite3_column_double(stmt.get(), 3);
        entry.work.macroArcFinal = column_optional(stmt.get(), 4);
        entry.hue = sqlite3_column_double(stmt.get(), 5);
        entry.color = RgbColor{sqlite3_column_int(stmt.get(), 6), sqlite3_column_int(stmt.get(), 7),
                               sqlite3_column_int(stmt.get(), 8)};
        entry.colorString = column_string(stmt.get(), 9);
        entry.work.sentenceCount = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 10));
        ranking.entries.push_back(std::move(entry));
    }
    return ranking;
}

std::vector<WorkFailure> SQLiteStore::load_failures() const {
    auto stmt = prepare_or_throw(db_, "SELECT work_id, source_path, stage, message FROM failures ORDER BY id;");
    std::vector<WorkFailure> out;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        WorkFailure f;
        f.workId = column_string(stmt.get(), 0);
        f.sourcePath = column_string(stmt.get(), 1);
        f.stage = column_string(stmt.get(), 2);
        f.message = column_string(stmt.get(), 3);
        out.push_back(std::move(f));
    }
    return out;
}

}  // namespace arcfortune
