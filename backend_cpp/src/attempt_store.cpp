#include "attempt_store.hpp"
#include "SystemMonitor.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fix_memory {

namespace fs = std::filesystem;
using json = nlohmann::json;

void ConnectionCloser::operator()(sqlite3* db) const {
    if (db) sqlite3_close_v2(db);
}

namespace {

constexpr const char* kConnectionPragmas =
    "PRAGMA journal_mode = WAL;"
    "PRAGMA synchronous = NORMAL;";

// Used when the bundled schema file cannot be found.
constexpr const char* kFallbackSchema = R"(
    CREATE TABLE IF NOT EXISTS fix_attempts (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        issue_type TEXT NOT NULL,
        issue_message TEXT NOT NULL,
        file_path TEXT,
        stage TEXT,
        dense_embedding BLOB,
        sparse_embedding BLOB,
        agent_used TEXT NOT NULL,
        strategy TEXT NOT NULL,
        success BOOLEAN NOT NULL,
        confidence REAL,
        timestamp TEXT NOT NULL,
        session_id TEXT
    );
    CREATE TABLE IF NOT EXISTS strategy_effectiveness (
        agent_strategy TEXT PRIMARY KEY,
        total_attempts INTEGER NOT NULL,
        successful_attempts INTEGER NOT NULL,
        success_rate REAL NOT NULL,
        last_attempted TEXT,
        last_successful TEXT
    );
    CREATE TABLE IF NOT EXISTS recommendation_feedback (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        agent_strategy TEXT NOT NULL,
        confidence REAL,
        accepted BOOLEAN NOT NULL,
        timestamp TEXT NOT NULL
    );
)";

constexpr const char* kRebuildSummarySql = R"(
    INSERT OR REPLACE INTO strategy_effectiveness
        (agent_strategy, total_attempts, successful_attempts,
         success_rate, last_attempted, last_successful)
    SELECT
        agent_used || ':' || strategy AS agent_strategy,
        COUNT(*) AS total_attempts,
        SUM(CASE WHEN success THEN 1 ELSE 0 END) AS successful_attempts,
        CAST(SUM(CASE WHEN success THEN 1 ELSE 0 END) AS REAL) / COUNT(*) AS success_rate,
        MAX(timestamp) AS last_attempted,
        MAX(CASE WHEN success THEN timestamp END) AS last_successful
    FROM fix_attempts
    GROUP BY agent_used || ':' || strategy
)";

constexpr const char* kAttemptColumns =
    "id, issue_type, issue_message, file_path, stage, dense_embedding, sparse_embedding, "
    "agent_used, strategy, success, confidence, timestamp, session_id";

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

Statement prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(raw);
        throw std::runtime_error("prepare failed: " + msg);
    }
    return Statement(raw);
}

void exec_sql(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw std::runtime_error("SQL error: " + msg);
    }
}

void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("step failed: ") + sqlite3_errmsg(db));
    }
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

void bind_blob(sqlite3_stmt* stmt, int idx, const std::vector<std::uint8_t>& bytes) {
    sqlite3_bind_blob(stmt, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec_sql(db_, "BEGIN IMMEDIATE"); }
    ~Transaction() {
        if (!committed_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    void commit() {
        exec_sql(db_, "COMMIT");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

FixAttempt read_attempt(sqlite3_stmt* stmt) {
    FixAttempt attempt;
    attempt.id = sqlite3_column_int64(stmt, 0);

    std::string type_name = column_text(stmt, 1);
    auto type = issue_type_from_string(type_name);
    if (!type) throw std::runtime_error("unknown issue type '" + type_name + "'");
    attempt.issue_type = *type;

    attempt.issue_message = column_text(stmt, 2);
    attempt.file_path = column_optional_text(stmt, 3);
    attempt.stage = column_text(stmt, 4);

    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
        const void* blob = sqlite3_column_blob(stmt, 5);
        int size = sqlite3_column_bytes(stmt, 5);
        attempt.embedding = deserialize_dense(blob, static_cast<std::size_t>(size));
    } else if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        const void* blob = sqlite3_column_blob(stmt, 6);
        int size = sqlite3_column_bytes(stmt, 6);
        attempt.embedding = deserialize_sparse(blob, static_cast<std::size_t>(size));
    } else {
        throw std::runtime_error("row carries no embedding");
    }

    attempt.agent_used = column_text(stmt, 7);
    attempt.strategy = column_text(stmt, 8);
    attempt.success = sqlite3_column_int(stmt, 9) != 0;
    attempt.confidence = sqlite3_column_type(stmt, 10) == SQLITE_NULL ? 0.0 : sqlite3_column_double(stmt, 10);
    attempt.timestamp = column_text(stmt, 11);
    attempt.session_id = column_optional_text(stmt, 12);
    return attempt;
}

std::vector<StrategyEffectiveness> read_summary(sqlite3* db, int limit) {
    std::string sql =
        "SELECT agent_strategy, total_attempts, successful_attempts, success_rate, "
        "last_attempted, last_successful FROM strategy_effectiveness "
        "WHERE total_attempts >= 1 "
        "ORDER BY success_rate DESC, total_attempts DESC, agent_strategy ASC";
    if (limit > 0) sql += " LIMIT " + std::to_string(limit);

    auto stmt = prepare(db, sql);
    std::vector<StrategyEffectiveness> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        StrategyEffectiveness row;
        row.agent_strategy = column_text(stmt.get(), 0);
        row.total_attempts = sqlite3_column_int64(stmt.get(), 1);
        row.successful_attempts = sqlite3_column_int64(stmt.get(), 2);
        row.success_rate = sqlite3_column_double(stmt.get(), 3);
        row.last_attempted = column_text(stmt.get(), 4);
        row.last_successful = column_optional_text(stmt.get(), 5);
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("summary scan failed: ") + sqlite3_errmsg(db));
    }
    return rows;
}

void note_storage_failure(const char* operation, const std::exception& e) {
    SystemMonitor::global_storage_failures.fetch_add(1);
    spdlog::error("Fix strategy storage: {} failed: {}", operation, e.what());
}

} // namespace

std::string format_utc(std::chrono::system_clock::time_point tp) {
    // floor keeps the sub-second part non-negative before the epoch
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return fmt::format("{}.{:06d}", buf, static_cast<long long>(micros));
}

double similarity_weight(float similarity) {
    return 1.0 / (1.0 + std::exp(-5.0 * (static_cast<double>(similarity) - 0.5)));
}

json StrategyEffectiveness::to_json() const {
    return json{
        {"agent_strategy", agent_strategy},
        {"total_attempts", total_attempts},
        {"successful_attempts", successful_attempts},
        {"success_rate", success_rate},
        {"last_attempted", last_attempted},
        {"last_successful", last_successful ? json(*last_successful) : json(nullptr)}
    };
}

json StoreStatistics::to_json() const {
    json top = json::array();
    for (const auto& s : top_strategies) top.push_back(s.to_json());
    return json{
        {"total_attempts", total_attempts},
        {"successful_attempts", successful_attempts},
        {"overall_success_rate", overall_success_rate},
        {"top_strategies", top}
    };
}

AttemptStore::AttemptStore(std::string db_path, std::string schema_path)
    : db_path_(std::move(db_path)), schema_path_(std::move(schema_path)) {
    try {
        fs::path parent = fs::path(db_path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        auto conn = connection();
        initialize_schema(conn.get());
        available_ = true;
        spdlog::info("Fix strategy memory initialized: {}", db_path_);
    } catch (const std::exception& e) {
        note_storage_failure("initialization", e);
    }
}

AttemptStore::~AttemptStore() {
    close();
}

std::shared_ptr<sqlite3> AttemptStore::connection() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (closed_) throw std::runtime_error("store is closed");

    auto id = std::this_thread::get_id();
    auto it = connections_.find(id);
    if (it != connections_.end()) return it->second;

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path_.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    std::shared_ptr<sqlite3> db(raw, ConnectionCloser{});
    if (rc != SQLITE_OK) {
        throw std::runtime_error("cannot open " + db_path_ + ": " + (raw ? sqlite3_errmsg(raw) : "out of memory"));
    }

    sqlite3_busy_timeout(raw, 30000);
    exec_sql(raw, kConnectionPragmas);

    connections_.emplace(id, db);
    spdlog::debug("Opened fix strategy connection #{} for {}", connections_.size(), db_path_);
    return db;
}

void AttemptStore::initialize_schema(sqlite3* db) {
    std::ifstream schema_file(schema_path_);
    if (schema_file) {
        std::stringstream buffer;
        buffer << schema_file.rdbuf();
        exec_sql(db, buffer.str());
        return;
    }

    spdlog::warn("Schema file not found: {}. Creating fallback schema", schema_path_);
    exec_sql(db, kFallbackSchema);
    schema_fallback_used_ = true;
}

bool AttemptStore::record(const Issue& issue,
                          const FixResult& result,
                          const std::string& agent_used,
                          const std::string& strategy,
                          const EmbeddingVector& embedding,
                          const std::optional<std::string>& session_id) {
    try {
        auto conn = connection();
        sqlite3* db = conn.get();
        auto stmt = prepare(db,
            "INSERT INTO fix_attempts "
            "(issue_type, issue_message, file_path, stage, dense_embedding, sparse_embedding, "
            " agent_used, strategy, success, confidence, timestamp, session_id) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)");

        bind_text(stmt.get(), 1, to_string(issue.type));
        bind_text(stmt.get(), 2, issue.message);
        bind_optional_text(stmt.get(), 3, issue.file_path);
        bind_text(stmt.get(), 4, issue.stage);

        if (const auto* dense = std::get_if<DenseVector>(&embedding)) {
            bind_blob(stmt.get(), 5, serialize_dense(*dense));
            sqlite3_bind_null(stmt.get(), 6);
        } else {
            sqlite3_bind_null(stmt.get(), 5);
            bind_blob(stmt.get(), 6, serialize_sparse(std::get<SparseVector>(embedding)));
        }

        bind_text(stmt.get(), 7, agent_used);
        bind_text(stmt.get(), 8, strategy);
        sqlite3_bind_int(stmt.get(), 9, result.success ? 1 : 0);
        sqlite3_bind_double(stmt.get(), 10, std::clamp(result.confidence, 0.0, 1.0));
        bind_text(stmt.get(), 11, format_utc(std::chrono::system_clock::now()));
        bind_optional_text(stmt.get(), 12, session_id);

        step_done(db, stmt.get());

        spdlog::debug("Recorded fix attempt: {}:{} (success={}, confidence={:.2f}, {} embedding)",
                      agent_used, strategy, result.success, result.confidence, to_string(kind_of(embedding)));
        return true;
    } catch (const std::exception& e) {
        note_storage_failure("record", e);
        return false;
    }
}

std::vector<SimilarAttempt> AttemptStore::find_similar(const EmbeddingVector& query,
                                                       std::optional<IssueType> issue_type,
                                                       int k,
                                                       float min_similarity) {
    if (k <= 0) return {};

    auto start = std::chrono::high_resolution_clock::now();
    try {
        auto conn = connection();
        sqlite3* db = conn.get();

        // Rows of the other variant are never loaded, let alone compared
        std::string sql = fmt::format("SELECT {} FROM fix_attempts WHERE {} IS NOT NULL", kAttemptColumns,
                                      kind_of(query) == EmbeddingKind::Dense ? "dense_embedding" : "sparse_embedding");
        if (issue_type) sql += " AND issue_type = ?1";
        sql += " ORDER BY id";

        auto stmt = prepare(db, sql);
        if (issue_type) bind_text(stmt.get(), 1, to_string(*issue_type));

        std::vector<SimilarAttempt> matches;
        int scanned = 0;
        int compared = 0;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            ++scanned;
            FixAttempt attempt;
            try {
                attempt = read_attempt(stmt.get());
            } catch (const std::exception& e) {
                spdlog::warn("Skipping unreadable fix attempt #{}: {}", sqlite3_column_int64(stmt.get(), 0), e.what());
                continue;
            }
            if (!comparable(query, attempt.embedding)) continue;

            ++compared;
            float sim = similarity(query, attempt.embedding);
            if (sim >= min_similarity) {
                matches.push_back({std::move(attempt), sim});
            }
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("scan failed: ") + sqlite3_errmsg(db));
        }

        std::sort(matches.begin(), matches.end(), [](const SimilarAttempt& a, const SimilarAttempt& b) {
            if (a.similarity != b.similarity) return a.similarity > b.similarity;
            return a.attempt.id < b.attempt.id;
        });
        if (matches.size() > static_cast<size_t>(k)) {
            matches.resize(k);
        }

        auto end = std::chrono::high_resolution_clock::now();
        SystemMonitor::global_scan_latency_ms.store(std::chrono::duration<double, std::milli>(end - start).count());
        SystemMonitor::global_rows_scanned.store(scanned);
        SystemMonitor::global_rows_compared.store(compared);

        if (matches.empty()) {
            spdlog::debug("No similar issues above {:.2f} ({} rows compared)", min_similarity, compared);
        } else {
            spdlog::debug("Found {} similar issues (top similarity {:.3f}, {} rows compared)",
                          matches.size(), matches.front().similarity, compared);
        }
        return matches;
    } catch (const std::exception& e) {
        note_storage_failure("find_similar", e);
        return {};
    }
}

std::optional<std::pair<std::string, double>> AttemptStore::recommend_from_store(const Issue& issue,
                                                                                 const EmbeddingVector& query,
                                                                                 int k) {
    auto similar = find_similar(query, issue.type, k);

    // Ordered by key, so equal scores resolve to the lexically smallest key
    std::map<std::string, std::pair<double, int>> scores;
    for (const auto& match : similar) {
        if (!match.attempt.success) continue;
        auto& [score, count] = scores[match.attempt.strategy_key()];
        score += similarity_weight(match.similarity) * match.attempt.confidence;
        ++count;
    }

    if (scores.empty()) {
        spdlog::debug("No successful similar attempts found for recommendation");
        return std::nullopt;
    }

    auto best = scores.begin();
    for (auto it = std::next(scores.begin()); it != scores.end(); ++it) {
        if (it->second.first > best->second.first) best = it;
    }

    const auto& [score, count] = best->second;
    double base_confidence = score / count;
    double boost = std::min(0.1, count * 0.02);
    double final_confidence = std::min(base_confidence + boost, 1.0);

    spdlog::info("Strategy recommendation: {} (confidence={:.3f}, based on {} attempts)",
                 best->first, final_confidence, count);
    return std::make_pair(best->first, final_confidence);
}

void AttemptStore::rebuild_summary_on(sqlite3* db) {
    Transaction tx(db);
    exec_sql(db, "DELETE FROM strategy_effectiveness");
    exec_sql(db, kRebuildSummarySql);
    tx.commit();
}

bool AttemptStore::rebuild_effectiveness_summary() {
    try {
        auto conn = connection();
        rebuild_summary_on(conn.get());
        spdlog::info("Strategy effectiveness statistics updated");
        return true;
    } catch (const std::exception& e) {
        note_storage_failure("rebuild_effectiveness_summary", e);
        return false;
    }
}

std::vector<StrategyEffectiveness> AttemptStore::effectiveness_summary(int limit) {
    try {
        auto conn = connection();
        return read_summary(conn.get(), limit);
    } catch (const std::exception& e) {
        note_storage_failure("effectiveness_summary", e);
        return {};
    }
}

StoreStatistics AttemptStore::statistics() {
    StoreStatistics stats;
    try {
        auto conn = connection();
        sqlite3* db = conn.get();
        auto stmt = prepare(db,
            "SELECT COUNT(*), COALESCE(SUM(CASE WHEN success THEN 1 ELSE 0 END), 0) FROM fix_attempts");
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw std::runtime_error(std::string("statistics query failed: ") + sqlite3_errmsg(db));
        }
        stats.total_attempts = sqlite3_column_int64(stmt.get(), 0);
        stats.successful_attempts = sqlite3_column_int64(stmt.get(), 1);
        if (stats.total_attempts > 0) {
            stats.overall_success_rate =
                static_cast<double>(stats.successful_attempts) / static_cast<double>(stats.total_attempts);
        }
        stats.top_strategies = read_summary(db, 10);
    } catch (const std::exception& e) {
        note_storage_failure("statistics", e);
        return StoreStatistics{};
    }
    return stats;
}

bool AttemptStore::record_feedback(const std::string& agent_strategy, double confidence, bool accepted) {
    try {
        auto conn = connection();
        sqlite3* db = conn.get();
        auto stmt = prepare(db,
            "INSERT INTO recommendation_feedback (agent_strategy, confidence, accepted, timestamp) "
            "VALUES (?1, ?2, ?3, ?4)");
        bind_text(stmt.get(), 1, agent_strategy);
        sqlite3_bind_double(stmt.get(), 2, confidence);
        sqlite3_bind_int(stmt.get(), 3, accepted ? 1 : 0);
        bind_text(stmt.get(), 4, format_utc(std::chrono::system_clock::now()));
        step_done(db, stmt.get());
        return true;
    } catch (const std::exception& e) {
        note_storage_failure("record_feedback", e);
        return false;
    }
}

int AttemptStore::apply_retention(int max_age_days) {
    if (max_age_days <= 0) return 0;

    try {
        auto now = std::chrono::system_clock::now();
        auto elapsed_days = std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch()).count() / 24;
        if (max_age_days >= elapsed_days) {
            spdlog::debug("Retention of {} days reaches past the epoch, nothing to remove", max_age_days);
            return 0;
        }

        auto conn = connection();
        sqlite3* db = conn.get();
        auto cutoff = now - std::chrono::hours(24) * static_cast<long long>(max_age_days);
        auto stmt = prepare(db, "DELETE FROM fix_attempts WHERE timestamp < ?1");
        bind_text(stmt.get(), 1, format_utc(cutoff));
        step_done(db, stmt.get());

        int removed = sqlite3_changes(db);
        if (removed > 0) {
            rebuild_summary_on(db);
            spdlog::info("Retention: removed {} fix attempts older than {} days", removed, max_age_days);
        }
        return removed;
    } catch (const std::exception& e) {
        note_storage_failure("apply_retention", e);
        return 0;
    }
}

std::int64_t AttemptStore::attempt_count() {
    try {
        auto conn = connection();
        sqlite3* db = conn.get();
        auto stmt = prepare(db, "SELECT COUNT(*) FROM fix_attempts");
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw std::runtime_error(std::string("count failed: ") + sqlite3_errmsg(db));
        }
        return sqlite3_column_int64(stmt.get(), 0);
    } catch (const std::exception& e) {
        note_storage_failure("attempt_count", e);
        return 0;
    }
}

void AttemptStore::close() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    closed_ = true;
    available_ = false;

    if (!connections_.empty()) {
        spdlog::debug("Fix strategy storage closed ({} connections)", connections_.size());
    }
    connections_.clear();
}

} // namespace fix_memory
