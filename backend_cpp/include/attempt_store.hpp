#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "issue.hpp"
#include "embedding_vector.hpp"
#include "EngineConfig.hpp"

struct sqlite3;

namespace fix_memory {

struct FixAttempt {
    std::int64_t id = 0;
    IssueType issue_type = IssueType::FORMATTING;
    std::string issue_message;
    std::optional<std::string> file_path;
    std::string stage;
    EmbeddingVector embedding;
    std::string agent_used;
    std::string strategy;
    bool success = false;
    double confidence = 0.0;
    std::string timestamp;
    std::optional<std::string> session_id;

    std::string strategy_key() const { return agent_used + ":" + strategy; }
};

struct SimilarAttempt {
    FixAttempt attempt;
    float similarity = 0.0f;
};

struct StrategyEffectiveness {
    std::string agent_strategy;
    std::int64_t total_attempts = 0;
    std::int64_t successful_attempts = 0;
    double success_rate = 0.0;
    std::string last_attempted;
    std::optional<std::string> last_successful;

    nlohmann::json to_json() const;
};

struct StoreStatistics {
    std::int64_t total_attempts = 0;
    std::int64_t successful_attempts = 0;
    double overall_success_rate = 0.0;
    std::vector<StrategyEffectiveness> top_strategies;

    nlohmann::json to_json() const;
};

// UTC ISO-8601 with microseconds; lexical order is chronological order.
std::string format_utc(std::chrono::system_clock::time_point tp);

// Logistic curve centred at similarity 0.5: weak matches -> ~0, strong matches -> ~1.
double similarity_weight(float similarity);

struct ConnectionCloser {
    void operator()(sqlite3* db) const;
};

// Append-only log of fix attempts in a single SQLite file.
//
// Every public operation swallows storage errors: they are logged and turned
// into a no-op, an empty result or std::nullopt, so a storage outage never
// aborts the caller's fix workflow. Each calling thread gets its own
// connection; SQLite serialises concurrent writers.
class AttemptStore {
public:
    explicit AttemptStore(std::string db_path, std::string schema_path = FIX_MEMORY_DEFAULT_SCHEMA_PATH);
    ~AttemptStore();

    AttemptStore(const AttemptStore&) = delete;
    AttemptStore& operator=(const AttemptStore&) = delete;

    // Commits immediately. Returns false (after logging) when the row was not written.
    bool record(const Issue& issue,
                const FixResult& result,
                const std::string& agent_used,
                const std::string& strategy,
                const EmbeddingVector& embedding,
                const std::optional<std::string>& session_id = std::nullopt);

    // Linear scan. Only rows of the query's variant (and, for sparse rows,
    // feature width) are compared; results are sorted by similarity, descending.
    std::vector<SimilarAttempt> find_similar(const EmbeddingVector& query,
                                             std::optional<IssueType> issue_type = std::nullopt,
                                             int k = 10,
                                             float min_similarity = 0.3f);

    // Minimal answer without reasoning: ("agent:strategy", confidence).
    std::optional<std::pair<std::string, double>> recommend_from_store(const Issue& issue,
                                                                       const EmbeddingVector& query,
                                                                       int k = 10);

    bool rebuild_effectiveness_summary();
    std::vector<StrategyEffectiveness> effectiveness_summary(int limit = 0);
    StoreStatistics statistics();

    bool record_feedback(const std::string& agent_strategy, double confidence, bool accepted);

    // Deletes attempts older than max_age_days and rebuilds the summary.
    // Returns the number of attempts removed. An age reaching back past the
    // epoch keeps everything.
    int apply_retention(int max_age_days);

    std::int64_t attempt_count();

    bool is_available() const { return available_.load(); }
    bool schema_fallback_used() const { return schema_fallback_used_; }
    const std::string& db_path() const { return db_path_; }

    void close();

private:
    std::string db_path_;
    std::string schema_path_;
    std::atomic<bool> available_{false};
    std::atomic<bool> closed_{false};
    bool schema_fallback_used_ = false;

    std::mutex pool_mutex_;
    std::unordered_map<std::thread::id, std::shared_ptr<sqlite3>> connections_;

    // Callers hold the handle for the whole operation, so close() only drops
    // the pool's reference and the last user finalizes it.
    std::shared_ptr<sqlite3> connection();
    void initialize_schema(sqlite3* db);
    void rebuild_summary_on(sqlite3* db);
};

} // namespace fix_memory
