#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "issue.hpp"
#include "attempt_store.hpp"
#include "embedding_service.hpp"

namespace fix_memory {

struct StrategyRecommendation {
    std::string agent_strategy;                                 // "agent:strategy"
    double confidence = 0.0;
    double similarity_score = 0.0;                              // mean similarity of the supporting attempts
    double success_rate = 0.0;
    int sample_count = 0;
    std::vector<std::pair<std::string, double>> alternatives;   // up to 3, best first
    std::string reasoning;

    std::string agent() const;
    std::string strategy() const;
    nlohmann::json to_json() const;
};

class StrategyRecommender {
public:
    static constexpr double MIN_SIMILARITY_THRESHOLD = 0.3;
    static constexpr int MIN_SAMPLE_SIZE = 2;
    static constexpr size_t MAX_ALTERNATIVES = 3;

    // A null embedder is replaced by the hashing fallback on first use.
    explicit StrategyRecommender(std::shared_ptr<AttemptStore> store,
                                 std::shared_ptr<EmbeddingProvider> embedder = nullptr);

    // std::nullopt means "proceed without a recommendation": either too few
    // successful matches or too little confidence. The cause is logged.
    std::optional<StrategyRecommendation> recommend(const Issue& issue, int k = 10, double min_confidence = 0.4);

    // Logs the outcome and persists it to the store's feedback table.
    void track_feedback(const StrategyRecommendation& recommendation, bool accepted);

    const std::shared_ptr<AttemptStore>& store() const { return store_; }
    std::shared_ptr<EmbeddingProvider> embedder();

private:
    std::shared_ptr<AttemptStore> store_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    std::once_flag embedder_once_;
};

} // namespace fix_memory
