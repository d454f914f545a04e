#include "strategy_recommender.hpp"
#include "DecisionLog.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace fix_memory {

using json = nlohmann::json;

namespace {

struct StrategyTally {
    double weight = 0.0;
    int successes = 0;
    int total = 0;
    double similarity_sum = 0.0;
};

void log_decision(DecisionOutcome outcome, const Issue& issue, const std::string& key,
                  double confidence, int samples, std::string detail) {
    DecisionEntry entry;
    entry.outcome = outcome;
    entry.issue_type = to_string(issue.type);
    entry.agent_strategy = key;
    entry.confidence = confidence;
    entry.sample_count = samples;
    entry.detail = std::move(detail);
    DecisionLog::instance().add(std::move(entry));
}

} // namespace

std::string StrategyRecommendation::agent() const {
    return agent_strategy.substr(0, agent_strategy.find(':'));
}

std::string StrategyRecommendation::strategy() const {
    auto pos = agent_strategy.find(':');
    return pos == std::string::npos ? std::string() : agent_strategy.substr(pos + 1);
}

json StrategyRecommendation::to_json() const {
    json alts = json::array();
    for (const auto& [key, score] : alternatives) {
        alts.push_back({{"agent_strategy", key}, {"score", score}});
    }
    return json{
        {"agent_strategy", agent_strategy},
        {"agent", agent()},
        {"strategy", strategy()},
        {"confidence", confidence},
        {"similarity_score", similarity_score},
        {"success_rate", success_rate},
        {"sample_count", sample_count},
        {"alternatives", alts},
        {"reasoning", reasoning}
    };
}

StrategyRecommender::StrategyRecommender(std::shared_ptr<AttemptStore> store,
                                         std::shared_ptr<EmbeddingProvider> embedder)
    : store_(std::move(store)), embedder_(std::move(embedder)) {
    if (!store_) {
        throw std::invalid_argument("StrategyRecommender requires an AttemptStore");
    }
}

std::shared_ptr<EmbeddingProvider> StrategyRecommender::embedder() {
    std::call_once(embedder_once_, [this]() {
        if (!embedder_) {
            spdlog::warn("No embedding provider injected, using hashing fallback");
            embedder_ = std::make_shared<HashingEmbeddingProvider>();
        }
    });
    return embedder_;
}

std::optional<StrategyRecommendation> StrategyRecommender::recommend(const Issue& issue, int k, double min_confidence) {
    auto embedding = embedder()->embed(issue);
    auto similar = store_->find_similar(embedding, issue.type, k, static_cast<float>(MIN_SIMILARITY_THRESHOLD));

    if (similar.empty()) {
        spdlog::info("No recommendation for {} issue: no similar history", to_string(issue.type));
        log_decision(DecisionOutcome::NoMatches, issue, "", 0.0, 0, "no attempts above similarity threshold");
        return std::nullopt;
    }

    // Keyed map: iteration and ties follow lexical key order, never insertion order
    std::map<std::string, StrategyTally> tallies;
    int successful = 0;
    for (const auto& match : similar) {
        auto& tally = tallies[match.attempt.strategy_key()];
        ++tally.total;
        if (!match.attempt.success) continue;

        ++successful;
        ++tally.successes;
        tally.weight += similarity_weight(match.similarity) * (1.0 + match.attempt.confidence);
        tally.similarity_sum += match.similarity;
    }

    if (successful < MIN_SAMPLE_SIZE) {
        spdlog::info("No recommendation for {} issue: insufficient evidence ({} successful matches, need {})",
                     to_string(issue.type), successful, MIN_SAMPLE_SIZE);
        log_decision(DecisionOutcome::InsufficientEvidence, issue, "", 0.0, successful,
                     fmt::format("{} of {} similar attempts succeeded", successful, similar.size()));
        return std::nullopt;
    }

    std::vector<std::pair<std::string, const StrategyTally*>> ranked;
    for (const auto& [key, tally] : tallies) {
        if (tally.successes > 0) ranked.emplace_back(key, &tally);
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second->weight != b.second->weight) return a.second->weight > b.second->weight;
        return a.first < b.first;
    });

    const std::string& best_key = ranked.front().first;
    const StrategyTally& best = *ranked.front().second;

    double success_rate = static_cast<double>(best.successes) / static_cast<double>(best.total);
    double avg_similarity = best.similarity_sum / best.successes;
    // Each attempt contributes at most sigmoid(..) * (1 + 1) = 2
    double normalized_weight = best.weight / (2.0 * best.successes);
    double sample_boost = std::min(0.1, 0.03 * std::log(static_cast<double>(best.successes)));
    double confidence = std::clamp(0.6 * normalized_weight + 0.3 * avg_similarity + sample_boost, 0.0, 1.0);

    if (confidence < min_confidence) {
        spdlog::info("No recommendation for {} issue: low confidence {:.3f} < {:.3f} for {} ({} samples)",
                     to_string(issue.type), confidence, min_confidence, best_key, best.successes);
        log_decision(DecisionOutcome::LowConfidence, issue, best_key, confidence, best.successes,
                     fmt::format("confidence below {:.2f}", min_confidence));
        return std::nullopt;
    }

    StrategyRecommendation rec;
    rec.agent_strategy = best_key;
    rec.confidence = confidence;
    rec.similarity_score = avg_similarity;
    rec.success_rate = success_rate;
    rec.sample_count = best.successes;
    for (size_t i = 1; i < ranked.size() && rec.alternatives.size() < MAX_ALTERNATIVES; ++i) {
        rec.alternatives.emplace_back(ranked[i].first, ranked[i].second->weight);
    }

    rec.reasoning = fmt::format(
        "Recommend {} with strategy '{}': {} similar successful fix{} "
        "({:.0f}% success rate, average similarity {:.2f}).",
        rec.agent(), rec.strategy(), rec.sample_count, rec.sample_count == 1 ? "" : "es",
        rec.success_rate * 100.0, rec.similarity_score);
    if (!rec.alternatives.empty()) {
        std::string names;
        for (const auto& alt : rec.alternatives) {
            if (!names.empty()) names += ", ";
            names += alt.first;
        }
        rec.reasoning += " Alternatives: " + names + ".";
    }

    spdlog::info("Recommended {} for {} issue (confidence={:.3f}, samples={}, similarity={:.3f})",
                 rec.agent_strategy, to_string(issue.type), rec.confidence, rec.sample_count, rec.similarity_score);
    log_decision(DecisionOutcome::Recommended, issue, rec.agent_strategy, rec.confidence, rec.sample_count,
                 fmt::format("{} alternatives", rec.alternatives.size()));
    return rec;
}

void StrategyRecommender::track_feedback(const StrategyRecommendation& recommendation, bool accepted) {
    spdlog::info("Recommendation {} {} (confidence={:.3f})",
                 recommendation.agent_strategy, accepted ? "accepted" : "rejected", recommendation.confidence);

    DecisionEntry entry;
    entry.outcome = accepted ? DecisionOutcome::FeedbackAccepted : DecisionOutcome::FeedbackRejected;
    entry.agent_strategy = recommendation.agent_strategy;
    entry.confidence = recommendation.confidence;
    entry.sample_count = recommendation.sample_count;
    DecisionLog::instance().add(std::move(entry));

    if (!store_->record_feedback(recommendation.agent_strategy, recommendation.confidence, accepted)) {
        spdlog::warn("Feedback for {} was not persisted", recommendation.agent_strategy);
    }
}

} // namespace fix_memory
