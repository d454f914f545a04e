#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fix_memory {

enum class DecisionOutcome {
    Recommended,
    NoMatches,
    InsufficientEvidence,
    LowConfidence,
    FeedbackAccepted,
    FeedbackRejected
};

inline const char* to_string(DecisionOutcome outcome) {
    switch (outcome) {
        case DecisionOutcome::Recommended: return "recommended";
        case DecisionOutcome::NoMatches: return "no_matches";
        case DecisionOutcome::InsufficientEvidence: return "insufficient_evidence";
        case DecisionOutcome::LowConfidence: return "low_confidence";
        case DecisionOutcome::FeedbackAccepted: return "feedback_accepted";
        case DecisionOutcome::FeedbackRejected: return "feedback_rejected";
    }
    return "unknown";
}

struct DecisionEntry {
    long long timestamp_ms = 0;
    DecisionOutcome outcome = DecisionOutcome::NoMatches;
    std::string issue_type;
    std::string agent_strategy;     // empty when nothing was recommended
    double confidence = 0.0;
    int sample_count = 0;
    std::string detail;
};

// Recent recommendation outcomes, so an empty answer can be told apart by cause.
class DecisionLog {
public:
    static constexpr size_t kMaxEntries = 50;

    // Singleton access
    static DecisionLog& instance() {
        static DecisionLog instance;
        return instance;
    }

    void add(DecisionEntry entry) {
        if (entry.timestamp_ms == 0) {
            entry.timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
        std::lock_guard<std::mutex> lock(mtx_);
        entries_.push_back(std::move(entry));
        if (entries_.size() > kMaxEntries) {
            entries_.pop_front();
        }
    }

    // Newest first
    std::vector<DecisionEntry> recent() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return std::vector<DecisionEntry>(entries_.rbegin(), entries_.rend());
    }

    nlohmann::json to_json() const {
        nlohmann::json j_list = nlohmann::json::array();
        for (const auto& e : recent()) {
            j_list.push_back({
                {"timestamp", e.timestamp_ms},
                {"outcome", to_string(e.outcome)},
                {"issue_type", e.issue_type},
                {"agent_strategy", e.agent_strategy},
                {"confidence", e.confidence},
                {"sample_count", e.sample_count},
                {"detail", e.detail}
            });
        }
        return j_list;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        entries_.clear();
    }

private:
    DecisionLog() = default;
    std::deque<DecisionEntry> entries_;
    mutable std::mutex mtx_;
};

} // namespace fix_memory
