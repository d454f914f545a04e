#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>
#include "EngineConfig.hpp"
#include "DecisionLog.hpp"
#include "SystemMonitor.hpp"
#include "cache_manager.hpp"
#include "issue.hpp"
#include "test_helpers.hpp"

using namespace fix_memory;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& contents) {
        path_ = fs::temp_directory_path() / ("fix_memory_config_" + std::to_string(::getpid()) + ".json");
        std::ofstream out(path_);
        out << contents;
    }
    ~TempConfigFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

// --- Configuration ---

TEST(ConfigLoaderTest, ReadsExplicitFile) {
    TempConfigFile file(R"({
        "db_path": "/var/lib/fix_memory/strategies.db",
        "neural": {"endpoint": "http://localhost:8080", "timeout_ms": 1500},
        "recommender": {"k": 20, "min_confidence": 0.55},
        "retention_days": 90,
        "server": {"port": 6000}
    })");

    auto cfg = ConfigLoader::load(file.path());
    EXPECT_EQ(cfg.source_path, file.path());
    EXPECT_EQ(cfg.db_path, "/var/lib/fix_memory/strategies.db");
    EXPECT_EQ(cfg.neural.endpoint, "http://localhost:8080");
    EXPECT_EQ(cfg.neural.timeout_ms, 1500);
    EXPECT_EQ(cfg.neural.model, "all-MiniLM-L6-v2");
    EXPECT_EQ(cfg.k, 20);
    EXPECT_DOUBLE_EQ(cfg.min_confidence, 0.55);
    EXPECT_EQ(cfg.retention_days, 90);
    EXPECT_EQ(cfg.server_port, 6000);
    EXPECT_EQ(cfg.server_host, "127.0.0.1");
}

TEST(ConfigLoaderTest, MissingFileGivesDefaults) {
    auto cfg = ConfigLoader::load("/nonexistent/fix_memory.json");
    EXPECT_TRUE(cfg.source_path.empty());
    EXPECT_EQ(cfg.db_path, "fix_strategies.db");
    EXPECT_TRUE(cfg.neural.endpoint.empty());
    EXPECT_EQ(cfg.k, 10);
    EXPECT_DOUBLE_EQ(cfg.min_confidence, 0.4);
    EXPECT_EQ(cfg.retention_days, 0);
}

TEST(ConfigLoaderTest, MalformedFileGivesDefaults) {
    TempConfigFile file("{ \"db_path\": ");
    auto cfg = ConfigLoader::load(file.path());
    EXPECT_TRUE(cfg.source_path.empty());
    EXPECT_EQ(cfg.db_path, "fix_strategies.db");
}

TEST(ConfigLoaderTest, RoundTripsThroughJson) {
    EngineConfig cfg;
    cfg.db_path = "memory.db";
    cfg.neural.endpoint = "http://embedder:80";
    cfg.k = 5;

    auto restored = EngineConfig::from_json(cfg.to_json());
    EXPECT_EQ(restored.db_path, "memory.db");
    EXPECT_EQ(restored.neural.endpoint, "http://embedder:80");
    EXPECT_EQ(restored.k, 5);
    EXPECT_EQ(restored.log_level, "info");
}

// --- Caches ---

TEST(LRUCacheTest, EvictsLeastRecentlyUsed) {
    LRUCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    ASSERT_EQ(cache.get("a"), 1);   // "b" is now least recent
    cache.set("c", 3);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(cache.get("a"), 1);
    EXPECT_EQ(cache.get("c"), 3);
}

TEST(LRUCacheTest, ExpiredEntriesAreDropped) {
    LRUCache<std::string, int> cache(4, std::chrono::seconds(0));
    cache.set("a", 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(LRUCacheTest, ZeroCapacityStoresNothing) {
    LRUCache<std::string, int> cache(0);
    cache.set("a", 1);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(EmbeddingCacheTest, KeyedByFeatureText) {
    EmbeddingCache cache(8);
    auto vec = fix_memory::testing::make_axis(3);
    cache.set("type: complexity | message: m | stage: s", vec);

    auto hit = cache.get("type: complexity | message: m | stage: s");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->values, vec.values);
    EXPECT_FALSE(cache.get("type: complexity | message: other | stage: s").has_value());

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

// --- Decision log and telemetry ---

TEST(DecisionLogTest, KeepsNewestEntriesFirst) {
    auto& log = DecisionLog::instance();
    log.clear();

    for (size_t i = 0; i < DecisionLog::kMaxEntries + 5; ++i) {
        DecisionEntry entry;
        entry.outcome = DecisionOutcome::InsufficientEvidence;
        entry.sample_count = static_cast<int>(i);
        log.add(entry);
    }

    auto entries = log.recent();
    ASSERT_EQ(entries.size(), DecisionLog::kMaxEntries);
    EXPECT_EQ(entries.front().sample_count, static_cast<int>(DecisionLog::kMaxEntries + 4));
    EXPECT_EQ(entries.back().sample_count, 5);
    EXPECT_GT(entries.front().timestamp_ms, 0);

    auto j = log.to_json();
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0]["outcome"], "insufficient_evidence");
    log.clear();
    EXPECT_TRUE(log.recent().empty());
}

TEST(SystemMonitorTest, SnapshotSerializes) {
    auto j = SystemMonitor::get_latest_snapshot().to_json();
    EXPECT_TRUE(j.contains("ram_mb"));
    EXPECT_TRUE(j.contains("scan_latency_ms"));
    EXPECT_TRUE(j.contains("storage_failures"));
}

// --- Wire types ---

TEST(IssueJsonTest, ParsesWireNames) {
    auto issue = json::parse(R"({"type": "type_error", "message": "Incompatible types",
                                 "file_path": "app.py", "line_number": 7, "stage": "comprehensive"})")
                     .get<Issue>();
    EXPECT_EQ(issue.type, IssueType::TYPE_ERROR);
    EXPECT_EQ(issue.file_path, std::optional<std::string>("app.py"));
    EXPECT_EQ(issue.line_number, std::optional<int>(7));

    json back = issue;
    EXPECT_EQ(back["type"], "type_error");
    EXPECT_EQ(back["line_number"], 7);
}

TEST(IssueJsonTest, OptionalFieldsMayBeAbsent) {
    auto issue = json::parse(R"({"type": "security", "message": "assert used"})").get<Issue>();
    EXPECT_EQ(issue.type, IssueType::SECURITY);
    EXPECT_FALSE(issue.file_path.has_value());
    EXPECT_FALSE(issue.line_number.has_value());
    EXPECT_TRUE(issue.stage.empty());

    json back = issue;
    EXPECT_TRUE(back["file_path"].is_null());
}

TEST(IssueJsonTest, RejectsUnknownType) {
    EXPECT_THROW(json::parse(R"({"type": "nonsense", "message": "x"})").get<Issue>(), std::invalid_argument);
    EXPECT_FALSE(issue_type_from_string("TYPE_ERROR").has_value());
    EXPECT_EQ(issue_type_from_string("dry_violation"), IssueType::DRY_VIOLATION);
    EXPECT_EQ(to_string(IssueType::COVERAGE_IMPROVEMENT), "coverage_improvement");
}

TEST(FixResultJsonTest, ValidatesConfidence) {
    auto result = json::parse(R"({"success": true, "confidence": 0.85})").get<FixResult>();
    EXPECT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.confidence, 0.85);
    EXPECT_THROW(json::parse(R"({"success": true, "confidence": 1.5})").get<FixResult>(), std::invalid_argument);
}
