#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "embedding_service.hpp"
#include "SystemMonitor.hpp"
#include "test_helpers.hpp"

using namespace fix_memory;
using fix_memory::testing::make_issue;
using json = nlohmann::json;

namespace {

enum class BackendMode { Array, Wrapped, ServerError, WrongDimension };

// Unit vector on the axis picked by the text length.
std::vector<float> axis_for(const std::string& text) {
    std::vector<float> values(kDenseDimension, 0.0f);
    values[text.size() % kDenseDimension] = 1.0f;
    return values;
}

} // namespace

// Text-embeddings backend on a loopback port: POST /embed {"inputs": [...]}.
class NeuralEmbeddingTest : public ::testing::Test {
protected:
    httplib::Server server_;
    std::thread server_thread_;
    std::atomic<BackendMode> mode_{BackendMode::Array};
    std::atomic<int> requests_{0};
    NeuralBackendConfig config_;

    void SetUp() override {
        server_.Post("/embed", [this](const httplib::Request& req, httplib::Response& res) {
            ++requests_;
            auto inputs = json::parse(req.body).at("inputs");
            json rows = json::array();
            for (const auto& input : inputs) {
                auto values = axis_for(input.get<std::string>());
                if (mode_ == BackendMode::WrongDimension) values.resize(16);
                rows.push_back(values);
            }
            switch (mode_.load()) {
                case BackendMode::ServerError:
                    res.status = 500;
                    res.set_content(R"({"error": "model unavailable"})", "application/json");
                    return;
                case BackendMode::Wrapped:
                    res.set_content(json{{"embeddings", rows}}.dump(), "application/json");
                    return;
                default:
                    res.set_content(rows.dump(), "application/json");
            }
        });

        int port = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        server_thread_ = std::thread([this]() { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_TRUE(server_.is_running());

        config_.endpoint = "http://127.0.0.1:" + std::to_string(port) + "/";
        config_.timeout_ms = 2000;
        config_.max_retries = 1;
        config_.cache_size = 16;
    }

    void TearDown() override {
        server_.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
};

TEST_F(NeuralEmbeddingTest, StartupCheckSucceedsAndProducesDenseVectors) {
    NeuralEmbeddingProvider provider(config_);
    EXPECT_EQ(requests_.load(), 1);
    EXPECT_TRUE(provider.is_neural_available());
    EXPECT_EQ(provider.kind(), EmbeddingKind::Dense);

    auto text = std::string("type: complexity | message: too deep");
    auto vec = provider.embed_text(text);
    ASSERT_EQ(kind_of(vec), EmbeddingKind::Dense);
    const auto& dense = std::get<DenseVector>(vec);
    EXPECT_FLOAT_EQ(dense.values[text.size() % kDenseDimension], 1.0f);

    auto issue_vec = provider.embed(make_issue());
    EXPECT_EQ(kind_of(issue_vec) == EmbeddingKind::Dense, provider.is_neural_available());
}

TEST_F(NeuralEmbeddingTest, AcceptsWrappedResponses) {
    mode_ = BackendMode::Wrapped;
    NeuralEmbeddingProvider provider(config_);

    auto vec = std::get<DenseVector>(provider.embed_text("abc"));
    EXPECT_FLOAT_EQ(vec.values[3], 1.0f);
}

TEST_F(NeuralEmbeddingTest, WrongDimensionFailsConstruction) {
    mode_ = BackendMode::WrongDimension;
    EXPECT_THROW(NeuralEmbeddingProvider{config_}, std::runtime_error);

    auto provider = create_embedding_provider(config_);
    EXPECT_FALSE(provider->is_neural_available());
    EXPECT_EQ(provider->kind(), EmbeddingKind::Sparse);
}

TEST_F(NeuralEmbeddingTest, RepeatedTextIsServedFromCache) {
    NeuralEmbeddingProvider provider(config_);
    int after_startup = requests_.load();

    auto first = provider.embed_text("unused import os");
    auto second = provider.embed_text("unused import os");
    EXPECT_EQ(requests_.load(), after_startup + 1);
    EXPECT_EQ(std::get<DenseVector>(first).values, std::get<DenseVector>(second).values);
}

TEST_F(NeuralEmbeddingTest, BackendFailureDegradesToZeroVectorWithoutCaching) {
    NeuralEmbeddingProvider provider(config_);
    mode_ = BackendMode::ServerError;
    auto degraded_before = SystemMonitor::global_degraded_embeddings.load();

    auto vec = provider.embed_text("line too long");
    ASSERT_EQ(kind_of(vec), EmbeddingKind::Dense);
    for (float v : std::get<DenseVector>(vec).values) EXPECT_EQ(v, 0.0f);
    EXPECT_EQ(SystemMonitor::global_degraded_embeddings.load(), degraded_before + 1);

    // The zero vector was not cached: a recovered backend is asked again
    mode_ = BackendMode::Array;
    int before = requests_.load();
    auto recovered = std::get<DenseVector>(provider.embed_text("line too long"));
    EXPECT_EQ(requests_.load(), before + 1);
    EXPECT_FLOAT_EQ(recovered.values[std::string("line too long").size()], 1.0f);
}

TEST_F(NeuralEmbeddingTest, BatchUsesOneRequest) {
    NeuralEmbeddingProvider provider(config_);
    std::vector<Issue> issues = {
        make_issue(IssueType::SECURITY, "Use of assert detected"),
        make_issue(IssueType::DEAD_CODE, "Unused variable 'tmp'"),
        make_issue(IssueType::FORMATTING, "Line too long"),
    };

    int before = requests_.load();
    auto batch = provider.embed_batch(issues);
    EXPECT_EQ(requests_.load(), before + 1);
    ASSERT_EQ(batch.size(), issues.size());

    for (size_t i = 0; i < issues.size(); ++i) {
        auto expected = axis_for(build_feature_text(issues[i]));
        const auto& dense = std::get<DenseVector>(batch[i]);
        EXPECT_TRUE(std::equal(dense.values.begin(), dense.values.end(), expected.begin()));
    }

    // Everything is cached now
    EXPECT_EQ(provider.embed_batch(issues).size(), issues.size());
    EXPECT_EQ(requests_.load(), before + 1);
}

TEST_F(NeuralEmbeddingTest, FailedBatchDegradesEveryItem) {
    NeuralEmbeddingProvider provider(config_);
    mode_ = BackendMode::ServerError;
    auto degraded_before = SystemMonitor::global_degraded_embeddings.load();

    auto batch = provider.embed_batch({make_issue(), make_issue(IssueType::SECURITY, "assert used")});
    ASSERT_EQ(batch.size(), 2u);
    for (const auto& vec : batch) {
        ASSERT_EQ(kind_of(vec), EmbeddingKind::Dense);
        EXPECT_FLOAT_EQ(similarity(vec, vec), 0.0f);
    }
    EXPECT_EQ(SystemMonitor::global_degraded_embeddings.load(), degraded_before + 2);
}

TEST_F(NeuralEmbeddingTest, CapabilityDetectionSelectsNeuralBackend) {
    auto provider = create_embedding_provider(config_);
    EXPECT_TRUE(provider->is_neural_available());
    EXPECT_EQ(kind_of(provider->embed(make_issue())), EmbeddingKind::Dense);
}
