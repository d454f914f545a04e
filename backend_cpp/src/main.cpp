#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "EngineConfig.hpp"
#include "embedding_service.hpp"
#include "attempt_store.hpp"
#include "strategy_recommender.hpp"
#include "SystemMonitor.hpp"
#include "DecisionLog.hpp"

using json = nlohmann::json;

class FixMemoryServer {
public:
    explicit FixMemoryServer(fix_memory::EngineConfig config)
        : config_(std::move(config)),
          embedder_(fix_memory::default_embedding_provider(config_.neural)),
          store_(std::make_shared<fix_memory::AttemptStore>(config_.db_path, config_.schema_path)),
          recommender_(store_, embedder_)
    {
        if (config_.retention_days > 0) {
            int removed = store_->apply_retention(config_.retention_days);
            spdlog::info("Startup retention ({} days): {} attempts removed", config_.retention_days, removed);
        }
        setup_routes();
    }

    bool run() {
        spdlog::info("Fix strategy memory listening on {}:{} (embeddings: {}, store: {})",
                     config_.server_host, config_.server_port, embedder_->name(),
                     store_->is_available() ? config_.db_path : "UNAVAILABLE");
        return server_.listen(config_.server_host.c_str(), config_.server_port);
    }

private:
    fix_memory::EngineConfig config_;
    std::shared_ptr<fix_memory::EmbeddingProvider> embedder_;
    std::shared_ptr<fix_memory::AttemptStore> store_;
    fix_memory::StrategyRecommender recommender_;
    httplib::Server server_;

    // Client mistakes -> 400, anything else -> 500. Nothing escapes a handler.
    static void respond(httplib::Response& res, const std::function<json()>& handler) {
        try {
            res.set_content(handler().dump(), "application/json");
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(json{{"error", e.what()}}.dump(), "application/json");
        } catch (const std::invalid_argument& e) {
            res.status = 400;
            res.set_content(json{{"error", e.what()}}.dump(), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Request failed: {}", e.what());
            res.status = 500;
            res.set_content(json{{"error", e.what()}}.dump(), "application/json");
        }
    }

    void setup_routes() {
        server_.Post("/api/recommend", [this](const httplib::Request& req, httplib::Response& res) {
            respond(res, [&]() { return handle_recommend(json::parse(req.body)); });
        });

        server_.Post("/api/attempts", [this](const httplib::Request& req, httplib::Response& res) {
            respond(res, [&]() { return handle_record(json::parse(req.body)); });
        });

        server_.Post("/api/feedback", [this](const httplib::Request& req, httplib::Response& res) {
            respond(res, [&]() { return handle_feedback(json::parse(req.body)); });
        });

        server_.Get("/api/statistics", [this](const httplib::Request&, httplib::Response& res) {
            respond(res, [&]() { return store_->statistics().to_json(); });
        });

        server_.Get("/api/effectiveness", [this](const httplib::Request&, httplib::Response& res) {
            respond(res, [&]() {
                json rows = json::array();
                for (const auto& row : store_->effectiveness_summary()) rows.push_back(row.to_json());
                return json{{"strategies", rows}};
            });
        });

        server_.Post("/api/effectiveness/rebuild", [this](const httplib::Request&, httplib::Response& res) {
            respond(res, [&]() { return json{{"success", store_->rebuild_effectiveness_summary()}}; });
        });

        server_.Post("/api/retention/apply", [this](const httplib::Request& req, httplib::Response& res) {
            respond(res, [&]() {
                int days = config_.retention_days;
                if (!req.body.empty()) days = json::parse(req.body).value("max_age_days", days);
                return json{{"removed", store_->apply_retention(days)}, {"max_age_days", days}};
            });
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            respond(res, [&]() {
                return json{
                    {"metrics", fix_memory::SystemMonitor::get_latest_snapshot().to_json()},
                    {"decisions", fix_memory::DecisionLog::instance().to_json()},
                    {"embedder", embedder_->name()},
                    {"neural_available", embedder_->is_neural_available()},
                    {"store_available", store_->is_available()},
                    {"attempts", store_->attempt_count()}
                };
            });
        });
    }

    json handle_recommend(const json& body) {
        auto issue = body.at("issue").get<fix_memory::Issue>();
        int k = body.value("k", config_.k);
        double min_confidence = body.value("min_confidence", config_.min_confidence);

        auto recommendation = recommender_.recommend(issue, k, min_confidence);
        if (!recommendation) {
            return json{{"recommendation", nullptr}};
        }
        return json{{"recommendation", recommendation->to_json()}};
    }

    json handle_record(const json& body) {
        auto issue = body.at("issue").get<fix_memory::Issue>();
        auto result = body.at("result").get<fix_memory::FixResult>();
        std::string agent_used = body.at("agent_used").get<std::string>();
        std::string strategy = body.at("strategy").get<std::string>();
        if (agent_used.empty() || strategy.empty()) {
            throw std::invalid_argument("agent_used and strategy must be non-empty");
        }

        std::optional<std::string> session_id;
        if (body.contains("session_id") && body["session_id"].is_string()) {
            session_id = body["session_id"].get<std::string>();
        }

        auto embedding = embedder_->embed(issue);
        bool stored = store_->record(issue, result, agent_used, strategy, embedding, session_id);
        return json{{"recorded", stored}, {"embedding", fix_memory::to_string(fix_memory::kind_of(embedding))}};
    }

    json handle_feedback(const json& body) {
        fix_memory::StrategyRecommendation recommendation;
        recommendation.agent_strategy = body.at("agent_strategy").get<std::string>();
        recommendation.confidence = body.value("confidence", 0.0);
        recommendation.sample_count = body.value("sample_count", 0);
        bool accepted = body.at("accepted").get<bool>();

        recommender_.track_feedback(recommendation, accepted);
        return json{{"success", true}};
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    auto config = fix_memory::ConfigLoader::load(argc > 1 ? argv[1] : "");
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    FixMemoryServer server(std::move(config));
    if (!server.run()) {
        spdlog::error("Server failed to bind");
        return 1;
    }
    return 0;
}
