#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#ifndef FIX_MEMORY_DEFAULT_SCHEMA_PATH
#define FIX_MEMORY_DEFAULT_SCHEMA_PATH "schema/fix_strategy_schema.sql"
#endif

namespace fix_memory {

struct NeuralBackendConfig {
    std::string endpoint;                       // empty = neural backend disabled
    std::string model = "all-MiniLM-L6-v2";
    int timeout_ms = 5000;
    int max_retries = 3;
    size_t cache_size = 1000;
};

struct EngineConfig {
    std::string db_path = "fix_strategies.db";
    std::string schema_path = FIX_MEMORY_DEFAULT_SCHEMA_PATH;
    NeuralBackendConfig neural;
    int k = 10;
    double min_confidence = 0.4;
    int retention_days = 0;                     // 0 = keep forever
    std::string log_level = "info";
    std::string server_host = "127.0.0.1";
    int server_port = 5003;
    std::string source_path;                    // file the values came from, empty for defaults

    static EngineConfig from_json(const nlohmann::json& j) {
        EngineConfig cfg;
        cfg.db_path = j.value("db_path", cfg.db_path);
        cfg.schema_path = j.value("schema_path", cfg.schema_path);
        cfg.retention_days = j.value("retention_days", cfg.retention_days);
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (j.contains("neural") && j["neural"].is_object()) {
            const auto& n = j["neural"];
            cfg.neural.endpoint = n.value("endpoint", cfg.neural.endpoint);
            cfg.neural.model = n.value("model", cfg.neural.model);
            cfg.neural.timeout_ms = n.value("timeout_ms", cfg.neural.timeout_ms);
            cfg.neural.max_retries = n.value("max_retries", cfg.neural.max_retries);
            cfg.neural.cache_size = n.value("cache_size", cfg.neural.cache_size);
        }
        if (j.contains("recommender") && j["recommender"].is_object()) {
            const auto& r = j["recommender"];
            cfg.k = r.value("k", cfg.k);
            cfg.min_confidence = r.value("min_confidence", cfg.min_confidence);
        }
        if (j.contains("server") && j["server"].is_object()) {
            const auto& s = j["server"];
            cfg.server_host = s.value("host", cfg.server_host);
            cfg.server_port = s.value("port", cfg.server_port);
        }
        return cfg;
    }

    nlohmann::json to_json() const {
        return {
            {"db_path", db_path},
            {"schema_path", schema_path},
            {"neural", {
                {"endpoint", neural.endpoint},
                {"model", neural.model},
                {"timeout_ms", neural.timeout_ms},
                {"max_retries", neural.max_retries},
                {"cache_size", neural.cache_size}
            }},
            {"recommender", {{"k", k}, {"min_confidence", min_confidence}}},
            {"retention_days", retention_days},
            {"log_level", log_level},
            {"server", {{"host", server_host}, {"port", server_port}}}
        };
    }
};

class ConfigLoader {
public:
    // An explicit path (argument, then FIX_MEMORY_CONFIG) wins over the search paths.
    static EngineConfig load(const std::string& explicit_path = "") {
        std::vector<std::string> search_paths;
        if (!explicit_path.empty()) {
            search_paths.push_back(explicit_path);
        } else if (const char* env_path = std::getenv("FIX_MEMORY_CONFIG")) {
            search_paths.push_back(env_path);
        } else {
            search_paths = {
                "fix_memory.json",          // working directory
                "../fix_memory.json",       // build/ directory
                "config/fix_memory.json",
                "../../fix_memory.json"     // build/Release
            };
        }

        std::ifstream f;
        std::string found_path;
        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        if (found_path.empty()) {
            if (!explicit_path.empty()) {
                spdlog::warn("Config file {} not found, using defaults", explicit_path);
            } else {
                spdlog::info("No fix_memory.json found, using defaults");
            }
            return EngineConfig{};
        }

        try {
            auto cfg = EngineConfig::from_json(nlohmann::json::parse(f));
            cfg.source_path = found_path;
            spdlog::info("Loaded configuration from {} (db: {}, neural: {})", found_path, cfg.db_path,
                         cfg.neural.endpoint.empty() ? "disabled" : cfg.neural.endpoint);
            return cfg;
        } catch (const std::exception& e) {
            spdlog::error("Failed to parse {}: {}. Using defaults", found_path, e.what());
            return EngineConfig{};
        }
    }
};

} // namespace fix_memory
