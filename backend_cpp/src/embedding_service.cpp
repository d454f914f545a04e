#include "embedding_service.hpp"
#include "SystemMonitor.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>
#include <chrono>
#include <mutex>
#include <stdexcept>

namespace fix_memory {

using json = nlohmann::json;

std::string build_feature_text(const Issue& issue) {
    std::string text = "type: " + to_string(issue.type) +
                       " | message: " + issue.message +
                       " | stage: " + issue.stage;
    if (issue.file_path) {
        text += " | file: " + *issue.file_path;
        if (issue.line_number) text += ":" + std::to_string(*issue.line_number);
    }
    return text;
}

std::vector<EmbeddingVector> EmbeddingProvider::embed_texts(const std::vector<std::string>& texts) {
    std::vector<EmbeddingVector> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embed_text(text));
    }
    return out;
}

EmbeddingVector EmbeddingProvider::embed(const Issue& issue) {
    return embed_text(build_feature_text(issue));
}

std::vector<EmbeddingVector> EmbeddingProvider::embed_batch(const std::vector<Issue>& issues) {
    if (issues.empty()) return {};
    std::vector<std::string> texts;
    texts.reserve(issues.size());
    for (const auto& issue : issues) {
        texts.push_back(build_feature_text(issue));
    }
    return embed_texts(texts);
}

// --- Neural backend ---

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, int max_retries) {
    cpr::Response r;
    for (int i = 0; i < std::max(1, max_retries); ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if (r.status_code == 429 || r.status_code == 503) {
            spdlog::warn("Embedding backend returned {} (attempt {}/{}), backing off",
                         r.status_code, i + 1, max_retries);
            std::this_thread::sleep_for(std::chrono::milliseconds(250 * (i + 1)));
            continue;
        }
        break;
    }
    return r;
}

NeuralEmbeddingProvider::NeuralEmbeddingProvider(NeuralBackendConfig config)
    : config_(std::move(config)), cache_(config_.cache_size) {
    if (config_.endpoint.empty()) {
        throw std::runtime_error("No neural embedding endpoint configured");
    }
    // Probe: the backend must answer and produce vectors of the declared width
    request_embeddings({"probe"});
    spdlog::info("Neural embedding backend ready: {} ({} dims) at {}",
                 config_.model, kDenseDimension, config_.endpoint);
}

std::string NeuralEmbeddingProvider::get_endpoint_url() const {
    std::string base = config_.endpoint;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/embed";
}

std::vector<DenseVector> NeuralEmbeddingProvider::request_embeddings(const std::vector<std::string>& texts) {
    auto start = std::chrono::high_resolution_clock::now();

    std::string payload = json{{"inputs", texts}, {"model", config_.model}}
        .dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url()},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{config_.timeout_ms});
    }, config_.max_retries);

    auto end = std::chrono::high_resolution_clock::now();
    SystemMonitor::global_embedding_latency_ms.store(
        std::chrono::duration<double, std::milli>(end - start).count());

    if (r.status_code != 200) {
        std::string reason = r.error ? r.error.message : r.text;
        throw std::runtime_error("Embedding backend error [" + std::to_string(r.status_code) + "]: " + reason);
    }

    auto response_json = json::parse(r.text);
    const json& rows = response_json.is_object() ? response_json.at("embeddings") : response_json;
    if (!rows.is_array() || rows.size() != texts.size()) {
        throw std::runtime_error("Embedding backend returned " + std::to_string(rows.size()) +
                                 " vectors for " + std::to_string(texts.size()) + " inputs");
    }

    std::vector<DenseVector> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        auto values = row.get<std::vector<float>>();
        if (values.size() != kDenseDimension) {
            throw std::runtime_error("Embedding backend returned " + std::to_string(values.size()) +
                                     " dims, expected " + std::to_string(kDenseDimension));
        }
        DenseVector vec;
        std::copy(values.begin(), values.end(), vec.values.begin());
        out.push_back(vec);
    }
    return out;
}

EmbeddingVector NeuralEmbeddingProvider::embed_text(const std::string& text) {
    if (auto cached = cache_.get(text)) return *cached;

    try {
        auto vecs = request_embeddings({text});
        cache_.set(text, vecs.front());
        return vecs.front();
    } catch (const std::exception& e) {
        SystemMonitor::global_degraded_embeddings.fetch_add(1);
        spdlog::error("Neural embedding failed, using zero vector: {}", e.what());
        return DenseVector{};
    }
}

std::vector<EmbeddingVector> NeuralEmbeddingProvider::embed_texts(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};

    std::vector<EmbeddingVector> out(texts.size(), EmbeddingVector{DenseVector{}});
    std::vector<std::string> pending;
    std::vector<size_t> pending_slots;
    for (size_t i = 0; i < texts.size(); ++i) {
        if (auto cached = cache_.get(texts[i])) {
            out[i] = *cached;
        } else {
            pending.push_back(texts[i]);
            pending_slots.push_back(i);
        }
    }
    if (pending.empty()) return out;

    try {
        auto vecs = request_embeddings(pending);
        for (size_t i = 0; i < vecs.size(); ++i) {
            cache_.set(pending[i], vecs[i]);
            out[pending_slots[i]] = vecs[i];
        }
    } catch (const std::exception& e) {
        SystemMonitor::global_degraded_embeddings.fetch_add(static_cast<long long>(pending.size()));
        spdlog::error("Neural batch embedding failed for {} inputs, using zero vectors: {}",
                      pending.size(), e.what());
    }
    return out;
}

// --- Provider selection ---

std::shared_ptr<EmbeddingProvider> create_embedding_provider(const NeuralBackendConfig& config) {
    if (config.endpoint.empty()) {
        spdlog::info("Neural embeddings disabled, using hashing fallback ({} features)", kSparseMaxWidth);
        return std::make_shared<HashingEmbeddingProvider>();
    }
    try {
        return std::make_shared<NeuralEmbeddingProvider>(config);
    } catch (const std::exception& e) {
        spdlog::warn("Neural embedding backend unavailable ({}), falling back to hashing vectorizer", e.what());
        return std::make_shared<HashingEmbeddingProvider>();
    }
}

std::shared_ptr<EmbeddingProvider> default_embedding_provider(const NeuralBackendConfig& config) {
    static std::once_flag init_flag;
    static std::shared_ptr<EmbeddingProvider> provider;
    std::call_once(init_flag, [&config]() {
        provider = create_embedding_provider(config);
    });
    return provider;
}

} // namespace fix_memory
