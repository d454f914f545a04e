#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <map>
#include "issue.hpp"
#include "embedding_vector.hpp"
#include "cache_manager.hpp"
#include "EngineConfig.hpp"

namespace fix_memory {

// "type: ... | message: ... | stage: ..." plus file/line when known.
std::string build_feature_text(const Issue& issue);

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual EmbeddingVector embed_text(const std::string& text) = 0;
    virtual std::vector<EmbeddingVector> embed_texts(const std::vector<std::string>& texts);

    virtual bool is_neural_available() const = 0;
    virtual EmbeddingKind kind() const = 0;
    virtual std::string name() const = 0;

    // Default: embed_text(build_feature_text(issue)).
    virtual EmbeddingVector embed(const Issue& issue);
    virtual std::vector<EmbeddingVector> embed_batch(const std::vector<Issue>& issues);
};

// Sentence-embedding model behind an HTTP text-embeddings endpoint.
// The constructor probes the endpoint and throws std::runtime_error when it
// is unusable; after that embedding never throws and degrades to a zero vector.
class NeuralEmbeddingProvider : public EmbeddingProvider {
public:
    explicit NeuralEmbeddingProvider(NeuralBackendConfig config);

    EmbeddingVector embed_text(const std::string& text) override;
    std::vector<EmbeddingVector> embed_texts(const std::vector<std::string>& texts) override;

    bool is_neural_available() const override { return true; }
    EmbeddingKind kind() const override { return EmbeddingKind::Dense; }
    std::string name() const override { return "neural:" + config_.model; }

private:
    NeuralBackendConfig config_;
    EmbeddingCache cache_;

    std::string get_endpoint_url() const;
    std::vector<DenseVector> request_embeddings(const std::vector<std::string>& texts);
};

// Statistical fallback. Tokens are hashed into a fixed feature space, so
// vectors from separate calls (and processes) are directly comparable.
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(std::uint32_t width = kSparseMaxWidth);

    EmbeddingVector embed_text(const std::string& text) override;

    // Hashes field values only. Message tokens carry full weight; stage and
    // file tokens are scaled by kContextWeight so shared context alone cannot
    // make two issues look similar. The issue type is left out, retrieval
    // already filters on it.
    EmbeddingVector embed(const Issue& issue) override;
    std::vector<EmbeddingVector> embed_batch(const std::vector<Issue>& issues) override;

    static constexpr double kContextWeight = 0.25;

    bool is_neural_available() const override { return false; }
    EmbeddingKind kind() const override { return EmbeddingKind::Sparse; }
    std::string name() const override { return "hashing-tf:" + std::to_string(width_); }

    std::uint32_t width() const { return width_; }

    // Lower-cased alphanumeric runs of length >= 2.
    static std::vector<std::string> tokenize(const std::string& text);
    static std::uint32_t fnv1a(const std::string& token);

private:
    std::uint32_t width_;

    void add_terms(std::map<std::uint32_t, double>& weights, const std::string& text, double field_weight) const;
    SparseVector normalise(const std::map<std::uint32_t, double>& weights) const;
};

// Capability detection: neural when the endpoint is configured and answers
// the probe, the hashing fallback otherwise.
std::shared_ptr<EmbeddingProvider> create_embedding_provider(const NeuralBackendConfig& config);

// Process-wide provider, selected once. Later calls ignore their argument.
std::shared_ptr<EmbeddingProvider> default_embedding_provider(const NeuralBackendConfig& config = {});

} // namespace fix_memory
