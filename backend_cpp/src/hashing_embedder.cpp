#include "embedding_service.hpp"
#include <cctype>
#include <cmath>
#include <map>
#include <stdexcept>

namespace fix_memory {

HashingEmbeddingProvider::HashingEmbeddingProvider(std::uint32_t width) : width_(width) {
    if (width_ == 0 || width_ > kSparseMaxWidth) {
        throw std::invalid_argument("Hashing width must lie in [1, " + std::to_string(kSparseMaxWidth) + "]");
    }
}

std::vector<std::string> HashingEmbeddingProvider::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= 2) tokens.push_back(current);
        current.clear();
    };
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '_') {
            current += static_cast<char>(std::tolower(c));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

std::uint32_t HashingEmbeddingProvider::fnv1a(const std::string& token) {
    std::uint32_t hash = 2166136261u;
    for (char ch : token) {
        hash ^= static_cast<unsigned char>(ch);
        hash *= 16777619u;
    }
    return hash;
}

void HashingEmbeddingProvider::add_terms(std::map<std::uint32_t, double>& weights,
                                         const std::string& text, double field_weight) const {
    std::map<std::uint32_t, int> counts;
    for (const auto& token : tokenize(text)) {
        counts[fnv1a(token) % width_]++;
    }
    // Sublinear tf
    for (const auto& [index, count] : counts) {
        weights[index] += field_weight * (1.0 + std::log(static_cast<double>(count)));
    }
}

SparseVector HashingEmbeddingProvider::normalise(const std::map<std::uint32_t, double>& weights) const {
    SparseVector vec;
    vec.declared_width = width_;
    vec.indices.reserve(weights.size());
    vec.values.reserve(weights.size());

    double norm = 0.0;
    for (const auto& [index, weight] : weights) {
        vec.indices.push_back(index);
        vec.values.push_back(static_cast<float>(weight));
        norm += weight * weight;
    }
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec.values) v *= inv;
    }
    return vec;
}

EmbeddingVector HashingEmbeddingProvider::embed_text(const std::string& text) {
    std::map<std::uint32_t, double> weights;
    add_terms(weights, text, 1.0);
    return normalise(weights);
}

EmbeddingVector HashingEmbeddingProvider::embed(const Issue& issue) {
    std::map<std::uint32_t, double> weights;
    add_terms(weights, issue.message, 1.0);
    add_terms(weights, issue.stage, kContextWeight);
    if (issue.file_path) add_terms(weights, *issue.file_path, kContextWeight);
    return normalise(weights);
}

std::vector<EmbeddingVector> HashingEmbeddingProvider::embed_batch(const std::vector<Issue>& issues) {
    std::vector<EmbeddingVector> out;
    out.reserve(issues.size());
    for (const auto& issue : issues) {
        out.push_back(embed(issue));
    }
    return out;
}

} // namespace fix_memory
