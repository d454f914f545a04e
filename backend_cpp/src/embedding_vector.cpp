#include "embedding_vector.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <faiss/utils/distances.h>
#include <nlohmann/json.hpp>

namespace fix_memory {

using json = nlohmann::json;

namespace {

constexpr const char* kSparseFormatTag = "hashed-tf/v1";

float clamp_cosine(double value) {
    return static_cast<float>(std::max(-1.0, std::min(1.0, value)));
}

float dense_cosine(const DenseVector& a, const DenseVector& b) {
    float norm_a = faiss::fvec_norm_L2sqr(a.values.data(), kDenseDimension);
    float norm_b = faiss::fvec_norm_L2sqr(b.values.data(), kDenseDimension);
    if (norm_a <= 0.0f || norm_b <= 0.0f) return 0.0f;

    float dot = faiss::fvec_inner_product(a.values.data(), b.values.data(), kDenseDimension);
    return clamp_cosine(dot / (std::sqrt(static_cast<double>(norm_a)) * std::sqrt(static_cast<double>(norm_b))));
}

float sparse_cosine(const SparseVector& a, const SparseVector& b) {
    double norm_a = 0.0, norm_b = 0.0, dot = 0.0;
    for (float v : a.values) norm_a += static_cast<double>(v) * v;
    for (float v : b.values) norm_b += static_cast<double>(v) * v;
    if (norm_a <= 0.0 || norm_b <= 0.0) return 0.0f;

    // Merge-join over the sorted index lists
    size_t i = 0, j = 0;
    while (i < a.indices.size() && j < b.indices.size()) {
        if (a.indices[i] == b.indices[j]) {
            dot += static_cast<double>(a.values[i]) * b.values[j];
            ++i;
            ++j;
        } else if (a.indices[i] < b.indices[j]) {
            ++i;
        } else {
            ++j;
        }
    }
    return clamp_cosine(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

} // namespace

EmbeddingKind kind_of(const EmbeddingVector& vec) {
    return std::holds_alternative<DenseVector>(vec) ? EmbeddingKind::Dense : EmbeddingKind::Sparse;
}

std::string to_string(EmbeddingKind kind) {
    return kind == EmbeddingKind::Dense ? "dense" : "sparse";
}

bool comparable(const EmbeddingVector& a, const EmbeddingVector& b) {
    if (kind_of(a) != kind_of(b)) return false;
    if (kind_of(a) == EmbeddingKind::Dense) return true;
    return std::get<SparseVector>(a).declared_width == std::get<SparseVector>(b).declared_width;
}

float similarity(const EmbeddingVector& a, const EmbeddingVector& b) {
    if (!comparable(a, b)) {
        throw std::invalid_argument("Cannot compare " + to_string(kind_of(a)) + " embedding with " +
                                    to_string(kind_of(b)) + " embedding of a different feature space");
    }
    if (kind_of(a) == EmbeddingKind::Dense) {
        return dense_cosine(std::get<DenseVector>(a), std::get<DenseVector>(b));
    }
    return sparse_cosine(std::get<SparseVector>(a), std::get<SparseVector>(b));
}

void validate(const SparseVector& vec) {
    if (vec.declared_width == 0 || vec.declared_width > kSparseMaxWidth) {
        throw std::invalid_argument("Sparse width must lie in [1, " + std::to_string(kSparseMaxWidth) + "]");
    }
    if (vec.indices.size() != vec.values.size()) {
        throw std::invalid_argument("Sparse indices and values differ in length");
    }
    for (size_t i = 0; i < vec.indices.size(); ++i) {
        if (vec.indices[i] >= vec.declared_width) {
            throw std::invalid_argument("Sparse index out of range: " + std::to_string(vec.indices[i]));
        }
        if (i > 0 && vec.indices[i] <= vec.indices[i - 1]) {
            throw std::invalid_argument("Sparse indices must be strictly increasing");
        }
    }
}

std::vector<std::uint8_t> serialize_dense(const DenseVector& vec) {
    std::vector<std::uint8_t> bytes(kDenseDimension * sizeof(float));
    std::memcpy(bytes.data(), vec.values.data(), bytes.size());
    return bytes;
}

DenseVector deserialize_dense(const void* data, std::size_t size) {
    if (data == nullptr || size != kDenseDimension * sizeof(float)) {
        throw std::runtime_error("Dense embedding blob has " + std::to_string(size) + " bytes, expected " +
                                 std::to_string(kDenseDimension * sizeof(float)));
    }
    DenseVector vec;
    std::memcpy(vec.values.data(), data, size);
    return vec;
}

std::vector<std::uint8_t> serialize_sparse(const SparseVector& vec) {
    validate(vec);
    json doc = {
        {"format", kSparseFormatTag},
        {"width", vec.declared_width},
        {"indices", vec.indices},
        {"values", vec.values}
    };
    return json::to_cbor(doc);
}

SparseVector deserialize_sparse(const void* data, std::size_t size) {
    if (data == nullptr || size == 0) {
        throw std::runtime_error("Empty sparse embedding blob");
    }
    const auto* begin = static_cast<const std::uint8_t*>(data);
    SparseVector vec;
    try {
        json doc = json::from_cbor(begin, begin + size);
        if (!doc.is_object()) {
            throw std::runtime_error("Sparse embedding blob is not a CBOR map");
        }
        if (doc.value("format", std::string()) != kSparseFormatTag) {
            throw std::runtime_error("Unknown sparse embedding format: " + doc.value("format", std::string("<none>")));
        }
        vec.declared_width = doc.at("width").get<std::uint32_t>();
        vec.indices = doc.at("indices").get<std::vector<std::uint32_t>>();
        vec.values = doc.at("values").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Corrupt sparse embedding blob: ") + e.what());
    }
    try {
        validate(vec);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid sparse embedding blob: ") + e.what());
    }
    return vec;
}

} // namespace fix_memory
