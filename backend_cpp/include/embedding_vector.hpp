#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace fix_memory {

// Width of the neural backend's sentence embeddings (all-MiniLM-L6-v2).
constexpr std::size_t kDenseDimension = 384;
// Upper bound on the statistical fallback's feature space.
constexpr std::uint32_t kSparseMaxWidth = 100;

struct DenseVector {
    std::array<float, kDenseDimension> values{};
};

// Indices are strictly increasing and < declared_width; values[i] belongs to indices[i].
struct SparseVector {
    std::vector<std::uint32_t> indices;
    std::vector<float> values;
    std::uint32_t declared_width = kSparseMaxWidth;
};

using EmbeddingVector = std::variant<DenseVector, SparseVector>;

enum class EmbeddingKind { Dense, Sparse };

EmbeddingKind kind_of(const EmbeddingVector& vec);
std::string to_string(EmbeddingKind kind);

// True when a and b live in the same feature space and may be compared.
bool comparable(const EmbeddingVector& a, const EmbeddingVector& b);

// Cosine similarity in [-1, 1]. Zero-norm input yields 0.0.
// Throws std::invalid_argument when !comparable(a, b).
float similarity(const EmbeddingVector& a, const EmbeddingVector& b);

// Throws std::invalid_argument on broken index/value invariants.
void validate(const SparseVector& vec);

// Dense rows are stored as raw float32 bytes (kDenseDimension * 4 bytes).
std::vector<std::uint8_t> serialize_dense(const DenseVector& vec);
DenseVector deserialize_dense(const void* data, std::size_t size);

// Sparse rows are stored as a CBOR document {"format", "width", "indices", "values"}.
std::vector<std::uint8_t> serialize_sparse(const SparseVector& vec);
SparseVector deserialize_sparse(const void* data, std::size_t size);

} // namespace fix_memory
