#include "docqa_core/index/flat_l2_index.hpp"

#include <faiss/impl/FaissException.h>

#include <algorithm>
#include <stdexcept>

namespace docqa_core {

FlatL2Index::FlatL2Index(PrivateTag, std::unique_ptr<faiss::IndexFlatL2> index)
    : faiss_index_(std::move(index)) {}

std::unique_ptr<FlatL2Index> FlatL2Index::build(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    throw EmptyInputError("Cannot build an index from zero vectors");
  }

  const size_t dimension = vectors.front().size();
  if (dimension == 0) {
    throw DimensionMismatchError("Cannot build an index from zero-dimensional vectors");
  }

  // Flatten into one row-major buffer, validating each row on the way
  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(vectors.size() * dimension);
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dimension) {
      throw DimensionMismatchError("Vector dimension mismatch at position " + std::to_string(i) +
                                   ". Expected " + std::to_string(dimension) + ", got " +
                                   std::to_string(vectors[i].size()));
    }
    all_vectors_flat.insert(all_vectors_flat.end(), vectors[i].begin(), vectors[i].end());
  }

  auto index = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension));
  try {
    index->add(static_cast<faiss::idx_t>(vectors.size()), all_vectors_flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to add vectors to Faiss index: " + std::string(e.what()));
  }
  return std::make_unique<FlatL2Index>(PrivateTag{}, std::move(index));
}

std::vector<SearchHit> FlatL2Index::search(const std::vector<float> &query, int k) const {
  if (k <= 0) {
    throw std::invalid_argument("k must be greater than 0, got " + std::to_string(k));
  }
  if (query.size() != dimension()) {
    throw DimensionMismatchError("Query vector dimension mismatch. Expected " +
                                 std::to_string(dimension()) + ", got " +
                                 std::to_string(query.size()));
  }

  // Rank every stored vector so that equal distances at the k-th place are
  // resolved by position rather than by heap order inside faiss.
  const faiss::idx_t total = faiss_index_->ntotal;
  std::vector<float> distances(total);
  std::vector<faiss::idx_t> labels(total);
  try {
    faiss_index_->search(1, query.data(), total, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Faiss search failed: " + std::string(e.what()));
  }

  std::vector<SearchHit> hits;
  hits.reserve(total);
  for (faiss::idx_t i = 0; i < total; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    hits.push_back({static_cast<size_t>(labels[i]), distances[i]});
  }
  std::sort(hits.begin(), hits.end(), [](const SearchHit &a, const SearchHit &b) {
    if (a.distance != b.distance) {
      return a.distance < b.distance;
    }
    return a.position < b.position;
  });

  hits.resize(std::min(hits.size(), static_cast<size_t>(k)));
  return hits;
}

size_t FlatL2Index::size() const {
  return static_cast<size_t>(faiss_index_->ntotal);
}

size_t FlatL2Index::dimension() const {
  return static_cast<size_t>(faiss_index_->d);
}

}  // namespace docqa_core
