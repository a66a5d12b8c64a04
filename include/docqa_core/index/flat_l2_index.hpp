#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <vector>

#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

// Exact squared-L2 search backed by faiss::IndexFlatL2.
class FlatL2Index : public VectorIndex {
  // Restricts construction to build()
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  /**
   * @brief Builds an index from vectors in insertion order.
   * @throws EmptyInputError if vectors is empty.
   * @throws DimensionMismatchError if the vectors disagree on dimension or
   *         have dimension 0.
   */
  static std::unique_ptr<FlatL2Index> build(const std::vector<std::vector<float>> &vectors);

  FlatL2Index(PrivateTag, std::unique_ptr<faiss::IndexFlatL2> index);

  // Disable copy constructor and assignment
  FlatL2Index(const FlatL2Index &) = delete;
  FlatL2Index &operator=(const FlatL2Index &) = delete;

  std::vector<SearchHit> search(const std::vector<float> &query, int k) const override;

  size_t size() const override;
  size_t dimension() const override;

 private:
  std::unique_ptr<faiss::IndexFlatL2> faiss_index_;
};

}  // namespace docqa_core
