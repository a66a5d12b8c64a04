#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

namespace docqa_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DimensionMismatchError : public VectorIndexError {
 public:
  using VectorIndexError::VectorIndexError;
};

class EmptyInputError : public VectorIndexError {
 public:
  using VectorIndexError::VectorIndexError;
};

struct SearchHit {
  size_t position;  // insertion position == Chunk::chunk_index
  float distance;   // squared L2
};

// Read-only nearest-neighbour index over the vectors of one document.
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Returns min(k, size()) hits sorted by ascending distance, ties broken by
  // ascending position. Throws DimensionMismatchError if the query has the
  // wrong dimension and std::invalid_argument if k <= 0.
  virtual std::vector<SearchHit> search(const std::vector<float> &query, int k) const = 0;

  virtual size_t size() const = 0;
  virtual size_t dimension() const = 0;
};

}  // namespace docqa_core
