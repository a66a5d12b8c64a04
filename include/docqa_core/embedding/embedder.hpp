#pragma once

#include <exception>
#include <string>
#include <vector>

namespace docqa_core {

class ModelError : public std::exception {
 public:
  explicit ModelError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Maps text to fixed-dimension vectors. Implementations return one vector per
// input, in input order, all of the same dimension, or throw ModelError.
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;

  virtual std::vector<float> embed_one(const std::string &text);
};

// Throws ModelError if the batch does not have one vector per input or the
// vectors disagree on dimension.
void validate_embeddings(const std::vector<std::vector<float>> &embeddings, size_t expected_count);

}  // namespace docqa_core
