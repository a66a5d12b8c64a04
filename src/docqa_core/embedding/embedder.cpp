#include "docqa_core/embedding/embedder.hpp"

namespace docqa_core {

std::vector<float> Embedder::embed_one(const std::string &text) {
  std::vector<std::vector<float>> embeddings = embed({text});
  validate_embeddings(embeddings, 1);
  return std::move(embeddings.front());
}

void validate_embeddings(const std::vector<std::vector<float>> &embeddings, size_t expected_count) {
  if (embeddings.size() != expected_count) {
    throw ModelError("Embedding model returned " + std::to_string(embeddings.size()) +
                     " vectors for " + std::to_string(expected_count) + " inputs");
  }
  if (embeddings.empty()) {
    return;
  }
  const size_t dimension = embeddings.front().size();
  if (dimension == 0) {
    throw ModelError("Embedding model returned an empty vector");
  }
  for (size_t i = 1; i < embeddings.size(); ++i) {
    if (embeddings[i].size() != dimension) {
      throw ModelError("Embedding dimension changed within a batch. Expected " +
                       std::to_string(dimension) + ", got " +
                       std::to_string(embeddings[i].size()) + " at position " +
                       std::to_string(i));
    }
  }
}

}  // namespace docqa_core
