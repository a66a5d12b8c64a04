#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docqa_core/configuration_error.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

enum class TruncationPolicy {
  // Join everything, then cut at max_chars regardless of word boundaries.
  HardCut,
  // Stop before the first chunk that would push the context over max_chars.
  ChunkBoundary
};

std::string to_string(TruncationPolicy policy);
// Throws ConfigurationError for unknown names.
TruncationPolicy truncation_policy_from_string(const std::string &str);

class ContextAssembler {
 public:
  explicit ContextAssembler(size_t max_chars, TruncationPolicy policy = TruncationPolicy::HardCut);

  /**
   * @brief Joins chunk texts in the given order with a single space and
   *        bounds the result to max_chars bytes.
   * @param chunks All chunks of the document, indexed by position.
   * @param order Positions into chunks, in retrieval order.
   * @throws std::out_of_range if an entry of order is not a valid position.
   */
  std::string assemble(const std::vector<Chunk> &chunks,
                       const std::vector<size_t> &order) const;

  size_t max_chars() const {
    return max_chars_;
  }

  TruncationPolicy policy() const {
    return policy_;
  }

 private:
  size_t max_chars_;
  TruncationPolicy policy_;
};

}  // namespace docqa_core
