#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "docqa_core/configuration_error.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

struct ChunkerConfig {
  size_t max_length = 500;
  size_t overlap = 100;
};

class Chunker {
 public:
  // Throws ConfigurationError unless 0 <= overlap < max_length.
  explicit Chunker(const ChunkerConfig &config);

  /**
   * @brief Splits text into overlapping fixed-length windows.
   *
   * Windows start at 0 and advance by max_length - overlap bytes until a
   * window reaches the end of the text. That last window may be shorter than
   * max_length. Empty text yields no chunks.
   */
  std::vector<Chunk> chunk(const std::string &text) const;

  size_t step() const {
    return config_.max_length - config_.overlap;
  }

  const ChunkerConfig &config() const {
    return config_;
  }

  static void validate(const ChunkerConfig &config);

 private:
  ChunkerConfig config_;
};

// One-shot helper; validates the parameters on every call.
std::vector<Chunk> chunk_text(const std::string &text, size_t max_length, size_t overlap);

}  // namespace docqa_core
