#include "docqa_core/chunking/chunker.hpp"

#include <algorithm>

namespace docqa_core {

Chunker::Chunker(const ChunkerConfig &config) : config_(config) {
  validate(config_);
}

void Chunker::validate(const ChunkerConfig &config) {
  if (config.max_length == 0) {
    throw ConfigurationError("Chunk max_length must be greater than 0");
  }
  if (config.overlap >= config.max_length) {
    throw ConfigurationError("Chunk overlap (" + std::to_string(config.overlap) +
                             ") must be smaller than max_length (" +
                             std::to_string(config.max_length) + ")");
  }
}

std::vector<Chunk> Chunker::chunk(const std::string &text) const {
  std::vector<Chunk> chunks;
  if (text.empty()) {
    return chunks;
  }

  const size_t stride = step();

  int chunk_index = 0;
  for (size_t start = 0; start < text.size(); start += stride) {
    const size_t end = std::min(start + config_.max_length, text.size());
    chunks.push_back({.content = text.substr(start, end - start),
                      .chunk_index = chunk_index++,
                      .start_offset = start});
    // A window that reaches the end already covers everything after it.
    if (end == text.size()) {
      break;
    }
  }
  return chunks;
}

std::vector<Chunk> chunk_text(const std::string &text, size_t max_length, size_t overlap) {
  return Chunker(ChunkerConfig{max_length, overlap}).chunk(text);
}

}  // namespace docqa_core
