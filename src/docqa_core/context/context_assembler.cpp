#include "docqa_core/context/context_assembler.hpp"

#include <stdexcept>

namespace docqa_core {

std::string to_string(TruncationPolicy policy) {
  switch (policy) {
    case TruncationPolicy::HardCut:
      return "hard_cut";
    case TruncationPolicy::ChunkBoundary:
      return "chunk_boundary";
  }
  return "unknown";
}

TruncationPolicy truncation_policy_from_string(const std::string &str) {
  if (str == "hard_cut")
    return TruncationPolicy::HardCut;
  if (str == "chunk_boundary")
    return TruncationPolicy::ChunkBoundary;
  throw ConfigurationError("Unknown truncation policy: " + str);
}

ContextAssembler::ContextAssembler(size_t max_chars, TruncationPolicy policy)
    : max_chars_(max_chars), policy_(policy) {
  if (max_chars_ == 0) {
    throw ConfigurationError("Context max_chars must be greater than 0");
  }
}

std::string ContextAssembler::assemble(const std::vector<Chunk> &chunks,
                                       const std::vector<size_t> &order) const {
  for (size_t position : order) {
    if (position >= chunks.size()) {
      throw std::out_of_range("Chunk position " + std::to_string(position) +
                              " is out of range for " + std::to_string(chunks.size()) +
                              " chunks");
    }
  }

  std::string context;
  for (size_t i = 0; i < order.size(); ++i) {
    const std::string &text = chunks.at(order[i]).content;
    const size_t separator = i == 0 ? 0 : 1;

    if (policy_ == TruncationPolicy::ChunkBoundary &&
        context.size() + separator + text.size() > max_chars_) {
      break;
    }

    if (separator) {
      context += ' ';
    }
    context += text;

    if (policy_ == TruncationPolicy::HardCut && context.size() >= max_chars_) {
      break;
    }
  }

  if (context.size() > max_chars_) {
    context.resize(max_chars_);
  }
  return context;
}

}  // namespace docqa_core
