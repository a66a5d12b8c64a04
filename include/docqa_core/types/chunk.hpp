#pragma once

#include <cstddef>
#include <string>

namespace docqa_core {

// A window of the source document. start_offset is a byte offset into the
// document content; chunk_index is the chunk's position in the sequence and
// also its position in the vector index.
struct Chunk {
  std::string content;
  int chunk_index = 0;
  size_t start_offset = 0;
};

}  // namespace docqa_core
