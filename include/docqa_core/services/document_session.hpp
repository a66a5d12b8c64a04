#pragma once

#include <memory>
#include <vector>

#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/types.hpp"

namespace docqa_core {

// Everything one uploaded document needs to answer questions: the document,
// its chunks, and the index built over their embeddings. Immutable after
// construction, so one session can serve concurrent readers.
class DocumentSession {
 public:
  // Throws std::invalid_argument if the index does not hold exactly one
  // vector per chunk.
  DocumentSession(Document document, std::vector<Chunk> chunks, std::unique_ptr<VectorIndex> index);

  DocumentSession(const DocumentSession &) = delete;
  DocumentSession &operator=(const DocumentSession &) = delete;

  const Document &document() const {
    return document_;
  }

  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }

  const VectorIndex &index() const {
    return *index_;
  }

 private:
  Document document_;
  std::vector<Chunk> chunks_;
  std::unique_ptr<VectorIndex> index_;
};

}  // namespace docqa_core
