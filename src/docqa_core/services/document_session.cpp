#include "docqa_core/services/document_session.hpp"

#include <stdexcept>
#include <string>

namespace docqa_core {

DocumentSession::DocumentSession(Document document, std::vector<Chunk> chunks,
                                 std::unique_ptr<VectorIndex> index)
    : document_(std::move(document)), chunks_(std::move(chunks)), index_(std::move(index)) {
  if (!index_) {
    throw std::invalid_argument("DocumentSession requires an index");
  }
  if (index_->size() != chunks_.size()) {
    throw std::invalid_argument("Index holds " + std::to_string(index_->size()) +
                                " vectors but the document has " +
                                std::to_string(chunks_.size()) + " chunks");
  }
}

}  // namespace docqa_core
