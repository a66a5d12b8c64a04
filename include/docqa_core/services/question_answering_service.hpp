#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/chunking/chunker.hpp"
#include "docqa_core/context/context_assembler.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/llm/answer_service.hpp"
#include "docqa_core/prompt/prompt_builder.hpp"
#include "docqa_core/services/document_session.hpp"

namespace docqa_core {

struct QaOptions {
  ChunkerConfig chunking;
  int top_k = 5;
  size_t max_context_chars = 500;
  TruncationPolicy truncation_policy = TruncationPolicy::HardCut;
  int max_tokens = 150;
  float temperature = 0.7f;
  std::string system_prompt = DEFAULT_SYSTEM_PROMPT;
};

struct Retrieval {
  std::vector<SearchHit> hits;
  std::string context;
};

struct Answer {
  std::string text;
  std::string context;
  std::vector<SearchHit> hits;
};

class QuestionAnsweringService {
 public:
  // Throws ConfigurationError if options are out of range.
  QuestionAnsweringService(std::shared_ptr<Embedder> embedder,
                           std::shared_ptr<AnswerService> answer_service,
                           QaOptions options = {});

  // Chunks, embeds and indexes a document. A document without any chunk
  // fails with EmptyInputError before the embedder is called.
  std::shared_ptr<const DocumentSession> load_document(Document document);

  // Embeds the question and assembles the context from the top-k chunks.
  Retrieval retrieve(const DocumentSession &session, const std::string &question);

  // retrieve + prompt + completion. Service failures propagate unchanged.
  Answer answer(const DocumentSession &session, const std::string &question);

  const QaOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<AnswerService> answer_service_;
  QaOptions options_;
  Chunker chunker_;
  ContextAssembler context_assembler_;

  static void validate_options(const QaOptions &options);
  static void validate_question(const std::string &question);
};

}  // namespace docqa_core
