#include "docqa_core/services/question_answering_service.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "docqa_core/index/flat_l2_index.hpp"

namespace docqa_core {

QuestionAnsweringService::QuestionAnsweringService(std::shared_ptr<Embedder> embedder,
                                                   std::shared_ptr<AnswerService> answer_service,
                                                   QaOptions options)
    : embedder_(std::move(embedder)),
      answer_service_(std::move(answer_service)),
      options_(std::move(options)),
      chunker_(options_.chunking),
      context_assembler_(options_.max_context_chars, options_.truncation_policy) {
  validate_options(options_);
  if (!embedder_ || !answer_service_) {
    throw ConfigurationError("QuestionAnsweringService requires an embedder and an answer service");
  }
}

void QuestionAnsweringService::validate_options(const QaOptions &options) {
  if (options.top_k <= 0) {
    throw ConfigurationError("top_k must be greater than 0");
  }
  if (options.max_tokens <= 0) {
    throw ConfigurationError("max_tokens must be greater than 0");
  }
  if (options.temperature < 0.0f || options.temperature > 2.0f) {
    throw ConfigurationError("temperature must be between 0 and 2");
  }
}

void QuestionAnsweringService::validate_question(const std::string &question) {
  const bool blank = std::all_of(question.begin(), question.end(),
                                 [](unsigned char c) { return std::isspace(c); });
  if (blank) {
    throw EmptyInputError("Question is empty");
  }
}

std::shared_ptr<const DocumentSession> QuestionAnsweringService::load_document(Document document) {
  std::vector<Chunk> chunks = chunker_.chunk(document.content);
  if (chunks.empty()) {
    throw EmptyInputError("Document '" + document.source_name +
                          "' contains no text to index; questions cannot be answered");
  }

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.content);
  }

  std::vector<std::vector<float>> embeddings = embedder_->embed(texts);
  validate_embeddings(embeddings, chunks.size());

  std::unique_ptr<VectorIndex> index = FlatL2Index::build(embeddings);
  std::cout << "Indexed document '" << document.source_name << "': " << chunks.size()
            << " chunks, dimension " << index->dimension() << std::endl;

  return std::make_shared<DocumentSession>(std::move(document), std::move(chunks),
                                           std::move(index));
}

Retrieval QuestionAnsweringService::retrieve(const DocumentSession &session,
                                             const std::string &question) {
  validate_question(question);

  std::vector<float> query_embedding = embedder_->embed_one(question);
  std::vector<SearchHit> hits = session.index().search(query_embedding, options_.top_k);

  std::vector<size_t> order;
  order.reserve(hits.size());
  for (const auto &hit : hits) {
    order.push_back(hit.position);
  }

  Retrieval retrieval;
  retrieval.context = context_assembler_.assemble(session.chunks(), order);
  retrieval.hits = std::move(hits);
  return retrieval;
}

Answer QuestionAnsweringService::answer(const DocumentSession &session,
                                        const std::string &question) {
  Retrieval retrieval = retrieve(session, question);
  const std::string prompt = build_prompt(options_.system_prompt, retrieval.context, question);

  Answer answer;
  answer.text = answer_service_->complete(prompt, options_.max_tokens, options_.temperature);
  answer.context = std::move(retrieval.context);
  answer.hits = std::move(retrieval.hits);
  return answer;
}

}  // namespace docqa_core
