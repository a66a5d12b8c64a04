#pragma once

#include <string>
#include <vector>

#include "docqa_core/embedding/embedder.hpp"

namespace docqa_core {

struct OllamaEmbedderConfig {
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "all-minilm";
  int read_timeout_seconds = 60;
  int write_timeout_seconds = 30;
};

class OllamaEmbedder : public Embedder {
 public:
  // Throws ModelError if the Ollama server cannot be reached.
  explicit OllamaEmbedder(const OllamaEmbedderConfig &config);
  ~OllamaEmbedder() override = default;

  // Disable copy constructor and assignment
  OllamaEmbedder(const OllamaEmbedder &) = delete;
  OllamaEmbedder &operator=(const OllamaEmbedder &) = delete;

  // One request per text; the first failure aborts the whole batch.
  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;

  bool is_server_available();

 private:
  OllamaEmbedderConfig config_;

  // Helper methods
  void setup_server_connection();
  std::vector<float> request_embedding(const std::string &text);
};

}  // namespace docqa_core
