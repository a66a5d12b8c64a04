#include "docqa_core/embedding/ollama_embedder.hpp"

#include "ollama.hpp"

namespace docqa_core {

OllamaEmbedder::OllamaEmbedder(const OllamaEmbedderConfig &config) : config_(config) {
  setup_server_connection();
}

void OllamaEmbedder::setup_server_connection() {
  ollama::setServerURL(config_.ollama_url);
  ollama::setReadTimeout(config_.read_timeout_seconds);
  ollama::setWriteTimeout(config_.write_timeout_seconds);
  if (!ollama::is_running()) {
    throw ModelError("Ollama server is not running at " + config_.ollama_url);
  }
}

std::vector<std::vector<float>> OllamaEmbedder::embed(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (const auto &text : texts) {
    embeddings.push_back(request_embedding(text));
  }
  validate_embeddings(embeddings, texts.size());
  return embeddings;
}

std::vector<float> OllamaEmbedder::request_embedding(const std::string &text) {
  try {
    // truncate=false: over-length input must fail instead of being cut silently
    ollama::response response =
        ollama::generate_embeddings(config_.embedding_model, text, nullptr, false);

    auto json_response = response.as_json();
    if (json_response.contains("error")) {
      throw ModelError("Embedding model rejected input: " +
                       json_response["error"].get<std::string>());
    }
    if (!json_response.contains("embeddings")) {
      throw ModelError("Response does not contain embeddings field");
    }

    // /api/embed answers with an array of arrays, one per input
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw ModelError("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();

  } catch (const ollama::exception &e) {
    throw ModelError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw ModelError("Malformed embedding response: " + std::string(e.what()));
  }
}

bool OllamaEmbedder::is_server_available() {
  return ollama::is_running();
}

}  // namespace docqa_core
