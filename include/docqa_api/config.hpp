#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "docqa_core/context/context_assembler.hpp"
#include "docqa_core/embedding/ollama_embedder.hpp"
#include "docqa_core/llm/openai_chat_client.hpp"
#include "docqa_core/services/question_answering_service.hpp"

class Config {
 public:
  std::string api_base_url;

  // Embedding model
  std::string ollama_url;
  std::string embedding_model;
  int embedding_timeout_seconds;

  // Answer model
  std::string answer_api_url;
  std::string answer_model;
  std::string answer_api_key_env;
  long answer_timeout_ms;

  // Retrieval pipeline
  int chunk_max_length;
  int chunk_overlap;
  int top_k;
  int max_context_chars;
  std::string truncation_policy;
  int max_tokens;
  float temperature;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
    config.answer_api_url = json_config.value("answer_api_url", std::string("https://api.openai.com/v1"));
    config.answer_model = json_config.value("answer_model", std::string("gpt-3.5-turbo"));
    config.answer_api_key_env = json_config.value("answer_api_key_env", std::string("OPENAI_API_KEY"));
    config.truncation_policy = json_config.value("truncation_policy", std::string("hard_cut"));

    try {
      config.embedding_timeout_seconds = json_config.value("embedding_timeout_seconds", 60);
      config.answer_timeout_ms = json_config.value("answer_timeout_ms", 30000L);
      config.chunk_max_length = json_config.value("chunk_max_length", 500);
      config.chunk_overlap = json_config.value("chunk_overlap", 100);
      config.top_k = json_config.value("top_k", 5);
      config.max_context_chars = json_config.value("max_context_chars", 500);
      config.max_tokens = json_config.value("max_tokens", 150);
      config.temperature = json_config.value("temperature", 0.7f);
    } catch (const nlohmann::json::type_error& e) {
      throw std::runtime_error(std::string("Config value has the wrong type: ") + e.what());
    }

    config.validate();
    return config;
  }

  docqa_core::QaOptions to_qa_options() const {
    docqa_core::QaOptions options;
    options.chunking.max_length = static_cast<size_t>(chunk_max_length);
    options.chunking.overlap = static_cast<size_t>(chunk_overlap);
    options.top_k = top_k;
    options.max_context_chars = static_cast<size_t>(max_context_chars);
    options.truncation_policy = docqa_core::truncation_policy_from_string(truncation_policy);
    options.max_tokens = max_tokens;
    options.temperature = temperature;
    return options;
  }

  docqa_core::OllamaEmbedderConfig to_embedder_config() const {
    docqa_core::OllamaEmbedderConfig embedder_config;
    embedder_config.ollama_url = ollama_url;
    embedder_config.embedding_model = embedding_model;
    embedder_config.read_timeout_seconds = embedding_timeout_seconds;
    embedder_config.write_timeout_seconds = embedding_timeout_seconds;
    return embedder_config;
  }

  docqa_core::OpenAiChatConfig to_chat_config(const std::string& api_key) const {
    docqa_core::OpenAiChatConfig chat_config;
    chat_config.base_url = answer_api_url;
    chat_config.model = answer_model;
    chat_config.api_key = api_key;
    chat_config.timeout_ms = answer_timeout_ms;
    return chat_config;
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be of the form host:port");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (answer_api_url.empty()) {
      throw std::runtime_error("answer_api_url cannot be empty");
    }
    if (answer_model.empty()) {
      throw std::runtime_error("answer_model cannot be empty");
    }
    if (embedding_timeout_seconds <= 0) {
      throw std::runtime_error("embedding_timeout_seconds must be greater than 0");
    }
    if (answer_timeout_ms < 100) {
      throw std::runtime_error("answer_timeout_ms must be at least 100ms");
    }
    if (chunk_max_length <= 0) {
      throw std::runtime_error("chunk_max_length must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_max_length) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_max_length)");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (max_context_chars <= 0) {
      throw std::runtime_error("max_context_chars must be greater than 0");
    }
    if (truncation_policy != "hard_cut" && truncation_policy != "chunk_boundary") {
      throw std::runtime_error("truncation_policy must be 'hard_cut' or 'chunk_boundary'");
    }
    if (max_tokens <= 0) {
      throw std::runtime_error("max_tokens must be greater than 0");
    }
    if (temperature < 0.0f || temperature > 2.0f) {
      throw std::runtime_error("temperature must be between 0 and 2");
    }
  }
};
