#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "docqa_api/config.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/embedding/ollama_embedder.hpp"
#include "docqa_core/llm/openai_chat_client.hpp"
#include "docqa_core/services/question_answering_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

Config load_config(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    std::cerr << "Warning: " << path << " not found, using default configuration" << std::endl;
    return Config::from_json(nlohmann::json::object());
  }
  return Config::from_file(path);
}

int main() {
  try {
    Config config = load_config("docqarc.json");

    const char* api_key = std::getenv(config.answer_api_key_env.c_str());
    std::cout << "Starting DocQA API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Answer API: " << config.answer_api_url << " (" << config.answer_model << ")"
              << std::endl;
    std::cout << "Chunking: max_length=" << config.chunk_max_length
              << " overlap=" << config.chunk_overlap << std::endl;
    if (!api_key) {
      std::cerr << "Warning: " << config.answer_api_key_env
                << " is not set; answer requests are sent without credentials" << std::endl;
    }

    // Initialize core components
    auto embedder = std::make_shared<docqa_core::OllamaEmbedder>(config.to_embedder_config());
    auto answer_service = std::make_shared<docqa_core::OpenAiChatClient>(
        config.to_chat_config(api_key ? api_key : ""));
    auto qa_service = std::make_shared<docqa_core::QuestionAnsweringService>(
        embedder, answer_service, config.to_qa_options());

    docqa_api::Server server(config.api_base_url);
    docqa_api::Routes routes(qa_service);
    routes.register_routes(server);

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "Stopping API server..." << std::endl;
    server.stop();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
