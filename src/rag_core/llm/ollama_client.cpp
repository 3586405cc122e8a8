#include "rag_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"

namespace rag_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           int timeout_seconds)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), timeout_seconds_(timeout_seconds) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(timeout_seconds_);
  ollama::setWriteTimeout(timeout_seconds_);

  // Not fatal: ingestion retries until the server comes up.
  if (!ollama::is_running()) {
    std::cerr << "Warning: Ollama server is not running at " << ollama_url_ << std::endl;
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  nlohmann::json json_response;
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    json_response = response.as_json();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding request to " + ollama_url_ + " failed: " + std::string(e.what()),
                      true);
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Embedding response is not valid JSON: " + std::string(e.what()));
  }

  try {
    // Newer servers answer {"embeddings": [[...]]}, older ones {"embedding": [...]}.
    if (json_response.contains("embeddings")) {
      const auto &embeddings = json_response["embeddings"];
      if (!embeddings.is_array() || embeddings.empty()) {
        throw OllamaError("Embeddings field is not a non-empty array");
      }
      if (embeddings[0].is_array()) {
        return embeddings[0].get<std::vector<float>>();
      }
      return embeddings.get<std::vector<float>>();
    }
    if (json_response.contains("embedding")) {
      const auto &embedding = json_response["embedding"];
      if (!embedding.is_array()) {
        throw OllamaError("Embedding field is not an array");
      }
      return embedding.get<std::vector<float>>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Embedding response has non-numeric values: " + std::string(e.what()));
  }
  throw OllamaError("Response does not contain an embedding field");
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace rag_core
