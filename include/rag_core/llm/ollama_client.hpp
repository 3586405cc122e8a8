#pragma once

#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

class OllamaError : public std::exception {
 public:
  OllamaError(const std::string &message, bool transport_error = false)
      : message_(message), transport_error_(transport_error) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  // The server could not be reached or did not answer in time.
  bool is_transport_error() const noexcept {
    return transport_error_;
  }

 private:
  std::string message_;
  bool transport_error_;
};

class OllamaClient : public EmbeddingProvider {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               int timeout_seconds = 30);
  ~OllamaClient() override = default;

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  bool is_server_available() override;

  const std::string &model() const {
    return embedding_model_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  int timeout_seconds_;

  void setup_server_connection();
};

}  // namespace rag_core
