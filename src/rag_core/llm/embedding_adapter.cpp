#include "rag_core/llm/embedding_adapter.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include "rag_core/errors.hpp"
#include "rag_core/llm/ollama_client.hpp"

namespace rag_core {

EmbeddingAdapter::EmbeddingAdapter(std::shared_ptr<EmbeddingProvider> provider, int dimension)
    : provider_(std::move(provider)), dimension_(dimension) {
  if (!provider_) {
    throw std::invalid_argument("EmbeddingAdapter requires a provider");
  }
  if (dimension_ <= 0) {
    throw ValidationError("Embedding dimension must be positive, got " + std::to_string(dimension_));
  }
}

std::vector<float> EmbeddingAdapter::embed(const std::string& text) {
  std::vector<float> vector;
  try {
    vector = provider_->get_embedding(text);
  } catch (const OllamaError& e) {
    throw EmbeddingError(e.what(), e.is_transport_error());
  }

  if (vector.size() != static_cast<size_t>(dimension_)) {
    throw EmbeddingError("Provider returned a " + std::to_string(vector.size()) +
                             "-dimensional vector, expected " + std::to_string(dimension_),
                         false);
  }
  for (size_t i = 0; i < vector.size(); ++i) {
    if (!std::isfinite(vector[i])) {
      throw EmbeddingError("Provider returned a non-finite value at position " + std::to_string(i),
                           false);
    }
  }
  return vector;
}

void EmbeddingAdapter::verify_dimension() {
  embed("dimension check");
  std::cout << "Embedding provider emits " << dimension_ << "-dimensional vectors" << std::endl;
}

}  // namespace rag_core
