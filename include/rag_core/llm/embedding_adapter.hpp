#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/llm/embedding_provider.hpp"

namespace rag_core {

/**
 * Narrow front of the embedding provider. Every vector it returns has exactly
 * the configured dimension and only finite components; anything else is an
 * EmbeddingError. Vectors are never truncated or padded.
 */
class EmbeddingAdapter {
 public:
  EmbeddingAdapter(std::shared_ptr<EmbeddingProvider> provider, int dimension);
  virtual ~EmbeddingAdapter() = default;

  virtual std::vector<float> embed(const std::string& text);

  // Embeds a fixed sample string once and checks the dimension.
  void verify_dimension();

  int dimension() const {
    return dimension_;
  }

 private:
  std::shared_ptr<EmbeddingProvider> provider_;
  int dimension_;
};

}  // namespace rag_core
