#pragma once

#include <string>
#include <vector>

namespace rag_core {

// External model that turns text into a vector.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> get_embedding(const std::string &text) = 0;
  virtual bool is_server_available() = 0;
};

}  // namespace rag_core
