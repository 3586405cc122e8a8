#pragma once

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/db/chunk_store.hpp"
#include "rag_core/db/schema_migrator.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/ingestion_pipeline.hpp"

class Config {
 public:
  std::string api_base_url;
  std::string database_path;
  int db_pool_size;

  // Embedding provider
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int embedding_timeout_seconds;
  int embedding_max_attempts;
  int embedding_initial_backoff_ms;
  int embedding_max_backoff_ms;

  int num_workers;
  std::optional<size_t> max_chunk_chars;

  // Similarity index
  std::string similarity_index;
  int hnsw_m;
  int hnsw_ef_construction;
  int hnsw_ef_search;

  // Schema migration at startup
  bool migrate_on_startup;
  bool copy_legacy_on_startup;
  std::string legacy_table;
  std::string legacy_file_type;
  long long legacy_orphan_file_id;

  static constexpr const char* DEFAULT_CONFIG_FILE = "ragrc.json";

  // RAG_CONFIG overrides the default file name.
  static std::string resolve_path() {
    const char* env_path = std::getenv("RAG_CONFIG");
    if (env_path && *env_path) {
      return env_path;
    }
    return DEFAULT_CONFIG_FILE;
  }

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
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.database_path = json_config.value("database_path", std::string("./data/rag.db"));
      config.db_pool_size = json_config.value("db_pool_size", 4);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.embedding_dimension = json_config.value("embedding_dimension", 384);
      config.embedding_timeout_seconds = json_config.value("embedding_timeout_seconds", 30);
      config.embedding_max_attempts = json_config.value("embedding_max_attempts", 3);
      config.embedding_initial_backoff_ms = json_config.value("embedding_initial_backoff_ms", 200);
      config.embedding_max_backoff_ms = json_config.value("embedding_max_backoff_ms", 5000);

      if (json_config.contains("max_chunk_chars") && !json_config["max_chunk_chars"].is_null()) {
        const long long value = json_config.at("max_chunk_chars").get<long long>();
        if (value <= 0) {
          throw std::runtime_error("max_chunk_chars must be greater than 0");
        }
        config.max_chunk_chars = static_cast<size_t>(value);
      }

      config.similarity_index = json_config.value("similarity_index", std::string("hnsw"));
      config.hnsw_m = json_config.value("hnsw_m", 32);
      config.hnsw_ef_construction = json_config.value("hnsw_ef_construction", 100);
      config.hnsw_ef_search = json_config.value("hnsw_ef_search", 64);

      config.migrate_on_startup = json_config.value("migrate_on_startup", true);
      config.copy_legacy_on_startup = json_config.value("copy_legacy_on_startup", false);
      config.legacy_table = json_config.value("legacy_table", std::string("pdf_chunks"));
      config.legacy_file_type = json_config.value("legacy_file_type", std::string("pdf"));
      config.legacy_orphan_file_id = json_config.value("legacy_orphan_file_id", 0LL);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    // Handle integer with default and basic type safety
    try {
      if (json_config.contains("num_workers")) {
        config.num_workers = json_config.at("num_workers").get<int>();
      } else {
        config.num_workers = 2;
      }
    } catch (const std::exception&) {
      // Fallback to default if wrong type provided
      config.num_workers = 2;
    }

    config.validate();
    return config;
  }

  rag_core::RetryPolicy retry_policy() const {
    rag_core::RetryPolicy policy;
    policy.max_attempts = embedding_max_attempts;
    policy.initial_backoff = std::chrono::milliseconds(embedding_initial_backoff_ms);
    policy.max_backoff = std::chrono::milliseconds(embedding_max_backoff_ms);
    return policy;
  }

  rag_core::SimilarityIndexOptions index_options() const {
    rag_core::SimilarityIndexOptions options;
    options.kind = rag_core::similarity_index_kind_from_string(similarity_index);
    options.hnsw_m = hnsw_m;
    options.hnsw_ef_construction = hnsw_ef_construction;
    options.hnsw_ef_search = hnsw_ef_search;
    return options;
  }

  rag_core::MigrationOptions startup_migration_options() const {
    rag_core::MigrationOptions options;
    options.copy_legacy = copy_legacy_on_startup;
    options.legacy_table = legacy_table;
    options.legacy_file_type = rag_core::file_type_from_string(legacy_file_type);
    options.orphan_file_id = legacy_orphan_file_id;
    return options;
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (embedding_timeout_seconds <= 0) {
      throw std::runtime_error("embedding_timeout_seconds must be greater than 0");
    }
    if (embedding_max_attempts < 1) {
      throw std::runtime_error("embedding_max_attempts must be at least 1");
    }
    if (embedding_initial_backoff_ms < 0 || embedding_max_backoff_ms < embedding_initial_backoff_ms) {
      throw std::runtime_error(
          "embedding backoff must satisfy 0 <= initial_backoff_ms <= max_backoff_ms");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (hnsw_m < 2 || hnsw_ef_construction <= 0 || hnsw_ef_search <= 0) {
      throw std::runtime_error("hnsw_m must be at least 2 and hnsw_ef_* greater than 0");
    }
    try {
      rag_core::similarity_index_kind_from_string(similarity_index);
      rag_core::file_type_from_string(legacy_file_type);
    } catch (const rag_core::ValidationError& e) {
      throw std::runtime_error(e.what());
    }
    if (legacy_table.empty()) {
      throw std::runtime_error("legacy_table cannot be empty");
    }
  }
};
