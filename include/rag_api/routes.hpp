#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "rag_api/server.hpp"

namespace rag_core {
class ChunkStore;
class DocumentRepo;
class IngestionPipeline;
class IngestionService;
class RetrievalEngine;
class SchemaMigrator;
class TaskQueueRepo;
struct Chunk;
struct ChunkFilter;
struct IngestTask;
struct IngestionRequest;
}  // namespace rag_core

namespace rag_api {

// Reads one document object of an ingest request body.
// Throws ValidationError when file_id or file_type is missing.
rag_core::IngestionRequest parse_ingestion_request(const nlohmann::json &body);

struct RouteServices {
  std::shared_ptr<rag_core::ChunkStore> chunk_store;
  std::shared_ptr<rag_core::DocumentRepo> document_repo;
  std::shared_ptr<rag_core::IngestionPipeline> ingestion_pipeline;
  std::shared_ptr<rag_core::IngestionService> ingestion_service;
  std::shared_ptr<rag_core::RetrievalEngine> retrieval_engine;
  std::shared_ptr<rag_core::SchemaMigrator> schema_migrator;
  std::shared_ptr<rag_core::TaskQueueRepo> task_queue_repo;
};

class Routes {
 public:
  explicit Routes(RouteServices services);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

 private:
  RouteServices services_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_ingest_document(const crow::request &req);
  crow::response handle_ingest_batch(const crow::request &req);
  crow::response handle_get_document(const crow::request &req, long long file_id);
  crow::response handle_list_chunks(const crow::request &req, long long file_id);
  crow::response handle_delete_document(const crow::request &req, long long file_id);
  crow::response handle_retrieve(const crow::request &req);
  crow::response handle_search_documents(const crow::request &req);
  crow::response handle_migrate(const crow::request &req);

  // Task management endpoints
  crow::response handle_list_tasks(const crow::request &req);
  crow::response handle_get_task(const crow::request &req, long long task_id);
  crow::response handle_get_task_progress(const crow::request &req, long long task_id);
  crow::response handle_clear_completed_tasks(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  rag_core::ChunkFilter parse_filter(const nlohmann::json &body);
  nlohmann::json chunk_to_json(const rag_core::Chunk &chunk);
  nlohmann::json task_to_json(const rag_core::IngestTask &task);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_exception_response(const std::string &handler, const std::exception &e);
};

}  // namespace rag_api
