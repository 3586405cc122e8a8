#include "rag_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "rag_api/error_status.hpp"
#include "rag_core/db/chunk_store.hpp"
#include "rag_core/db/document_repo.hpp"
#include "rag_core/db/schema_migrator.hpp"
#include "rag_core/db/task_queue_repo.hpp"
#include "rag_core/db/time_utils.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/services/ingestion_pipeline.hpp"
#include "rag_core/services/ingestion_service.hpp"
#include "rag_core/services/retrieval_engine.hpp"

namespace rag_api {

namespace {

std::optional<std::string> optional_string(const nlohmann::json &body, const char *key) {
  if (!body.contains(key) || body[key].is_null()) {
    return std::nullopt;
  }
  return body[key].get<std::string>();
}

bool is_truthy(const char *value) {
  if (!value) {
    return false;
  }
  const std::string flag(value);
  return flag == "1" || flag == "true" || flag == "yes";
}

}  // namespace

rag_core::IngestionRequest parse_ingestion_request(const nlohmann::json &body) {
  if (!body.is_object() || !body.contains("file_id") || !body.contains("file_type")) {
    throw rag_core::ValidationError("file_id and file_type are required");
  }

  rag_core::IngestionRequest request;
  request.file_id = body.at("file_id").get<long long>();
  request.subject_code = optional_string(body, "subject_code");
  request.file_type = rag_core::file_type_from_string(body.at("file_type").get<std::string>());
  request.text = optional_string(body, "text");
  if (body.contains("sections")) {
    for (const auto &section : body.at("sections")) {
      request.sections.push_back({.label = section.value("section", ""),
                                  .content = section.at("content").get<std::string>()});
    }
  }
  if (body.contains("max_chunk_chars") && !body["max_chunk_chars"].is_null()) {
    request.max_chunk_chars = body.at("max_chunk_chars").get<size_t>();
  }
  request.priority = body.value("priority", 10);
  return request;
}

Routes::Routes(RouteServices services) : services_(std::move(services)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Documents
  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest_document(req); });

  CROW_ROUTE(app, "/documents/batch")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest_batch(req); });

  CROW_ROUTE(app, "/documents/<int>")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req, int64_t file_id) {
        return handle_get_document(req, file_id);
      });

  CROW_ROUTE(app, "/documents/<int>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, int64_t file_id) {
        return handle_delete_document(req, file_id);
      });

  CROW_ROUTE(app, "/documents/<int>/chunks")
  ([this](const crow::request &req, int64_t file_id) { return handle_list_chunks(req, file_id); });

  // Retrieval
  CROW_ROUTE(app, "/retrieve").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_retrieve(req);
  });

  CROW_ROUTE(app, "/search/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_search_documents(req); });

  // Task management endpoints
  CROW_ROUTE(app, "/tasks")
  ([this](const crow::request &req) { return handle_list_tasks(req); });

  CROW_ROUTE(app, "/tasks/<int>")
  ([this](const crow::request &req, int64_t task_id) { return handle_get_task(req, task_id); });

  CROW_ROUTE(app, "/tasks/<int>/progress")
  ([this](const crow::request &req, int64_t task_id) {
    return handle_get_task_progress(req, task_id);
  });

  CROW_ROUTE(app, "/tasks/clear")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
        return handle_clear_completed_tasks(req);
      });

  // Schema
  CROW_ROUTE(app, "/admin/migrate")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_migrate(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request & /*req*/) {
  nlohmann::json response = create_success_response("RAG core API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["embedding_dimension"] = services_.chunk_store->dimension();
  return create_json_response(response);
}

crow::response Routes::handle_ingest_document(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    rag_core::IngestionRequest request = parse_ingestion_request(body);
    rag_core::IngestionService::validate(request);

    std::cout << "Ingest request for file " << request.file_id << " ("
              << rag_core::to_string(request.file_type) << ")" << std::endl;

    if (body.value("async", false)) {
      std::optional<long long> task_id = services_.ingestion_service->request_ingestion(request);
      if (!task_id) {
        nlohmann::json data = {{"file_id", request.file_id}, {"unchanged", true}};
        return create_json_response(create_success_response("Document unchanged", data));
      }
      nlohmann::json data = {{"file_id", request.file_id}, {"task_id", *task_id}};
      return create_json_response(create_success_response("Ingestion queued", data), 202);
    }

    rag_core::ChunkingHints hints;
    hints.max_chunk_chars = request.max_chunk_chars;
    size_t written =
        request.text
            ? services_.ingestion_pipeline->ingest(request.file_id, request.subject_code,
                                                   request.file_type, *request.text, hints)
            : services_.ingestion_pipeline->ingest_sections(request.file_id, request.subject_code,
                                                            request.file_type, request.sections,
                                                            hints);
    nlohmann::json data = {{"file_id", request.file_id}, {"chunks_written", written}};
    return create_json_response(create_success_response("Document ingested", data));
  } catch (const std::exception &e) {
    return create_exception_response("handle_ingest_document", e);
  }
}

crow::response Routes::handle_ingest_batch(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    if (!body.contains("documents") || !body["documents"].is_array()) {
      throw rag_core::ValidationError("documents must be an array");
    }
    std::vector<rag_core::IngestionRequest> requests;
    for (const auto &document : body.at("documents")) {
      requests.push_back(parse_ingestion_request(document));
    }

    std::cout << "Batch ingest request for " << requests.size() << " documents" << std::endl;
    auto task_ids = services_.ingestion_service->request_ingestion_batch(requests);

    nlohmann::json results = nlohmann::json::array();
    size_t queued = 0;
    for (size_t i = 0; i < requests.size(); ++i) {
      nlohmann::json entry = {{"file_id", requests[i].file_id}};
      if (task_ids[i]) {
        entry["task_id"] = *task_ids[i];
        ++queued;
      } else {
        entry["unchanged"] = true;
      }
      results.push_back(entry);
    }
    nlohmann::json data = {{"documents", results}, {"queued", queued}};
    return create_json_response(create_success_response("Batch ingestion queued", data), 202);
  } catch (const std::exception &e) {
    return create_exception_response("handle_ingest_batch", e);
  }
}

crow::response Routes::handle_get_document(const crow::request & /*req*/, long long file_id) {
  try {
    auto record = services_.document_repo->get_document(file_id);
    if (!record) {
      return create_json_response(create_error_response("Document not found"), 404);
    }
    nlohmann::json data;
    data["file_id"] = record->file_id;
    data["subject_code"] = record->subject_code ? nlohmann::json(*record->subject_code) : nullptr;
    data["file_type"] = rag_core::to_string(record->file_type);
    data["content_hash"] = record->content_hash;
    data["stage"] = rag_core::to_string(record->stage);
    data["failed_stage"] =
        record->failed_stage ? nlohmann::json(rag_core::to_string(*record->failed_stage)) : nullptr;
    data["chunk_count"] = record->chunk_count;
    data["error_message"] = record->error_message ? nlohmann::json(*record->error_message) : nullptr;
    data["created_at"] = rag_core::time_point_to_string(record->created_at);
    data["updated_at"] = rag_core::time_point_to_string(record->updated_at);
    return create_json_response(create_success_response("Document retrieved", data));
  } catch (const std::exception &e) {
    return create_exception_response("handle_get_document", e);
  }
}

crow::response Routes::handle_list_chunks(const crow::request & /*req*/, long long file_id) {
  try {
    std::vector<rag_core::Chunk> chunks = services_.chunk_store->list_by_file(file_id);
    if (chunks.empty() && !services_.document_repo->get_document(file_id)) {
      return create_json_response(create_error_response("Document not found"), 404);
    }
    nlohmann::json chunks_json = nlohmann::json::array();
    for (const auto &chunk : chunks) {
      chunks_json.push_back(chunk_to_json(chunk));
    }
    nlohmann::json data = {{"file_id", file_id}, {"chunks", chunks_json}, {"count", chunks.size()}};
    return create_json_response(create_success_response("Chunks retrieved", data));
  } catch (const std::exception &e) {
    return create_exception_response("handle_list_chunks", e);
  }
}

crow::response Routes::handle_delete_document(const crow::request &req, long long file_id) {
  try {
    std::cout << "Deleting document " << file_id << std::endl;
    if (is_truthy(req.url_params.get("async"))) {
      long long task_id = services_.ingestion_service->request_deletion(file_id);
      nlohmann::json data = {{"file_id", file_id}, {"task_id", task_id}};
      return create_json_response(create_success_response("Deletion queued", data), 202);
    }
    size_t removed = services_.ingestion_pipeline->remove(file_id);
    nlohmann::json data = {{"file_id", file_id}, {"chunks_removed", removed}};
    return create_json_response(create_success_response("Document deleted", data));
  } catch (const std::exception &e) {
    return create_exception_response("handle_delete_document", e);
  }
}

crow::response Routes::handle_retrieve(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string query = body.value("query", "");
    int k = body.value("k", 5);
    rag_core::ChunkFilter filter = parse_filter(body);

    std::cout << "Retrieve for: " << query << " with k: " << k << std::endl;
    auto results = services_.retrieval_engine->retrieve(query, filter, k);

    nlohmann::json results_json = nlohmann::json::array();
    for (const auto &scored : results) {
      nlohmann::json result_json = chunk_to_json(scored.chunk);
      result_json["score"] = scored.score;
      results_json.push_back(result_json);
    }
    nlohmann::json data = {{"results", results_json}, {"count", results.size()}};
    return create_json_response(create_success_response("Retrieval complete", data));
  } catch (const std::exception &e) {
    return create_exception_response("handle_retrieve", e);
  }
}

crow::response Routes::handle_search_documents(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string query = body.value("query", "");
    int limit = body.value("limit", 10);
    rag_core::ChunkFilter filter = parse_filter(body);

    std::cout << "Document search for: " << query << " with limit: " << limit << std::endl;
    auto hits = services_.retrieval_engine->search_documents(query, filter, limit);

    nlohmann::json hits_json = nlohmann::json::array();
    for (const auto &hit : hits) {
      nlohmann::json hit_json;
      hit_json["file_id"] = hit.file_id;
      hit_json["subject_code"] = hit.subject_code ? nlohmann::json(*hit.subject_code) : nullptr;
      hit_json["file_type"] = rag_core::to_string(hit.file_type);
      hit_json["section_label"] = hit.section_label ? nlohmann::json(*hit.section_label) : nullptr;
      hit_json["chunk_index"] = hit.chunk_index;
      hit_json["snippet"] = hit.snippet;
      hit_json["score"] = hit.score;
      hits_json.push_back(hit_json);
    }
    nlohmann::json data = {{"documents", hits_json}, {"count", hits.size()}};
    return create_json_response(create_success_response("Search complete", data));
  } catch (const std::exception &e) {
    return create_exception_response("handle_search_documents", e);
  }
}

crow::response Routes::handle_migrate(const crow::request &req) {
  try {
    rag_core::MigrationOptions options;
    if (!req.body.empty()) {
      nlohmann::json body = parse_json_body(req.body);
      options.copy_legacy = body.value("copy_legacy", false);
      options.drop_legacy = body.value("drop_legacy", false);
      options.legacy_table = body.value("legacy_table", options.legacy_table);
      if (body.contains("legacy_file_type")) {
        options.legacy_file_type =
            rag_core::file_type_from_string(body.at("legacy_file_type").get<std::string>());
      }
      options.orphan_file_id = body.value("orphan_file_id", options.orphan_file_id);
    }

    rag_core::MigrationReport report = services_.schema_migrator->migrate(options);
    if (report.copied) {
      services_.chunk_store->rebuild_index();
    }

    nlohmann::json data;
    data["created_table"] = report.created_table;
    data["legacy_found"] = report.legacy_found;
    data["copied"] = report.copied;
    data["rows_copied"] = report.rows_copied;
    data["rows_skipped"] = report.rows_skipped;
    data["legacy_dropped"] = report.legacy_dropped;
    data["already_migrated"] = report.already_migrated;
    return create_json_response(create_success_response(
        report.already_migrated ? "Schema already migrated" : "Migration complete", data));
  } catch (const std::exception &e) {
    return create_exception_response("handle_migrate", e);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response Routes::create_exception_response(const std::string &handler,
                                                 const std::exception &e) {
  const int status = http_status_for(e);
  if (status >= 500) {
    std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
  }
  return create_json_response(create_error_response(e.what()), status);
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  nlohmann::json parsed = nlohmann::json::parse(body);
  if (!parsed.is_object()) {
    throw rag_core::ValidationError("Request body must be a JSON object");
  }
  return parsed;
}

rag_core::ChunkFilter Routes::parse_filter(const nlohmann::json &body) {
  rag_core::ChunkFilter filter;
  filter.subject_code = optional_string(body, "subject_code");
  if (auto file_type = optional_string(body, "file_type")) {
    filter.file_type = rag_core::file_type_from_string(*file_type);
  }
  if (body.contains("file_id") && !body["file_id"].is_null()) {
    filter.file_id = body.at("file_id").get<long long>();
  }
  return filter;
}

nlohmann::json Routes::chunk_to_json(const rag_core::Chunk &chunk) {
  nlohmann::json chunk_json;
  chunk_json["id"] = chunk.id;
  chunk_json["file_id"] = chunk.file_id;
  chunk_json["subject_code"] = chunk.subject_code ? nlohmann::json(*chunk.subject_code) : nullptr;
  chunk_json["chunk_index"] = chunk.chunk_index;
  chunk_json["file_type"] = rag_core::to_string(chunk.file_type);
  chunk_json["section_label"] = chunk.section_label ? nlohmann::json(*chunk.section_label) : nullptr;
  chunk_json["content"] = chunk.content;
  chunk_json["created_at"] = rag_core::time_point_to_string(chunk.created_at);
  return chunk_json;
}

nlohmann::json Routes::task_to_json(const rag_core::IngestTask &task) {
  nlohmann::json task_json;
  task_json["id"] = task.id;
  task_json["task_type"] = task.task_type;
  task_json["file_id"] = task.file_id;
  task_json["subject_code"] = task.subject_code ? nlohmann::json(*task.subject_code) : nullptr;
  task_json["file_type"] =
      task.file_type ? nlohmann::json(rag_core::to_string(*task.file_type)) : nullptr;
  task_json["status"] = rag_core::to_string(task.status);
  task_json["priority"] = task.priority;
  task_json["error_message"] = task.error_message;
  task_json["created_at"] = rag_core::TaskQueueRepo::time_point_to_string(task.created_at);
  task_json["updated_at"] = rag_core::TaskQueueRepo::time_point_to_string(task.updated_at);
  return task_json;
}

// ============================================================================
// Task Management Route Handlers
// ============================================================================

crow::response Routes::handle_list_tasks(const crow::request &req) {
  try {
    std::vector<rag_core::TaskStatus> statuses;
    const char *status_param = req.url_params.get("status");
    if (status_param && *status_param) {
      try {
        statuses.push_back(rag_core::task_status_from_string(status_param));
      } catch (const std::invalid_argument &) {
        return create_json_response(
            create_error_response("Invalid status filter: " + std::string(status_param)), 400);
      }
    } else {
      statuses = {rag_core::TaskStatus::PENDING, rag_core::TaskStatus::PROCESSING,
                  rag_core::TaskStatus::COMPLETED, rag_core::TaskStatus::FAILED};
    }

    nlohmann::json tasks_json = nlohmann::json::array();
    for (const auto &status : statuses) {
      for (const auto &task : services_.task_queue_repo->get_tasks_by_status(status)) {
        tasks_json.push_back(task_to_json(task));
      }
    }

    nlohmann::json response = create_success_response("Tasks retrieved successfully");
    response["data"]["tasks"] = tasks_json;
    response["data"]["count"] = tasks_json.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_list_tasks", e);
  }
}

crow::response Routes::handle_get_task(const crow::request & /*req*/, long long task_id) {
  try {
    auto task = services_.task_queue_repo->get_task(task_id);
    if (!task) {
      return create_json_response(create_error_response("Task not found"), 404);
    }
    nlohmann::json response = create_success_response("Task status retrieved successfully");
    response["data"] = task_to_json(*task);
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_get_task", e);
  }
}

crow::response Routes::handle_get_task_progress(const crow::request & /*req*/, long long task_id) {
  try {
    auto progress = services_.task_queue_repo->get_task_progress(task_id);
    if (!progress.has_value()) {
      return create_json_response(create_error_response("Task progress not found"), 404);
    }

    nlohmann::json progress_json;
    progress_json["task_id"] = progress->task_id;
    progress_json["progress_percent"] = progress->progress_percent;
    progress_json["status_message"] = progress->status_message;
    progress_json["updated_at"] = progress->updated_at;

    nlohmann::json response = create_success_response("Task progress retrieved successfully");
    response["data"] = progress_json;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_get_task_progress", e);
  }
}

crow::response Routes::handle_clear_completed_tasks(const crow::request &req) {
  try {
    int older_than_days = 7;
    if (!req.body.empty()) {
      older_than_days = parse_json_body(req.body).value("older_than_days", 7);
    }
    if (older_than_days < 0) {
      throw rag_core::ValidationError("older_than_days must not be negative");
    }

    int removed = services_.task_queue_repo->clear_completed_tasks(older_than_days);

    nlohmann::json response = create_success_response("Completed tasks cleared successfully");
    response["data"]["older_than_days"] = older_than_days;
    response["data"]["removed"] = removed;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_clear_completed_tasks", e);
  }
}

}  // namespace rag_api
