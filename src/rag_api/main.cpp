#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "rag_api/config.hpp"
#include "rag_api/routes.hpp"
#include "rag_api/server.hpp"
#include "rag_core/async/service_provider.hpp"
#include "rag_core/async/worker_pool.hpp"
#include "rag_core/chunking/chunker.hpp"
#include "rag_core/db/chunk_store.hpp"
#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/document_repo.hpp"
#include "rag_core/db/schema_migrator.hpp"
#include "rag_core/db/task_queue_repo.hpp"
#include "rag_core/llm/embedding_adapter.hpp"
#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/services/ingestion_pipeline.hpp"
#include "rag_core/services/ingestion_service.hpp"
#include "rag_core/services/retrieval_engine.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main() {
  try {
    const std::string config_path = Config::resolve_path();
    Config config = Config::from_file(config_path);

    std::cout << "Starting RAG core API Server..." << std::endl;
    std::cout << "Config file: " << config_path << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " ("
              << config.embedding_dimension << " dimensions)" << std::endl;
    std::cout << "Similarity Index: " << config.similarity_index << std::endl;

    // --- 1. STORAGE ---
    rag_core::DatabaseManager db_manager;
    db_manager.initialize(config.database_path, config.db_pool_size);

    auto schema_migrator =
        std::make_shared<rag_core::SchemaMigrator>(db_manager, config.embedding_dimension);
    if (config.migrate_on_startup) {
      rag_core::MigrationReport report = schema_migrator->migrate(config.startup_migration_options());
      std::cout << "Schema migration: "
                << (report.already_migrated ? "already up to date" : "applied")
                << ", rows copied: " << report.rows_copied
                << ", rows skipped: " << report.rows_skipped << std::endl;
    }

    auto chunk_store = std::make_shared<rag_core::ChunkStore>(
        db_manager, config.embedding_dimension, config.index_options());
    auto document_repo = std::make_shared<rag_core::DocumentRepo>(db_manager);
    auto task_queue_repo = std::make_shared<rag_core::TaskQueueRepo>(db_manager);
    int requeued = task_queue_repo->requeue_interrupted_tasks();
    if (requeued > 0) {
      std::cout << "Requeued " << requeued << " interrupted tasks" << std::endl;
    }

    // --- 2. EMBEDDING PROVIDER ---
    auto ollama_client = std::make_shared<rag_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.embedding_timeout_seconds);
    auto embedding_adapter =
        std::make_shared<rag_core::EmbeddingAdapter>(ollama_client, config.embedding_dimension);
    if (ollama_client->is_server_available()) {
      embedding_adapter->verify_dimension();
    }

    // --- 3. SERVICES ---
    auto chunker = std::make_shared<rag_core::Chunker>(config.max_chunk_chars);
    auto ingestion_pipeline = std::make_shared<rag_core::IngestionPipeline>(
        chunk_store, chunker, embedding_adapter, document_repo, config.retry_policy());
    auto ingestion_service =
        std::make_shared<rag_core::IngestionService>(document_repo, task_queue_repo);
    auto retrieval_engine =
        std::make_shared<rag_core::RetrievalEngine>(chunk_store, embedding_adapter);

    auto services = std::make_shared<rag_core::ServiceProvider>(ingestion_pipeline, task_queue_repo);
    auto worker_pool =
        std::make_shared<rag_core::async::WorkerPool>(config.num_workers, services);

    auto [host, port] = rag_api::Server::parse_host_port(config.api_base_url);
    rag_api::Server server(host, port);
    rag_api::Routes routes({.chunk_store = chunk_store,
                            .document_repo = document_repo,
                            .ingestion_pipeline = ingestion_pipeline,
                            .ingestion_service = ingestion_service,
                            .retrieval_engine = retrieval_engine,
                            .schema_migrator = schema_migrator,
                            .task_queue_repo = task_queue_repo});
    routes.register_routes(server);

    // --- 4. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    worker_pool->start();
    server.start();
    std::cout << "Server listening on " << server.host() << ":" << server.port()
              << ". Press Ctrl+C to exit." << std::endl;

    // --- 5. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 6. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Stopping worker pool to finish processing..." << std::endl;
    worker_pool->stop();
    worker_pool.reset();  // Joins the worker threads

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
