#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace rag_cli {

enum class Command {
  Ingest,
  Retrieve,
  DocumentSearch,
  Chunks,
  Info,
  Delete,
  Migrate,
  Help,
  // Task management
  ListTasks,
  TaskStatus,
  TaskProgress,
  ClearTasks
};

struct CliOptions {
  Command command = Command::Help;
  std::string file_path;
  long long file_id = 0;
  bool has_file_id = false;
  std::string subject_code;
  std::string file_type;
  std::string query;
  int top_k = 5;
  std::optional<size_t> max_chunk_chars;
  bool async = false;
  std::string status_filter;
  std::string task_id;
  int older_than_days = 7;
  // migrate
  bool copy_legacy = false;
  bool drop_legacy = false;
  std::string legacy_table;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(const std::string &api_base_url);
  ~CliHandler();

  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  CliHandler(CliHandler &&) noexcept;
  CliHandler &operator=(CliHandler &&) noexcept;

  // Throws CliError on unknown commands or missing required flags.
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Returns false when the API call behind the command failed.
  bool execute_command(const CliOptions &options);

  void set_api_base_url(const std::string &url);
  std::string get_api_base_url() const;

  // Exposed for tests.
  static nlohmann::json build_ingest_request(const CliOptions &options, const std::string &text);
  static nlohmann::json build_filter_request(const CliOptions &options);
  std::string build_url(const std::string &endpoint) const;

 private:
  std::string api_base_url_;
  CURL *curl_handle_;

  // Command handlers
  void handle_ingest_command(const CliOptions &options);
  void handle_retrieve_command(const CliOptions &options);
  void handle_document_search_command(const CliOptions &options);
  void handle_chunks_command(const CliOptions &options);
  void handle_info_command(const CliOptions &options);
  void handle_delete_command(const CliOptions &options);
  void handle_migrate_command(const CliOptions &options);
  void handle_list_tasks_command(const CliOptions &options);
  void handle_task_status_command(const CliOptions &options);
  void handle_task_progress_command(const CliOptions &options);
  void handle_clear_tasks_command(const CliOptions &options);

  // HTTP methods
  nlohmann::json make_get_request(const std::string &endpoint);
  nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
  nlohmann::json make_delete_request(const std::string &endpoint);
  nlohmann::json perform_request(const std::string &url, struct curl_slist *headers);

  void setup_curl_handle();
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  static std::string read_file(const std::string &path);

  void print_json_response(const nlohmann::json &response);
  void print_retrieve_response(const nlohmann::json &response);
  void print_document_search_response(const nlohmann::json &response);
  void print_chunk_list_response(const nlohmann::json &response);
  void print_task_list_response(const nlohmann::json &response);
  void print_task_status_response(const nlohmann::json &response);
  void print_task_progress_response(const nlohmann::json &response);
  void print_error(const std::string &error);
  void print_help();
};

}  // namespace rag_cli
