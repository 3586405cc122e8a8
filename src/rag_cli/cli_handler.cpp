#include "rag_cli/cli_handler.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <vector>

namespace rag_cli {

namespace {

std::string flag_value(int argc, char *argv[], int &i, const std::string &flag) {
  if (i + 1 >= argc) {
    throw CliError("Missing value for " + flag);
  }
  return argv[++i];
}

int parse_int(const std::string &value, const std::string &flag) {
  try {
    size_t pos = 0;
    int parsed = std::stoi(value, &pos);
    if (pos != value.size()) {
      throw CliError("Invalid number for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid number for " + flag + ": " + value);
  }
}

long long parse_id(const std::string &value, const std::string &flag) {
  try {
    size_t pos = 0;
    long long parsed = std::stoll(value, &pos);
    if (pos != value.size()) {
      throw CliError("Invalid id for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid id for " + flag + ": " + value);
  }
}

void require_file_id(const CliOptions &options, const std::string &usage) {
  if (!options.has_file_id) {
    throw CliError("Missing --file-id. Usage: " + usage);
  }
}

std::string shorten(const std::string &text, size_t max_len) {
  if (text.length() <= max_len) return text;
  return text.substr(0, max_len - 3) + "...";
}

std::string string_or(const nlohmann::json &object, const std::string &key,
                      const std::string &fallback) {
  if (object.contains(key) && object[key].is_string()) {
    return object[key].get<std::string>();
  }
  return fallback;
}

}  // namespace

CliHandler::CliHandler(const std::string &api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
  setup_curl_handle();
}

CliHandler::~CliHandler() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

CliHandler::CliHandler(CliHandler &&other) noexcept
    : api_base_url_(std::move(other.api_base_url_)), curl_handle_(other.curl_handle_) {
  other.curl_handle_ = nullptr;
}

CliHandler &CliHandler::operator=(CliHandler &&other) noexcept {
  if (this != &other) {
    if (curl_handle_) {
      curl_easy_cleanup(curl_handle_);
    }
    api_base_url_ = std::move(other.api_base_url_);
    curl_handle_ = other.curl_handle_;
    other.curl_handle_ = nullptr;
  }
  return *this;
}

void CliHandler::setup_curl_handle() {
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw CliError("Failed to initialize CURL");
  }
}

size_t CliHandler::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string CliHandler::read_file(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw CliError("Cannot open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];

  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
  } else if (command == "retrieve" || command == "r") {
    options.command = Command::Retrieve;
  } else if (command == "docsearch" || command == "ds") {
    options.command = Command::DocumentSearch;
    options.top_k = 10;
  } else if (command == "chunks" || command == "c") {
    options.command = Command::Chunks;
  } else if (command == "info") {
    options.command = Command::Info;
  } else if (command == "delete" || command == "d") {
    options.command = Command::Delete;
  } else if (command == "migrate") {
    options.command = Command::Migrate;
  } else if (command == "tasks" || command == "lt") {
    options.command = Command::ListTasks;
  } else if (command == "task-status" || command == "ts") {
    options.command = Command::TaskStatus;
  } else if (command == "task-progress" || command == "tp") {
    options.command = Command::TaskProgress;
  } else if (command == "clear-tasks" || command == "ct") {
    options.command = Command::ClearTasks;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];

    if (flag == "--async" || flag == "-a") {
      options.async = true;
    } else if (flag == "--copy-legacy") {
      options.copy_legacy = true;
    } else if (flag == "--drop-legacy") {
      options.drop_legacy = true;
    } else if (flag == "--file" || flag == "-f") {
      options.file_path = flag_value(argc, argv, i, flag);
    } else if (flag == "--file-id" || flag == "-F") {
      options.file_id = parse_id(flag_value(argc, argv, i, flag), flag);
      options.has_file_id = true;
    } else if (flag == "--subject" || flag == "-s") {
      options.subject_code = flag_value(argc, argv, i, flag);
    } else if (flag == "--type" || flag == "-t") {
      options.file_type = flag_value(argc, argv, i, flag);
    } else if (flag == "--query" || flag == "-q") {
      options.query = flag_value(argc, argv, i, flag);
    } else if (flag == "--top-k" || flag == "-k" || flag == "--limit" || flag == "-l") {
      options.top_k = parse_int(flag_value(argc, argv, i, flag), flag);
    } else if (flag == "--max-chunk-chars" || flag == "-m") {
      int value = parse_int(flag_value(argc, argv, i, flag), flag);
      if (value <= 0) {
        throw CliError("--max-chunk-chars must be positive");
      }
      options.max_chunk_chars = static_cast<size_t>(value);
    } else if (flag == "--status") {
      options.status_filter = flag_value(argc, argv, i, flag);
    } else if (flag == "--id" || flag == "-i") {
      options.task_id = std::to_string(parse_id(flag_value(argc, argv, i, flag), flag));
    } else if (flag == "--days") {
      options.older_than_days = parse_int(flag_value(argc, argv, i, flag), flag);
    } else if (flag == "--legacy-table") {
      options.legacy_table = flag_value(argc, argv, i, flag);
    } else {
      throw CliError("Unknown option for " + command + ": " + flag);
    }
  }

  switch (options.command) {
    case Command::Ingest:
      require_file_id(options, "ingest --file <path> --file-id <id> --type <type>");
      if (options.file_path.empty() || options.file_type.empty()) {
        throw CliError(
            "Ingest command requires a file and a type. Usage: ingest --file <path> "
            "--file-id <id> --type <type>");
      }
      break;
    case Command::Retrieve:
    case Command::DocumentSearch:
      if (options.query.empty()) {
        throw CliError("Search commands require a query. Usage: " + command + " --query <query>");
      }
      break;
    case Command::Chunks:
    case Command::Info:
    case Command::Delete:
      require_file_id(options, command + " --file-id <id>");
      break;
    case Command::TaskStatus:
    case Command::TaskProgress:
      if (options.task_id.empty()) {
        throw CliError("Task command requires a task ID. Usage: " + command + " --id <task_id>");
      }
      break;
    default:
      break;
  }

  return options;
}

bool CliHandler::execute_command(const CliOptions &options) {
  try {
    switch (options.command) {
      case Command::Ingest:
        handle_ingest_command(options);
        break;
      case Command::Retrieve:
        handle_retrieve_command(options);
        break;
      case Command::DocumentSearch:
        handle_document_search_command(options);
        break;
      case Command::Chunks:
        handle_chunks_command(options);
        break;
      case Command::Info:
        handle_info_command(options);
        break;
      case Command::Delete:
        handle_delete_command(options);
        break;
      case Command::Migrate:
        handle_migrate_command(options);
        break;
      case Command::Help:
        print_help();
        break;
      case Command::ListTasks:
        handle_list_tasks_command(options);
        break;
      case Command::TaskStatus:
        handle_task_status_command(options);
        break;
      case Command::TaskProgress:
        handle_task_progress_command(options);
        break;
      case Command::ClearTasks:
        handle_clear_tasks_command(options);
        break;
    }
  } catch (const std::exception &e) {
    print_error(e.what());
    return false;
  }
  return true;
}

nlohmann::json CliHandler::build_ingest_request(const CliOptions &options, const std::string &text) {
  nlohmann::json request_data = {
      {"file_id", options.file_id}, {"file_type", options.file_type}, {"text", text}};
  if (!options.subject_code.empty()) {
    request_data["subject_code"] = options.subject_code;
  }
  if (options.max_chunk_chars) {
    request_data["max_chunk_chars"] = *options.max_chunk_chars;
  }
  if (options.async) {
    request_data["async"] = true;
  }
  return request_data;
}

nlohmann::json CliHandler::build_filter_request(const CliOptions &options) {
  nlohmann::json request_data = {{"query", options.query}};
  if (!options.subject_code.empty()) {
    request_data["subject_code"] = options.subject_code;
  }
  if (!options.file_type.empty()) {
    request_data["file_type"] = options.file_type;
  }
  if (options.has_file_id) {
    request_data["file_id"] = options.file_id;
  }
  return request_data;
}

void CliHandler::handle_ingest_command(const CliOptions &options) {
  std::cout << "Ingesting " << options.file_path << " as document " << options.file_id << " ("
            << options.file_type << ")" << std::endl;

  nlohmann::json response =
      make_post_request("/documents", build_ingest_request(options, read_file(options.file_path)));
  print_json_response(response);
}

void CliHandler::handle_retrieve_command(const CliOptions &options) {
  std::cout << "Retrieving chunks for: " << options.query << " (k: " << options.top_k << ")"
            << std::endl;

  nlohmann::json request_data = build_filter_request(options);
  request_data["k"] = options.top_k;
  print_retrieve_response(make_post_request("/retrieve", request_data));
}

void CliHandler::handle_document_search_command(const CliOptions &options) {
  std::cout << "Document search for: " << options.query << " (limit: " << options.top_k << ")"
            << std::endl;

  nlohmann::json request_data = build_filter_request(options);
  request_data["limit"] = options.top_k;
  print_document_search_response(make_post_request("/search/documents", request_data));
}

void CliHandler::handle_chunks_command(const CliOptions &options) {
  print_chunk_list_response(
      make_get_request("/documents/" + std::to_string(options.file_id) + "/chunks"));
}

void CliHandler::handle_info_command(const CliOptions &options) {
  print_json_response(make_get_request("/documents/" + std::to_string(options.file_id)));
}

void CliHandler::handle_delete_command(const CliOptions &options) {
  std::cout << "Deleting document " << options.file_id << std::endl;
  std::string endpoint = "/documents/" + std::to_string(options.file_id);
  if (options.async) {
    endpoint += "?async=true";
  }
  print_json_response(make_delete_request(endpoint));
}

void CliHandler::handle_migrate_command(const CliOptions &options) {
  std::cout << "Running schema migration" << std::endl;
  nlohmann::json request_data = {{"copy_legacy", options.copy_legacy},
                                 {"drop_legacy", options.drop_legacy}};
  if (!options.legacy_table.empty()) {
    request_data["legacy_table"] = options.legacy_table;
  }
  if (!options.file_type.empty()) {
    request_data["legacy_file_type"] = options.file_type;
  }
  print_json_response(make_post_request("/admin/migrate", request_data));
}

// ============================================================================
// HTTP
// ============================================================================

nlohmann::json CliHandler::make_get_request(const std::string &endpoint) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }
  curl_easy_reset(curl_handle_);
  return perform_request(build_url(endpoint), nullptr);
}

nlohmann::json CliHandler::make_post_request(const std::string &endpoint,
                                             const nlohmann::json &data) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }

  std::string request_json = data.dump();
  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));

  struct curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");
  try {
    nlohmann::json response = perform_request(build_url(endpoint), headers);
    curl_slist_free_all(headers);
    return response;
  } catch (const std::exception &) {
    curl_slist_free_all(headers);
    throw;
  }
}

nlohmann::json CliHandler::make_delete_request(const std::string &endpoint) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }
  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
  return perform_request(build_url(endpoint), nullptr);
}

nlohmann::json CliHandler::perform_request(const std::string &url, struct curl_slist *headers) {
  std::string response_buffer;
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  if (headers) {
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
  }

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    std::string detail;
    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
      detail = string_or(body, "error", "");
    }
    throw CliError("HTTP request failed with status code: " + std::to_string(http_code) +
                   (detail.empty() ? "" : " (" + detail + ")"));
  }

  return nlohmann::json::parse(response_buffer);
}

void CliHandler::set_api_base_url(const std::string &url) {
  api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
  return api_base_url_;
}

std::string CliHandler::build_url(const std::string &endpoint) const {
  if (!api_base_url_.empty() && api_base_url_.back() == '/' && !endpoint.empty() &&
      endpoint.front() == '/') {
    return api_base_url_ + endpoint.substr(1);
  }
  return api_base_url_ + endpoint;
}

// ============================================================================
// Printers
// ============================================================================

void CliHandler::print_json_response(const nlohmann::json &response) {
  std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_retrieve_response(const nlohmann::json &response) {
  std::cout << "\n=== Retrieved Chunks ===" << std::endl;

  const nlohmann::json &data = response.value("data", nlohmann::json::object());
  if (!data.contains("results") || data["results"].empty()) {
    std::cout << "No results found." << std::endl;
    return;
  }

  for (const auto &chunk : data["results"]) {
    std::string content = chunk["content"].get<std::string>();
    std::cout << "  * " << chunk["file_id"].get<long long>() << ":"
              << chunk["chunk_index"].get<int>() << " ["
              << string_or(chunk, "section_label", "-") << "] "
              << string_or(chunk, "subject_code", "-") << " | Score: " << std::fixed
              << std::setprecision(3) << chunk["score"].get<float>() << std::endl;
    std::cout << "    " << shorten(content, 100) << std::endl << std::endl;
  }

  const auto &best = data["results"][0];
  std::cout << std::string(80, '=') << std::endl;
  std::cout << "BEST MATCH " << best["file_id"].get<long long>() << ":"
            << best["chunk_index"].get<int>() << std::endl;
  std::cout << std::string(80, '-') << std::endl;
  std::cout << best["content"].get<std::string>() << std::endl;
  std::cout << std::string(80, '=') << std::endl;
}

void CliHandler::print_document_search_response(const nlohmann::json &response) {
  std::cout << "\n=== Document Search Results ===" << std::endl;

  const nlohmann::json &data = response.value("data", nlohmann::json::object());
  if (!data.contains("documents") || data["documents"].empty()) {
    std::cout << "No documents found." << std::endl;
    return;
  }

  for (const auto &doc : data["documents"]) {
    std::cout << "  * Document " << doc["file_id"].get<long long>() << " ("
              << doc["file_type"].get<std::string>() << ", "
              << string_or(doc, "subject_code", "no subject") << ") score: " << std::fixed
              << std::setprecision(3) << doc["score"].get<float>() << std::endl;
    std::cout << "    " << string_or(doc, "section_label", "-") << ": "
              << shorten(doc["snippet"].get<std::string>(), 100) << std::endl;
  }
}

void CliHandler::print_chunk_list_response(const nlohmann::json &response) {
  const nlohmann::json &data = response.value("data", nlohmann::json::object());
  int count = data.value("count", 0);
  std::cout << "\n=== Chunks (" << count << ") ===" << std::endl;

  if (!data.contains("chunks")) return;
  for (const auto &chunk : data["chunks"]) {
    std::cout << "  [" << chunk["chunk_index"].get<int>() << "] "
              << string_or(chunk, "section_label", "-") << ": "
              << shorten(chunk["content"].get<std::string>(), 80) << std::endl;
  }
}

void CliHandler::print_error(const std::string &error) {
  std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
  std::cout << R"(
RAG CLI - Chunk store and retrieval client

Usage: rag_cli <command> [options]

Document Commands:
  ingest, i       Chunk, embed and store a document
    --file, -f <path>          Text file holding the extracted document text
    --file-id, -F <id>         Document id
    --type, -t <type>          pdf, pptx, docx, txt, md, csv or image
    --subject, -s <code>       Optional subject code
    --max-chunk-chars, -m <n>  Cap on characters per chunk
    --async, -a                Queue the ingestion instead of waiting

  retrieve, r     Top-k chunks for a query
    --query, -q <query>        Search query
    --top-k, -k <num>          Number of chunks to return (default: 5)
    --subject, -s <code>       Restrict to a subject
    --type, -t <type>          Restrict to a file type
    --file-id, -F <id>         Restrict to one document

  docsearch, ds   Best matching documents for a query
    --query, -q <query>        Search query
    --limit, -l <num>          Number of documents (default: 10)
    --subject, -s <code>       Restrict to a subject

  chunks, c       List the chunks of a document
    --file-id, -F <id>

  info            Show the ingestion state of a document
    --file-id, -F <id>

  delete, d       Remove a document and its chunks
    --file-id, -F <id>
    --async, -a                Queue the deletion

  migrate         Create the chunk schema and copy legacy rows
    --copy-legacy              Copy rows from the legacy table
    --drop-legacy              Drop the legacy table after copying
    --legacy-table <name>      Legacy table name (default: pdf_chunks)
    --type, -t <type>          File type assigned to legacy rows

Task Management Commands:
  tasks, lt       List tasks
    --status <status>          PENDING, PROCESSING, COMPLETED or FAILED

  task-status, ts   Show one task
    --id, -i <task_id>

  task-progress, tp Show progress of one task
    --id, -i <task_id>

  clear-tasks, ct   Clear completed tasks
    --days <num>               Older than N days (default: 7)

General:
  help, h         Show this help message

Environment Variables:
  API_BASE_URL    Base URL for the RAG API (default: http://127.0.0.1:3030)

Examples:
  rag_cli ingest --file notes.txt --file-id 7 --type txt --subject CS101
  rag_cli retrieve --query "binary search trees" --subject CS101 --top-k 3
  rag_cli docsearch --query "recursion" --limit 5
  rag_cli delete --file-id 7
  rag_cli tasks --status FAILED
)" << std::endl;
}

// ============================================================================
// Task Management Command Handlers
// ============================================================================

void CliHandler::handle_list_tasks_command(const CliOptions &options) {
  std::cout << "Listing tasks";
  if (!options.status_filter.empty()) {
    std::cout << " (status: " << options.status_filter << ")";
  }
  std::cout << std::endl;

  std::string endpoint = "/tasks";
  if (!options.status_filter.empty()) {
    endpoint += "?status=" + options.status_filter;
  }
  print_task_list_response(make_get_request(endpoint));
}

void CliHandler::handle_task_status_command(const CliOptions &options) {
  std::cout << "Getting status for task ID: " << options.task_id << std::endl;
  print_task_status_response(make_get_request("/tasks/" + options.task_id));
}

void CliHandler::handle_task_progress_command(const CliOptions &options) {
  std::cout << "Getting progress for task ID: " << options.task_id << std::endl;
  print_task_progress_response(make_get_request("/tasks/" + options.task_id + "/progress"));
}

void CliHandler::handle_clear_tasks_command(const CliOptions &options) {
  std::cout << "Clearing completed tasks older than " << options.older_than_days << " days"
            << std::endl;
  nlohmann::json request_data = {{"older_than_days", options.older_than_days}};
  print_json_response(make_post_request("/tasks/clear", request_data));
}

void CliHandler::print_task_list_response(const nlohmann::json &response) {
  std::cout << "\n=== Task Queue ===" << std::endl;

  if (!response.value("success", false) || !response.contains("data")) {
    std::cout << "Unexpected response format." << std::endl;
    return;
  }

  const auto &tasks = response["data"]["tasks"];
  int count = response["data"].value("count", 0);
  if (count == 0) {
    std::cout << "No tasks found." << std::endl;
    return;
  }

  std::cout << "Found " << count << " task(s):\n" << std::endl;

  std::map<std::string, std::vector<nlohmann::json>> tasks_by_status;
  for (const auto &task : tasks) {
    tasks_by_status[task["status"].get<std::string>()].push_back(task);
  }

  for (const auto &[status, status_tasks] : tasks_by_status) {
    std::cout << "=== " << status << " (" << status_tasks.size() << ") ===" << std::endl;
    for (const auto &task : status_tasks) {
      std::cout << "  ID: " << task["id"].get<long long>()
                << " | Type: " << task["task_type"].get<std::string>()
                << " | Document: " << task["file_id"].get<long long>()
                << " | Priority: " << task["priority"].get<int>();
      std::string error = string_or(task, "error_message", "");
      if (!error.empty()) {
        std::cout << " | Error: " << shorten(error, 50);
      }
      std::cout << std::endl;
      std::cout << "    Created: " << task["created_at"].get<std::string>()
                << " | Updated: " << task["updated_at"].get<std::string>() << std::endl;
    }
  }
}

void CliHandler::print_task_status_response(const nlohmann::json &response) {
  std::cout << "\n=== Task Status ===" << std::endl;
  if (!response.contains("data")) {
    std::cout << "Unexpected response format." << std::endl;
    return;
  }

  const auto &task = response["data"];
  std::cout << "Task ID: " << task["id"].get<long long>() << std::endl;
  std::cout << "Type: " << task["task_type"].get<std::string>() << std::endl;
  std::cout << "Status: " << task["status"].get<std::string>() << std::endl;
  std::cout << "Document: " << task["file_id"].get<long long>() << std::endl;
  std::cout << "Priority: " << task["priority"].get<int>() << std::endl;
  std::string error = string_or(task, "error_message", "");
  if (!error.empty()) {
    std::cout << "Error: " << error << std::endl;
  }
  std::cout << "Created: " << task["created_at"].get<std::string>() << std::endl;
  std::cout << "Updated: " << task["updated_at"].get<std::string>() << std::endl;
}

void CliHandler::print_task_progress_response(const nlohmann::json &response) {
  std::cout << "\n=== Task Progress ===" << std::endl;
  if (!response.contains("data")) {
    std::cout << "Unexpected response format." << std::endl;
    return;
  }

  const auto &progress = response["data"];
  // Stored as a fraction in [0, 1].
  float fraction = std::clamp(progress["progress_percent"].get<float>(), 0.0f, 1.0f);
  float percent = fraction * 100.0f;
  std::cout << "Task ID: " << progress["task_id"].get<long long>() << std::endl;
  std::cout << "Progress: " << std::fixed << std::setprecision(1) << percent << "%" << std::endl;

  const int bar_width = 50;
  int filled = static_cast<int>(fraction * bar_width);
  std::cout << "[" << std::string(filled, '#') << std::string(bar_width - filled, ' ') << "]"
            << std::endl;
  std::cout << "Status: " << string_or(progress, "status_message", "") << std::endl;
  std::cout << "Updated: " << progress["updated_at"].get<std::string>() << std::endl;
}

}  // namespace rag_cli
