#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rag_cli/cli_handler.hpp"

namespace rag_tests {

using namespace rag_cli;

namespace {

// Owns argv storage for parse_arguments.
class Args {
 public:
  Args(std::initializer_list<std::string> args) : storage_(args) {
    storage_.insert(storage_.begin(), "rag_cli");
    for (auto& arg : storage_) {
      pointers_.push_back(arg.data());
    }
  }
  int argc() {
    return static_cast<int>(pointers_.size());
  }
  char** argv() {
    return pointers_.data();
  }

 private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

CliOptions parse(std::initializer_list<std::string> args) {
  Args a(args);
  return CliHandler::parse_arguments(a.argc(), a.argv());
}

}  // namespace

TEST(CliHandlerTest, NoArgumentsShowsHelp) {
  char program[] = "rag_cli";
  char* argv[] = {program, nullptr};
  EXPECT_EQ(CliHandler::parse_arguments(1, argv).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST(CliHandlerTest, ParsesIngest) {
  CliOptions options = parse({"ingest", "--file", "notes.txt", "--file-id", "7", "--type", "pdf",
                              "--subject", "CS101", "-m", "300", "--async"});
  EXPECT_EQ(options.command, Command::Ingest);
  EXPECT_EQ(options.file_path, "notes.txt");
  EXPECT_TRUE(options.has_file_id);
  EXPECT_EQ(options.file_id, 7);
  EXPECT_EQ(options.file_type, "pdf");
  EXPECT_EQ(options.subject_code, "CS101");
  EXPECT_EQ(options.max_chunk_chars, std::optional<size_t>(300));
  EXPECT_TRUE(options.async);
}

TEST(CliHandlerTest, IngestRequiresFileIdFileAndType) {
  EXPECT_THROW(parse({"ingest", "--file", "a.txt", "--type", "pdf"}), CliError);
  EXPECT_THROW(parse({"ingest", "--file-id", "1", "--type", "pdf"}), CliError);
  EXPECT_THROW(parse({"i", "--file", "a.txt", "-F", "1"}), CliError);
}

TEST(CliHandlerTest, ParsesRetrieveWithShortFlags) {
  CliOptions options = parse({"r", "-q", "binary trees", "-k", "3", "-s", "CS101", "-t", "slide"});
  EXPECT_EQ(options.command, Command::Retrieve);
  EXPECT_EQ(options.query, "binary trees");
  EXPECT_EQ(options.top_k, 3);
  EXPECT_EQ(options.subject_code, "CS101");
  EXPECT_EQ(options.file_type, "slide");
  EXPECT_FALSE(options.has_file_id);
}

TEST(CliHandlerTest, DefaultLimits) {
  EXPECT_EQ(parse({"retrieve", "--query", "x"}).top_k, 5);
  EXPECT_EQ(parse({"docsearch", "--query", "x"}).top_k, 10);
  EXPECT_EQ(parse({"ds", "--query", "x", "--limit", "2"}).top_k, 2);
}

TEST(CliHandlerTest, SearchRequiresQuery) {
  EXPECT_THROW(parse({"retrieve"}), CliError);
  EXPECT_THROW(parse({"docsearch", "-k", "4"}), CliError);
}

TEST(CliHandlerTest, DocumentCommandsRequireFileId) {
  EXPECT_EQ(parse({"chunks", "--file-id", "9"}).command, Command::Chunks);
  EXPECT_EQ(parse({"info", "-F", "9"}).command, Command::Info);
  EXPECT_EQ(parse({"d", "-F", "9", "-a"}).command, Command::Delete);
  EXPECT_THROW(parse({"chunks"}), CliError);
  EXPECT_THROW(parse({"info"}), CliError);
  EXPECT_THROW(parse({"delete"}), CliError);
}

TEST(CliHandlerTest, ParsesTaskCommands) {
  CliOptions list = parse({"tasks", "--status", "FAILED"});
  EXPECT_EQ(list.command, Command::ListTasks);
  EXPECT_EQ(list.status_filter, "FAILED");

  CliOptions status = parse({"ts", "--id", "42"});
  EXPECT_EQ(status.command, Command::TaskStatus);
  EXPECT_EQ(status.task_id, "42");

  EXPECT_EQ(parse({"task-progress", "-i", "5"}).command, Command::TaskProgress);
  EXPECT_THROW(parse({"task-status"}), CliError);

  CliOptions clear = parse({"ct", "--days", "0"});
  EXPECT_EQ(clear.command, Command::ClearTasks);
  EXPECT_EQ(clear.older_than_days, 0);
  EXPECT_EQ(parse({"clear-tasks"}).older_than_days, 7);
}

TEST(CliHandlerTest, ParsesMigrate) {
  CliOptions options =
      parse({"migrate", "--copy-legacy", "--drop-legacy", "--legacy-table", "old_chunks"});
  EXPECT_EQ(options.command, Command::Migrate);
  EXPECT_TRUE(options.copy_legacy);
  EXPECT_TRUE(options.drop_legacy);
  EXPECT_EQ(options.legacy_table, "old_chunks");
}

TEST(CliHandlerTest, RejectsBadInput) {
  EXPECT_THROW(parse({"summarize"}), CliError);
  EXPECT_THROW(parse({"retrieve", "-q", "x", "--verbose"}), CliError);
  EXPECT_THROW(parse({"retrieve", "-q"}), CliError);
  EXPECT_THROW(parse({"retrieve", "-q", "x", "-k", "three"}), CliError);
  EXPECT_THROW(parse({"chunks", "--file-id", "12abc"}), CliError);
  EXPECT_THROW(parse({"ingest", "-f", "a", "-F", "1", "-t", "pdf", "-m", "0"}), CliError);
}

TEST(CliHandlerTest, BuildIngestRequest) {
  CliOptions options = parse({"ingest", "-f", "a.txt", "-F", "7", "-t", "doc", "-s", "CS101"});
  nlohmann::json request = CliHandler::build_ingest_request(options, "# Title\nbody");

  EXPECT_EQ(request["file_id"], 7);
  EXPECT_EQ(request["file_type"], "doc");
  EXPECT_EQ(request["text"], "# Title\nbody");
  EXPECT_EQ(request["subject_code"], "CS101");
  EXPECT_FALSE(request.contains("max_chunk_chars"));
  EXPECT_FALSE(request.contains("async"));
}

TEST(CliHandlerTest, BuildFilterRequestOnlySetsGivenFilters) {
  nlohmann::json bare = CliHandler::build_filter_request(parse({"retrieve", "-q", "graphs"}));
  EXPECT_EQ(bare, nlohmann::json({{"query", "graphs"}}));

  nlohmann::json full = CliHandler::build_filter_request(
      parse({"retrieve", "-q", "graphs", "-s", "CS101", "-t", "pdf", "-F", "3"}));
  EXPECT_EQ(full["subject_code"], "CS101");
  EXPECT_EQ(full["file_type"], "pdf");
  EXPECT_EQ(full["file_id"], 3);
}

TEST(CliHandlerTest, BuildUrlJoinsSlashes) {
  CliHandler handler("http://127.0.0.1:3030");
  EXPECT_EQ(handler.build_url("/retrieve"), "http://127.0.0.1:3030/retrieve");

  handler.set_api_base_url("http://127.0.0.1:3030/");
  EXPECT_EQ(handler.get_api_base_url(), "http://127.0.0.1:3030/");
  EXPECT_EQ(handler.build_url("/retrieve"), "http://127.0.0.1:3030/retrieve");
}

TEST(CliHandlerTest, ExecuteReportsFailureForUnreadableFile) {
  CliHandler handler("http://127.0.0.1:3030");
  CliOptions options =
      parse({"ingest", "-f", "/nonexistent/input.txt", "-F", "1", "-t", "text"});
  EXPECT_FALSE(handler.execute_command(options));
}

TEST(CliHandlerTest, ExecuteReportsFailureWhenServerUnreachable) {
  // Port 1 is reserved and nothing listens there.
  CliHandler handler("http://127.0.0.1:1");
  EXPECT_FALSE(handler.execute_command(parse({"tasks"})));
}

TEST(CliHandlerTest, HelpAlwaysSucceeds) {
  CliHandler handler("http://127.0.0.1:1");
  EXPECT_TRUE(handler.execute_command(parse({"help"})));
}

TEST(CliHandlerTest, MoveTransfersHandle) {
  CliHandler first("http://a:1");
  CliHandler second(std::move(first));
  EXPECT_EQ(second.get_api_base_url(), "http://a:1");
}

}  // namespace rag_tests
