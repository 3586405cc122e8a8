#include <cstdlib>
#include <iostream>

#include "rag_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
  try {
    const char *api_base_url = std::getenv("API_BASE_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    rag_cli::CliOptions options = rag_cli::CliHandler::parse_arguments(argc, argv);
    rag_cli::CliHandler handler(base_url);
    return handler.execute_command(options) ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
