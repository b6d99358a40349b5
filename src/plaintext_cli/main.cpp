#include <iostream>

#include "plaintext_cli/cli_handler.hpp"

int main(int argc, char* argv[]) {
  try {
    plaintext_cli::CliHandler handler;

    plaintext_cli::CliOptions options = plaintext_cli::CliHandler::parse_arguments(argc, argv);

    return handler.execute(options);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return plaintext_cli::EXIT_ERROR;
  }
}
