#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "plaintext_cli/config.hpp"
#include "plaintext_core/plaintext_classifier.hpp"

namespace plaintext_cli {

// Process exit codes
constexpr int EXIT_ALL_PLAINTEXT = 0;
constexpr int EXIT_FOUND_BINARY = 1;
constexpr int EXIT_ERROR = 2;

struct CliOptions {
  std::vector<std::string> paths;  // "-" reads standard input, at most once
  std::optional<int> preview_kb;
  std::string config_path;
  bool verbose = false;
  bool help = false;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(std::ostream& out = std::cout,
                      std::ostream& err = std::cerr,
                      std::istream& in = std::cin);

  CliHandler(const CliHandler&) = delete;
  CliHandler& operator=(const CliHandler&) = delete;

  // Parse command line arguments
  static CliOptions parse_arguments(int argc, char* argv[]);

  // Config file (or defaults) with command line overrides applied
  static Config resolve_config(const CliOptions& options);

  // Classify every input and return the process exit code
  int execute(const CliOptions& options);

  void print_help(const std::string& program_name = "plaintext_check");

 private:
  std::ostream& out_;
  std::ostream& err_;
  std::istream& in_;

  bool classify_input(const plaintext_core::PlaintextClassifier& classifier,
                      const std::string& path,
                      const Config& config);
  bool classify_preview(const plaintext_core::PlaintextClassifier& classifier,
                        plaintext_core::ByteStream& source,
                        const std::string& label,
                        const Config& config);
  void print_error(const std::string& error);
};

}  // namespace plaintext_cli
