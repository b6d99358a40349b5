#include "plaintext_cli/cli_handler.hpp"

#include <algorithm>
#include <memory>
#include <string>

#include "plaintext_core/byte_stream.hpp"
#include "plaintext_core/errors.hpp"
#include "plaintext_core/utf8_text.hpp"

namespace plaintext_cli {

namespace {

int parse_preview_kb(const std::string& value) {
  size_t consumed = 0;
  int preview_kb = 0;
  try {
    preview_kb = std::stoi(value, &consumed);
  } catch (const std::exception&) {
    throw CliError("Invalid value for --preview-kb: " + value);
  }
  if (consumed != value.size()) {
    throw CliError("Invalid value for --preview-kb: " + value);
  }
  if (preview_kb <= 0) {
    throw CliError("invalid length: --preview-kb must be greater than 0");
  }
  return preview_kb;
}

}  // namespace

CliHandler::CliHandler(std::ostream& out, std::ostream& err, std::istream& in)
    : out_(out), err_(err), in_(in) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  bool literal_mode = false;

  for (int i = 1; i < argc; ++i) {
    std::string argument = argv[i];
    if (!literal_mode) {
      if (argument == "--") {
        literal_mode = true;
        continue;
      }
      if (argument == "-h" || argument == "--help") {
        options.help = true;
        continue;
      }
      if (argument == "-v" || argument == "--verbose") {
        options.verbose = true;
        continue;
      }
      if (argument == "-p" || argument == "--preview-kb") {
        if (i + 1 >= argc) {
          throw CliError("Option " + argument + " requires a value. Usage: --preview-kb <kb>");
        }
        options.preview_kb = parse_preview_kb(argv[++i]);
        continue;
      }
      if (argument == "-c" || argument == "--config") {
        if (i + 1 >= argc) {
          throw CliError("Option " + argument + " requires a value. Usage: --config <file>");
        }
        options.config_path = argv[++i];
        continue;
      }
      if (argument.size() > 1 && argument.front() == '-') {
        throw CliError("Unknown option: " + argument);
      }
    }
    if (argument == "-" &&
        std::find(options.paths.begin(), options.paths.end(), "-") != options.paths.end()) {
      throw CliError("Standard input (-) can only be given once");
    }
    options.paths.push_back(argument);
  }

  if (!options.help && options.paths.empty()) {
    throw CliError("Missing path argument. Usage: plaintext_check [options] <path>...");
  }
  return options;
}

Config CliHandler::resolve_config(const CliOptions& options) {
  Config config = options.config_path.empty() ? Config::defaults()
                                              : Config::from_file(options.config_path);
  if (options.preview_kb) {
    config.preview_kb = *options.preview_kb;
  }
  if (options.verbose) {
    config.verbose = true;
  }
  return config;
}

int CliHandler::execute(const CliOptions& options) {
  if (options.help) {
    print_help();
    return EXIT_ALL_PLAINTEXT;
  }

  const Config config = resolve_config(options);
  const plaintext_core::PlaintextClassifier classifier(config.classifier_options());

  bool found_binary = false;
  bool had_error = false;
  for (const auto& path : options.paths) {
    try {
      if (!classify_input(classifier, path, config)) {
        found_binary = true;
      }
    } catch (const plaintext_core::PlaintextError& e) {
      print_error(e.what());
      had_error = true;
    }
  }

  if (had_error) {
    return EXIT_ERROR;
  }
  return found_binary ? EXIT_FOUND_BINARY : EXIT_ALL_PLAINTEXT;
}

bool CliHandler::classify_input(const plaintext_core::PlaintextClassifier& classifier,
                                const std::string& path,
                                const Config& config) {
  const bool from_stdin = path == "-";
  const std::string label = from_stdin ? "<stdin>" : path;

  if (config.verbose) {
    out_ << "Classifying " << label;
    if (config.preview_kb > 0) {
      out_ << " (first " << config.preview_kb << " KB)";
    }
    out_ << std::endl;
  }

  bool is_plaintext = false;
  if (config.preview_kb > 0) {
    // Opened once; the verdict and the cut diagnostic share the same bytes
    std::unique_ptr<plaintext_core::ByteStream> source;
    if (from_stdin) {
      source = std::make_unique<plaintext_core::IStreamByteStream>(in_, label);
    } else {
      source = std::make_unique<plaintext_core::FileByteStream>(path);
    }
    is_plaintext = classify_preview(classifier, *source, label, config);
  } else {
    is_plaintext = from_stdin ? classifier.classify_stream(in_) : classifier.classify_file(path);
    out_ << label << ": " << (is_plaintext ? "plaintext" : "binary") << std::endl;
  }
  return is_plaintext;
}

bool CliHandler::classify_preview(const plaintext_core::PlaintextClassifier& classifier,
                                  plaintext_core::ByteStream& source,
                                  const std::string& label,
                                  const Config& config) {
  plaintext_core::LimitedByteStream preview(
      source, plaintext_core::PlaintextClassifier::preview_limit_bytes(config.preview_kb));
  const std::string prefix = plaintext_core::read_all(preview, classifier.options().read_chunk_size);

  const bool is_plaintext = classifier.classify_bytes(prefix);
  out_ << label << ": " << (is_plaintext ? "plaintext" : "binary") << std::endl;

  if (!is_plaintext && config.verbose) {
    const size_t cut_bytes = plaintext_core::incomplete_tail_length(prefix);
    if (cut_bytes > 0) {
      err_ << "Warning: preview of " << label << " ends inside a multi-byte sequence ("
           << cut_bytes << " trailing byte(s)); a larger --preview-kb may classify it as plaintext"
           << std::endl;
    }
  }
  return is_plaintext;
}

void CliHandler::print_error(const std::string& error) {
  err_ << "Error: " << error << std::endl;
}

void CliHandler::print_help(const std::string& program_name) {
  out_ << "Usage: " << program_name << " [options] <path>...\n"
       << "\n"
       << "Report whether each input is plaintext (UTF-8 text without control\n"
       << "characters other than newline, carriage return and tab) or binary.\n"
       << "Use - to read standard input.\n"
       << "\n"
       << "Options:\n"
       << "  -p, --preview-kb <kb>  Only inspect the first <kb> kilobytes of each input\n"
       << "  -c, --config <file>    Load settings from a JSON config file\n"
       << "  -v, --verbose          Print progress and preview diagnostics\n"
       << "  -h, --help             Show this help message and exit\n"
       << "\n"
       << "Exit status: 0 all plaintext, 1 binary input found, 2 error.\n";
}

}  // namespace plaintext_cli
