#pragma once

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "plaintext_core/plaintext_classifier.hpp"

namespace plaintext_cli {

class Config {
 public:
  // 0 classifies whole inputs; otherwise the preview size in kilobytes
  int preview_kb;
  int read_chunk_size;
  bool verbose;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    try {
      config.preview_kb = read_int(json_config, "preview_kb", 0);
      config.read_chunk_size = read_int(json_config, "read_chunk_size", 1024);
      config.verbose = json_config.value("verbose", false);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value in config: ") + e.what());
    }

    config.validate();
    return config;
  }

  static Config defaults() {
    return from_json(nlohmann::json::object());
  }

  plaintext_core::ClassifierOptions classifier_options() const {
    plaintext_core::ClassifierOptions options;
    options.read_chunk_size = static_cast<size_t>(read_chunk_size);
    return options;
  }

 private:
  // Integer keys must be JSON integers that fit in an int; no silent narrowing
  static int read_int(const nlohmann::json& json_config, const std::string& key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const nlohmann::json& value = json_config.at(key);
    if (!value.is_number_integer()) {
      throw std::runtime_error(key + " must be an integer");
    }

    if (value.is_number_unsigned()) {
      if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(key + " is out of range");
      }
    } else {
      const std::int64_t raw = value.get<std::int64_t>();
      if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        throw std::runtime_error(key + " is out of range");
      }
    }
    return static_cast<int>(value.get<std::int64_t>());
  }

  void validate() const {
    if (preview_kb < 0) {
      throw std::runtime_error("preview_kb cannot be negative");
    }
    if (read_chunk_size <= 0) {
      throw std::runtime_error("read_chunk_size must be greater than 0");
    }
  }
};

}  // namespace plaintext_cli
