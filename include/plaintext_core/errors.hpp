#pragma once

#include <exception>
#include <string>

namespace plaintext_core {

class PlaintextError : public std::exception {
 public:
  explicit PlaintextError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised when a source cannot be opened or a read fails before end of data
class StreamReadError : public PlaintextError {
 public:
  explicit StreamReadError(const std::string& message, const std::string& path = "")
      : PlaintextError(message), path_(path) {}

  const std::string& path() const {
    return path_;
  }

 private:
  std::string path_;
};

// Raised for a preview limit that is not a positive number of kilobytes
class InvalidLengthError : public PlaintextError {
 public:
  explicit InvalidLengthError(const std::string& message) : PlaintextError(message) {}
};

}  // namespace plaintext_core
