#include "plaintext_core/byte_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "plaintext_core/errors.hpp"

namespace plaintext_core {

size_t MemoryByteStream::read(char* buffer, size_t max_len) {
  if (offset_ >= data_.size() || max_len == 0) {
    return 0;
  }
  size_t to_copy = std::min(data_.size() - offset_, max_len);
  std::memcpy(buffer, data_.data() + offset_, to_copy);
  offset_ += to_copy;
  return to_copy;
}

size_t IStreamByteStream::read(char* buffer, size_t max_len) {
  if (max_len == 0 || in_.eof()) {
    return 0;
  }

  in_.read(buffer, static_cast<std::streamsize>(max_len));
  const std::streamsize read_count = in_.gcount();

  // A short read at end of data sets failbit together with eofbit; anything
  // else that leaves the stream failed is a genuine read error.
  if (in_.bad() || (in_.fail() && !in_.eof())) {
    throw StreamReadError("Failed to read from " + name_, name_);
  }
  return static_cast<size_t>(read_count);
}

FileByteStream::FileByteStream(const fs::path& file_path)
    : path_(file_path), file_(file_path, std::ios::binary), reader_(file_, file_path.string()) {
  if (!file_.is_open()) {
    const int open_errno = errno;
    throw StreamReadError("Could not open file: " + path_.string() + ": " +
                              std::generic_category().message(open_errno),
                          path_.string());
  }

  std::error_code ec;
  if (fs::is_directory(path_, ec)) {
    throw StreamReadError("Could not open file: " + path_.string() + ": Is a directory",
                          path_.string());
  }
}

size_t FileByteStream::read(char* buffer, size_t max_len) {
  return reader_.read(buffer, max_len);
}

size_t LimitedByteStream::read(char* buffer, size_t max_len) {
  if (remaining_ == 0 || max_len == 0) {
    return 0;
  }
  const size_t request = static_cast<size_t>(std::min<std::uint64_t>(max_len, remaining_));
  const size_t read_count = inner_.read(buffer, request);
  remaining_ -= read_count;
  return read_count;
}

std::string read_all(ByteStream& stream, size_t chunk_size, size_t initial_capacity) {
  if (chunk_size == 0) {
    throw std::invalid_argument("read_all: chunk_size must be greater than 0");
  }

  std::string data;
  if (initial_capacity > 0) {
    data.reserve(initial_capacity);
  }

  std::vector<char> scratch(chunk_size);
  while (true) {
    size_t read_count = stream.read(scratch.data(), scratch.size());
    if (read_count == 0) {
      break;
    }
    data.append(scratch.data(), read_count);
  }
  return data;
}

}  // namespace plaintext_core
