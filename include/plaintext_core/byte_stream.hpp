#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace plaintext_core {

/**
 * ByteStream models a finite, non-rewindable source of bytes.
 */
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  /**
   * @brief Reads up to max_len bytes into buffer.
   * @return The number of bytes read, 0 once the stream is exhausted.
   * @throws StreamReadError on any failure other than end of data.
   */
  virtual size_t read(char* buffer, size_t max_len) = 0;
};

class MemoryByteStream : public ByteStream {
 public:
  explicit MemoryByteStream(std::string data) : data_(std::move(data)), offset_(0) {}

  size_t read(char* buffer, size_t max_len) override;

 private:
  std::string data_;
  size_t offset_;
};

// Adapts a std::istream. The stream is borrowed and must outlive the adapter.
class IStreamByteStream : public ByteStream {
 public:
  explicit IStreamByteStream(std::istream& in, std::string name = "<stream>")
      : in_(in), name_(std::move(name)) {}

  size_t read(char* buffer, size_t max_len) override;

 private:
  std::istream& in_;
  std::string name_;
};

// Owns an open file handle; the file is closed when the stream is destroyed.
class FileByteStream : public ByteStream {
 public:
  explicit FileByteStream(const fs::path& file_path);

  FileByteStream(const FileByteStream&) = delete;
  FileByteStream& operator=(const FileByteStream&) = delete;

  size_t read(char* buffer, size_t max_len) override;

  const fs::path& path() const {
    return path_;
  }

 private:
  fs::path path_;
  std::ifstream file_;
  IStreamByteStream reader_;
};

/**
 * @brief Bounded view over another stream.
 *
 * Yields at most `limit` bytes. Requests to the inner stream are clamped to the
 * remaining allowance, so nothing past the limit is ever pulled from it.
 */
class LimitedByteStream : public ByteStream {
 public:
  LimitedByteStream(ByteStream& inner, std::uint64_t limit) : inner_(inner), remaining_(limit) {}

  size_t read(char* buffer, size_t max_len) override;

  std::uint64_t remaining() const {
    return remaining_;
  }

 private:
  ByteStream& inner_;
  std::uint64_t remaining_;
};

/**
 * @brief Drains a stream into a buffer, chunk_size bytes at a time.
 *
 * Read failures propagate unchanged. Throws std::invalid_argument for a zero
 * chunk size.
 */
std::string read_all(ByteStream& stream, size_t chunk_size, size_t initial_capacity = 0);

}  // namespace plaintext_core
