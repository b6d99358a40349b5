#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string_view>
#include <vector>

#include "plaintext_core/byte_stream.hpp"
#include "plaintext_core/errors.hpp"

namespace fs = std::filesystem;

namespace plaintext_core {

struct ClassifierOptions {
  // Bytes requested from the source per read call
  size_t read_chunk_size = 1024;
  // Initial reservation for the accumulated buffer, clamped to the preview limit
  size_t initial_capacity = 32 * 1024;
};

/**
 * @brief Classifies byte sources as plaintext (clean UTF-8 text) or binary.
 *
 * Every operation reduces to the same predicate over the collected bytes, so the
 * verdict never depends on where the bytes came from. Instances only hold
 * immutable options and can be shared between threads.
 *
 * Preview operations look at the first max_kb * 1024 bytes only. If that cut
 * lands inside a multi-byte UTF-8 sequence, the truncated sequence is invalid
 * and the preview is classified as binary even when the full input is text.
 */
class PlaintextClassifier {
 public:
  static constexpr std::uint64_t BYTES_PER_KB = 1024;

  PlaintextClassifier() = default;
  explicit PlaintextClassifier(const ClassifierOptions& options);

  const ClassifierOptions& options() const {
    return options_;
  }

  // In-memory buffers; never throws.
  bool classify_bytes(std::string_view data) const;
  bool classify_bytes(const std::vector<std::uint8_t>& data) const;

  /**
   * @brief Reads the stream to its end and classifies everything read.
   * @throws StreamReadError if a read fails.
   */
  bool classify_stream(ByteStream& stream) const;
  bool classify_stream(std::istream& in) const;

  /**
   * @brief Classifies at most the first max_kb kilobytes of the stream.
   * @throws InvalidLengthError if max_kb <= 0.
   * @throws StreamReadError if a read fails.
   */
  bool classify_stream_preview(ByteStream& stream, int max_kb) const;
  bool classify_stream_preview(std::istream& in, int max_kb) const;

  /**
   * @brief Opens the file and classifies its whole content.
   * @throws StreamReadError if the file cannot be opened or read.
   */
  bool classify_file(const fs::path& file_path) const;

  /**
   * @brief Opens the file and classifies at most its first max_kb kilobytes.
   *
   * The file is opened before the limit is checked, so an unopenable file is
   * reported as such regardless of max_kb.
   * @throws StreamReadError if the file cannot be opened or read.
   * @throws InvalidLengthError if max_kb <= 0.
   */
  bool classify_file_preview(const fs::path& file_path, int max_kb) const;

  // Converts a kilobyte count into a byte limit, validating it.
  static std::uint64_t preview_limit_bytes(int max_kb);

 private:
  bool classify_accumulated(ByteStream& stream, std::uint64_t capacity_hint) const;

  ClassifierOptions options_;
};

}  // namespace plaintext_core
