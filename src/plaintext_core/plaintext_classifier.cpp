#include "plaintext_core/plaintext_classifier.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "plaintext_core/utf8_text.hpp"

namespace plaintext_core {

PlaintextClassifier::PlaintextClassifier(const ClassifierOptions& options) : options_(options) {
  if (options_.read_chunk_size == 0) {
    throw std::invalid_argument("read_chunk_size must be greater than 0");
  }
}

bool PlaintextClassifier::classify_bytes(std::string_view data) const {
  return is_plaintext_buffer(data);
}

bool PlaintextClassifier::classify_bytes(const std::vector<std::uint8_t>& data) const {
  return is_plaintext_buffer(
      std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

bool PlaintextClassifier::classify_stream(ByteStream& stream) const {
  return classify_accumulated(stream, options_.initial_capacity);
}

bool PlaintextClassifier::classify_stream(std::istream& in) const {
  IStreamByteStream stream(in);
  return classify_stream(stream);
}

bool PlaintextClassifier::classify_stream_preview(ByteStream& stream, int max_kb) const {
  const std::uint64_t limit = preview_limit_bytes(max_kb);
  LimitedByteStream limited(stream, limit);
  return classify_accumulated(limited, std::min<std::uint64_t>(limit, options_.initial_capacity));
}

bool PlaintextClassifier::classify_stream_preview(std::istream& in, int max_kb) const {
  IStreamByteStream stream(in);
  return classify_stream_preview(stream, max_kb);
}

bool PlaintextClassifier::classify_file(const fs::path& file_path) const {
  FileByteStream file(file_path);
  return classify_stream(file);
}

bool PlaintextClassifier::classify_file_preview(const fs::path& file_path, int max_kb) const {
  FileByteStream file(file_path);
  return classify_stream_preview(file, max_kb);
}

std::uint64_t PlaintextClassifier::preview_limit_bytes(int max_kb) {
  if (max_kb <= 0) {
    throw InvalidLengthError("invalid length: max_kb must be greater than 0, got " +
                             std::to_string(max_kb));
  }
  return static_cast<std::uint64_t>(max_kb) * BYTES_PER_KB;
}

bool PlaintextClassifier::classify_accumulated(ByteStream& stream,
                                               std::uint64_t capacity_hint) const {
  const std::string buffer =
      read_all(stream, options_.read_chunk_size, static_cast<size_t>(capacity_hint));
  if (buffer.empty()) {
    return true;
  }
  return is_plaintext_buffer(buffer);
}

}  // namespace plaintext_core
