#pragma once

#include <cstddef>
#include <string_view>

namespace plaintext_core {

// True for printable code points (>= 32, including everything non-ASCII) and
// for the whitespace controls '\n', '\r' and '\t'.
bool is_accepted_code_point(char32_t code_point);

/**
 * @brief Decides whether a complete buffer is plaintext.
 *
 * The buffer must be valid UTF-8 (no truncated, overlong, surrogate or
 * out-of-range sequences) and every decoded code point must pass
 * is_accepted_code_point. An empty buffer is plaintext. Never throws.
 */
bool is_plaintext_buffer(std::string_view bytes);

// Number of trailing bytes (0-3) that start a multi-byte sequence which was
// cut short, e.g. by a preview limit.
size_t incomplete_tail_length(std::string_view bytes);

}  // namespace plaintext_core
