#include "plaintext_core/utf8_text.hpp"

#include <utf8.h>

#include <algorithm>
#include <cstdint>

namespace plaintext_core {

bool is_accepted_code_point(char32_t code_point) {
  if (code_point >= 32) {
    return true;
  }
  return code_point == U'\n' || code_point == U'\r' || code_point == U'\t';
}

bool is_plaintext_buffer(std::string_view bytes) {
  if (!utf8::is_valid(bytes.begin(), bytes.end())) {
    return false;
  }

  // Validity is established above, so the unchecked decoder is safe here.
  auto it = bytes.begin();
  while (it != bytes.end()) {
    const std::uint32_t code_point = utf8::unchecked::next(it);
    if (!is_accepted_code_point(static_cast<char32_t>(code_point))) {
      return false;
    }
  }
  return true;
}

size_t incomplete_tail_length(std::string_view bytes) {
  const size_t max_back = std::min<size_t>(3, bytes.size());
  for (size_t back = 1; back <= max_back; ++back) {
    const auto byte = static_cast<unsigned char>(bytes[bytes.size() - back]);
    if ((byte & 0xC0) == 0x80) {
      continue;  // continuation byte, keep looking for the lead
    }

    size_t expected = 1;
    if ((byte & 0xE0) == 0xC0) {
      expected = 2;
    } else if ((byte & 0xF0) == 0xE0) {
      expected = 3;
    } else if ((byte & 0xF8) == 0xF0) {
      expected = 4;
    }
    return expected > back ? back : 0;
  }
  return 0;
}

}  // namespace plaintext_core
