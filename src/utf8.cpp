#include <simplefind/utf8.hpp>

namespace {

// Continuation bytes have the form 10xxxxxx
bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

bool is_valid_utf8(std::string_view s) {
  std::size_t i{0};
  while (i < s.size()) {
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t length{0};
    // Bounds of the second byte, tighter than 0x80..0xBF after some leads
    unsigned char low{0x80}, high{0xBF};

    if (lead < 0x80) {
      i += 1;
      continue;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0) {
        low = 0xA0; // overlong
      } else if (lead == 0xED) {
        high = 0x9F; // surrogates
      }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0) {
        low = 0x90; // overlong
      } else if (lead == 0xF4) {
        high = 0x8F; // above U+10FFFF
      }
    } else {
      return false;
    }

    if (i + length > s.size()) {
      return false;
    }
    const auto second = static_cast<unsigned char>(s[i + 1]);
    if (second < low || second > high) {
      return false;
    }
    for (std::size_t j = 2; j < length; ++j) {
      if (!is_continuation_byte(s[i + j])) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

std::size_t utf8_length(std::string_view s) {
  std::size_t length{0};
  for (const auto c : s) {
    if (!is_continuation_byte(c)) {
      length += 1;
    }
  }
  return length;
}

std::size_t utf8_byte_offset(std::string_view s, std::size_t characters) {
  std::size_t seen{0};
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (!is_continuation_byte(s[i])) {
      if (seen == characters) {
        return i;
      }
      seen += 1;
    }
  }
  return s.size();
}
