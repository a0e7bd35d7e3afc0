#include <txtpack/detail/utf8.hxx>

#include <cstdint>

namespace txtpack::detail {
namespace {

/// @brief True for bytes of the form 10xxxxxx.
inline bool is_continuation(std::uint8_t c) {
  return (c & 0b11000000) == 0b10000000;
}

/**
 * @brief Length of the sequence introduced by lead byte @p c, or 0 when @p c
 * cannot start a sequence.
 *
 * 0xC0/0xC1 only ever start overlong two-byte forms and 0xF5..0xFF would
 * encode values past U+10FFFF, so both ranges are rejected here.
 */
inline std::size_t sequence_length(std::uint8_t c) {
  if (c < 0x80)
    return 1;
  if (c < 0xC2)
    return 0;
  if ((c & 0b11100000) == 0b11000000)
    return 2;
  if ((c & 0b11110000) == 0b11100000)
    return 3;
  if (c <= 0xF4)
    return 4;
  return 0;
}

} // unnamed namespace

bool is_valid_utf8(const char *data, std::size_t size) noexcept {
  auto p = reinterpret_cast<const std::uint8_t *>(data);
  std::size_t i = 0;

  while (i < size) {
    auto const c = p[i];
    auto const len = sequence_length(c);
    if (len == 0 || len > size - i)
      return false;

    for (std::size_t k = 1; k < len; ++k)
      if (!is_continuation(p[i + k]))
        return false;

    // Second-byte ranges that rule out overlongs, surrogates and > U+10FFFF
    if (len == 3) {
      if (c == 0xE0 && p[i + 1] < 0xA0)
        return false;
      if (c == 0xED && p[i + 1] > 0x9F)
        return false;
    } else if (len == 4) {
      if (c == 0xF0 && p[i + 1] < 0x90)
        return false;
      if (c == 0xF4 && p[i + 1] > 0x8F)
        return false;
    }

    i += len;
  }
  return true;
}
} // namespace txtpack::detail
