#pragma once

#include <cstddef>
#include <string_view>

namespace txtpack::detail {
/**
 * @brief Check that a byte range is well-formed UTF-8.
 *
 * Rejects stray continuation bytes, truncated sequences, overlong encodings,
 * UTF-16 surrogates (U+D800..U+DFFF) and code points above U+10FFFF.
 *
 * @param data Pointer to the first byte.
 * @param size Number of bytes to inspect.
 * @return true when every byte belongs to a valid sequence.
 */
bool is_valid_utf8(const char *data, std::size_t size) noexcept;

inline bool is_valid_utf8(std::string_view text) noexcept {
  return is_valid_utf8(text.data(), text.size());
}
} // namespace txtpack::detail
