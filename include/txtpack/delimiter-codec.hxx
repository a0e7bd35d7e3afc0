/**
 * @file delimiter-codec.hxx
 * @brief Formatting and parsing of start/end marker lines.
 */

#pragma once

#include <txtpack/delimiter-config.hxx>

#include <cstddef>
#include <string>
#include <string_view>

namespace txtpack {
/// @brief Fields recovered from a start marker line.
struct StartMarker {
  std::string filename;
  std::size_t byte_count = 0;

  bool operator==(const StartMarker &) const = default;
};

/**
 * @brief Build a start marker line (without trailing newline).
 *
 * The filename is inserted verbatim. A filename that itself contains the
 * middle or suffix fragment will not parse back to the same value.
 */
std::string format_start(std::string_view filename, std::size_t byte_count,
                         const DelimiterConfig &config = {});

/// @brief Build an end marker line (without trailing newline).
std::string format_end(std::string_view filename,
                       const DelimiterConfig &config = {});

/**
 * @brief Cheap syntactic test for a start marker.
 *
 * True iff @p line starts with the start prefix, contains the middle fragment
 * somewhere after the prefix and ends with the bytes suffix. A line passing
 * this test may still be rejected by parse_start().
 */
bool is_start(std::string_view line, const DelimiterConfig &config = {});

/**
 * @brief Parse filename and byte count out of a start marker.
 *
 * The filename ends at the FIRST occurrence of the middle fragment after the
 * prefix; the byte count is the text between that fragment and the bytes
 * suffix and must be a plain non-negative decimal number.
 *
 * @throws InvalidDelimiter when the line is not a start marker or a field
 * cannot be parsed.
 */
StartMarker parse_start(std::string_view line,
                        const DelimiterConfig &config = {});

/// @brief Exact comparison of @p line against format_end(filename, config).
bool is_end(std::string_view line, std::string_view filename,
            const DelimiterConfig &config = {});
} // namespace txtpack
