/**
 * @file stream-extractor.hxx
 * @brief Cursor-driven scanner that recovers records from a packed buffer.
 */

#pragma once

#include <txtpack/delimiter-config.hxx>
#include <txtpack/file-record.hxx>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace txtpack {
/**
 * @enum SkipReason
 * @brief Why extract_next_record() returned without a record.
 */
enum class SkipReason {
  None,             ///< A record was found.
  EndOfInput,       ///< Cursor already at the end; no progress was made.
  BlankLine,        ///< An empty line was stepped over.
  NotUtf8,          ///< The line is not valid UTF-8.
  NotADelimiter,    ///< The line is not a start marker.
  InvalidDelimiter, ///< Start marker fields could not be parsed.
  TruncatedContent, ///< Declared byte count exceeds the remaining buffer.
  DecodeError       ///< Payload is not valid UTF-8.
};

/// @brief Human-readable description of @p reason.
std::string_view to_string(SkipReason reason) noexcept;

/**
 * @brief Outcome of one scan step: either Found(record, pos) or
 * NotFound(pos, reason).
 *
 * `next_position` is always where the following scan step must start.
 */
struct ScanResult {
  std::optional<FileRecord> record;
  std::size_t next_position = 0;
  SkipReason reason = SkipReason::None;

  static ScanResult found(FileRecord record, std::size_t pos) {
    return {std::move(record), pos, SkipReason::None};
  }
  static ScanResult not_found(std::size_t pos, SkipReason reason) {
    return {std::nullopt, pos, reason};
  }

  bool has_record() const noexcept { return record.has_value(); }
};

/// @brief Decoded payload and the cursor just past its last byte.
struct Payload {
  std::string text;
  std::size_t next_position = 0;
};

/**
 * @brief Index of the next '\n' at or after @p pos, or buffer.size() when the
 * rest of the buffer is a single unterminated line.
 */
std::size_t find_line_end(std::string_view buffer, std::size_t pos) noexcept;

/**
 * @brief Slice exactly @p byte_count bytes starting at @p pos.
 *
 * The slice is not line-bounded: it may contain newlines or text that looks
 * like a marker.
 *
 * @param filename Only used in exception messages.
 * @throws TruncatedContent if fewer than @p byte_count bytes remain.
 * @throws DecodeError if the slice is not valid UTF-8.
 */
Payload extract_payload(std::string_view buffer, std::size_t pos,
                        std::string_view filename, std::size_t byte_count);

/**
 * @brief Step over the separator newline and the end marker of @p filename.
 *
 * Best effort: when the line after the separator is not the expected end
 * marker, the returned position is right after the separator so that line is
 * scanned again by the next extract_next_record() call. Never throws.
 */
std::size_t skip_end_marker(std::string_view buffer, std::size_t pos,
                            std::string_view filename,
                            const DelimiterConfig &config = {});

/**
 * @brief Scan one step from @p pos.
 *
 * Returns a record when a well-formed start marker and its payload begin at
 * @p pos. Any failure inside one record skips only the current line; the
 * returned position never moves backwards and equals @p pos only at the end
 * of the buffer.
 */
ScanResult extract_next_record(std::string_view buffer, std::size_t pos,
                               const DelimiterConfig &config = {});
} // namespace txtpack
