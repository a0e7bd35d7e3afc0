#include <txtpack/delimiter-codec.hxx>
#include <txtpack/detail/utf8.hxx>
#include <txtpack/error.hxx>
#include <txtpack/stream-extractor.hxx>

#include <algorithm>
#include <string>

namespace txtpack {
std::string_view to_string(SkipReason reason) noexcept {
  switch (reason) {
  case SkipReason::None:
    return "none";
  case SkipReason::EndOfInput:
    return "end of input";
  case SkipReason::BlankLine:
    return "blank line";
  case SkipReason::NotUtf8:
    return "line is not valid UTF-8";
  case SkipReason::NotADelimiter:
    return "not a start delimiter";
  case SkipReason::InvalidDelimiter:
    return "malformed start delimiter";
  case SkipReason::TruncatedContent:
    return "declared byte count exceeds remaining input";
  case SkipReason::DecodeError:
    return "content is not valid UTF-8";
  }
  return "unknown";
}

std::size_t find_line_end(std::string_view buffer, std::size_t pos) noexcept {
  if (pos >= buffer.size())
    return buffer.size();
  auto const nl = buffer.find('\n', pos);
  return nl == std::string_view::npos ? buffer.size() : nl;
}

Payload extract_payload(std::string_view buffer, std::size_t pos,
                        std::string_view filename, std::size_t byte_count) {
  auto const available = pos <= buffer.size() ? buffer.size() - pos : 0;
  if (pos > buffer.size() || byte_count > available)
    throw TruncatedContent("not enough content for declared byte count in " +
                           std::string(filename) +
                           ". Declared: " + std::to_string(byte_count) +
                           ", Available: " + std::to_string(available));

  auto const slice = buffer.substr(pos, byte_count);
  if (!detail::is_valid_utf8(slice))
    throw DecodeError("failed to decode content for " + std::string(filename) +
                      ": invalid UTF-8");

  return {std::string(slice), pos + byte_count};
}

std::size_t skip_end_marker(std::string_view buffer, std::size_t pos,
                            std::string_view filename,
                            const DelimiterConfig &config) {
  if (pos >= buffer.size())
    return pos;

  // Separator written after every payload
  if (buffer[pos] == '\n')
    ++pos;

  auto const line_end = find_line_end(buffer, pos);
  if (line_end > pos &&
      is_end(buffer.substr(pos, line_end - pos), filename, config))
    return std::min(line_end + 1, buffer.size());

  return pos;
}

/**
 * @brief One scan step.
 *
 * Hard per-record failures (bad marker fields, truncated or undecodable
 * payload) are converted into a skip of the start line here, so they never
 * reach the driving loop.
 */
ScanResult extract_next_record(std::string_view buffer, std::size_t pos,
                               const DelimiterConfig &config) {
  if (pos >= buffer.size())
    return ScanResult::not_found(pos, SkipReason::EndOfInput);

  auto const line_end = find_line_end(buffer, pos);
  if (line_end == pos)
    return ScanResult::not_found(pos + 1, SkipReason::BlankLine);

  auto const next_line = std::min(line_end + 1, buffer.size());
  auto const line = buffer.substr(pos, line_end - pos);

  if (!detail::is_valid_utf8(line))
    return ScanResult::not_found(next_line, SkipReason::NotUtf8);

  if (!is_start(line, config))
    return ScanResult::not_found(next_line, SkipReason::NotADelimiter);

  StartMarker marker;
  Payload payload;
  try {
    marker = parse_start(line, config);
    payload = extract_payload(buffer, line_end + 1, marker.filename,
                              marker.byte_count);
  } catch (const InvalidDelimiter &) {
    return ScanResult::not_found(next_line, SkipReason::InvalidDelimiter);
  } catch (const TruncatedContent &) {
    return ScanResult::not_found(next_line, SkipReason::TruncatedContent);
  } catch (const DecodeError &) {
    return ScanResult::not_found(next_line, SkipReason::DecodeError);
  }

  auto const final_pos = skip_end_marker(buffer, payload.next_position,
                                         marker.filename, config);
  return ScanResult::found(
      FileRecord{std::move(marker.filename), std::move(payload.text)},
      final_pos);
}
} // namespace txtpack
