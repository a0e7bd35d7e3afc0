#include <txtpack/delimiter-codec.hxx>
#include <txtpack/error.hxx>

#include <charconv>
#include <system_error>

namespace txtpack {
namespace {

/**
 * @brief Parse an unsigned decimal field.
 *
 * Unlike std::stoul this accepts neither a sign, leading whitespace nor
 * trailing garbage, and reports overflow instead of wrapping.
 *
 * @param text Field text.
 * @param out Receives the value on success.
 * @return true when the whole of @p text is a representable number.
 */
bool parse_byte_count_impl(std::string_view text, std::size_t &out) {
  if (text.empty())
    return false;
  auto const first = text.data();
  auto const last = text.data() + text.size();
  auto const [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

} // unnamed namespace

std::string format_start(std::string_view filename, std::size_t byte_count,
                         const DelimiterConfig &config) {
  std::string line;
  line.reserve(config.start_prefix().size() + filename.size() +
               config.start_middle().size() + 20 +
               config.start_bytes_suffix().size());
  line += config.start_prefix();
  line += filename;
  line += config.start_middle();
  line += std::to_string(byte_count);
  line += config.start_bytes_suffix();
  return line;
}

std::string format_end(std::string_view filename,
                       const DelimiterConfig &config) {
  std::string line;
  line.reserve(config.end_prefix().size() + filename.size() +
               config.end_suffix().size());
  line += config.end_prefix();
  line += filename;
  line += config.end_suffix();
  return line;
}

bool is_start(std::string_view line, const DelimiterConfig &config) {
  std::string_view const prefix = config.start_prefix();
  if (!line.starts_with(prefix) ||
      !line.ends_with(std::string_view(config.start_bytes_suffix())))
    return false;
  return line.find(config.start_middle(), prefix.size()) !=
         std::string_view::npos;
}

StartMarker parse_start(std::string_view line, const DelimiterConfig &config) {
  if (!is_start(line, config))
    throw InvalidDelimiter("not a start delimiter: " + std::string(line));

  auto const prefix_len = config.start_prefix().size();
  auto const middle_pos = line.find(config.start_middle(), prefix_len);
  if (middle_pos == std::string_view::npos)
    throw InvalidDelimiter("missing middle fragment in: " + std::string(line));

  auto const count_begin = middle_pos + config.start_middle().size();
  auto const suffix_pos = line.find(config.start_bytes_suffix(), count_begin);
  if (suffix_pos == std::string_view::npos)
    throw InvalidDelimiter("missing bytes suffix in: " + std::string(line));

  auto const count_text = line.substr(count_begin, suffix_pos - count_begin);
  StartMarker marker;
  if (!parse_byte_count_impl(count_text, marker.byte_count))
    throw InvalidDelimiter("invalid byte count '" + std::string(count_text) +
                           "' in: " + std::string(line));

  marker.filename = std::string(line.substr(prefix_len, middle_pos - prefix_len));
  return marker;
}

bool is_end(std::string_view line, std::string_view filename,
            const DelimiterConfig &config) {
  return line == format_end(filename, config);
}
} // namespace txtpack
