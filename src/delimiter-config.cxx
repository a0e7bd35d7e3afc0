#include <txtpack/delimiter-config.hxx>

#include <stdexcept>
#include <string_view>
#include <utility>

namespace txtpack {
namespace {

/**
 * @brief Reject fragments the line-oriented scanner cannot recognise.
 *
 * @param name Fragment name used in the exception message.
 * @param value Fragment text.
 * @throws std::invalid_argument when @p value is empty or spans lines.
 */
void validate_fragment(std::string_view name, const std::string &value) {
  if (value.empty())
    throw std::invalid_argument("delimiter fragment '" + std::string(name) +
                                "' must not be empty");
  if (value.find('\n') != std::string::npos)
    throw std::invalid_argument("delimiter fragment '" + std::string(name) +
                                "' must not contain a newline");
}

} // unnamed namespace

DelimiterConfig::DelimiterConfig()
    : start_prefix_("--- FILE: "), start_middle_(" ("),
      start_bytes_suffix_(" bytes) ---"), end_prefix_("--- END: "),
      end_suffix_(" ---"), default_search_path_(".") {}

DelimiterConfig::DelimiterConfig(std::string start_prefix,
                                 std::string start_middle,
                                 std::string start_bytes_suffix,
                                 std::string end_prefix, std::string end_suffix,
                                 std::string default_search_path)
    : start_prefix_(std::move(start_prefix)),
      start_middle_(std::move(start_middle)),
      start_bytes_suffix_(std::move(start_bytes_suffix)),
      end_prefix_(std::move(end_prefix)), end_suffix_(std::move(end_suffix)),
      default_search_path_(std::move(default_search_path)) {
  validate_fragment("start_prefix", start_prefix_);
  validate_fragment("start_middle", start_middle_);
  validate_fragment("start_bytes_suffix", start_bytes_suffix_);
  validate_fragment("end_prefix", end_prefix_);
  validate_fragment("end_suffix", end_suffix_);
}

DelimiterConfig DelimiterConfig::with_start_prefix(std::string value) const {
  return {std::move(value), start_middle_,      start_bytes_suffix_,
          end_prefix_,      end_suffix_,        default_search_path_};
}

DelimiterConfig DelimiterConfig::with_start_middle(std::string value) const {
  return {start_prefix_, std::move(value), start_bytes_suffix_,
          end_prefix_,   end_suffix_,      default_search_path_};
}

DelimiterConfig
DelimiterConfig::with_start_bytes_suffix(std::string value) const {
  return {start_prefix_, start_middle_, std::move(value),
          end_prefix_,   end_suffix_,   default_search_path_};
}

DelimiterConfig DelimiterConfig::with_end_prefix(std::string value) const {
  return {start_prefix_,    start_middle_, start_bytes_suffix_,
          std::move(value), end_suffix_,   default_search_path_};
}

DelimiterConfig DelimiterConfig::with_end_suffix(std::string value) const {
  return {start_prefix_, start_middle_,    start_bytes_suffix_,
          end_prefix_,   std::move(value), default_search_path_};
}

DelimiterConfig
DelimiterConfig::with_default_search_path(std::string value) const {
  return {start_prefix_, start_middle_, start_bytes_suffix_,
          end_prefix_,   end_suffix_,   std::move(value)};
}
} // namespace txtpack
