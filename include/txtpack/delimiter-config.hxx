/**
 * @file delimiter-config.hxx
 * @brief Literal fragments that make up the start and end marker lines.
 */

#pragma once

#include <string>

namespace txtpack {
/**
 * @class DelimiterConfig
 * @brief Immutable description of the marker grammar.
 *
 * A start marker is
 * `start_prefix + filename + start_middle + byte_count + start_bytes_suffix`
 * and an end marker is `end_prefix + filename + end_suffix`. The defaults
 * produce:
 *
 * @code
 * --- FILE: notes.txt (42 bytes) ---
 * --- END: notes.txt ---
 * @endcode
 *
 * Fragments are validated once at construction: none may be empty or contain
 * a newline, since the extractor works line by line. Single fragments are
 * overridden through the with_*() members, which return a modified copy.
 */
class DelimiterConfig {
public:
  /// @brief Constructs the default `--- FILE: ... ---` grammar.
  DelimiterConfig();

  /**
   * @brief Constructs a custom grammar.
   * @throws std::invalid_argument if a fragment is empty or contains '\n'.
   */
  DelimiterConfig(std::string start_prefix, std::string start_middle,
                  std::string start_bytes_suffix, std::string end_prefix,
                  std::string end_suffix,
                  std::string default_search_path = ".");

  const std::string &start_prefix() const noexcept { return start_prefix_; }
  const std::string &start_middle() const noexcept { return start_middle_; }
  const std::string &start_bytes_suffix() const noexcept {
    return start_bytes_suffix_;
  }
  const std::string &end_prefix() const noexcept { return end_prefix_; }
  const std::string &end_suffix() const noexcept { return end_suffix_; }

  /// @brief Directory the pack workflow searches when none is given.
  const std::string &default_search_path() const noexcept {
    return default_search_path_;
  }

  DelimiterConfig with_start_prefix(std::string value) const;
  DelimiterConfig with_start_middle(std::string value) const;
  DelimiterConfig with_start_bytes_suffix(std::string value) const;
  DelimiterConfig with_end_prefix(std::string value) const;
  DelimiterConfig with_end_suffix(std::string value) const;
  DelimiterConfig with_default_search_path(std::string value) const;

  bool operator==(const DelimiterConfig &) const = default;

private:
  std::string start_prefix_;
  std::string start_middle_;
  std::string start_bytes_suffix_;
  std::string end_prefix_;
  std::string end_suffix_;
  std::string default_search_path_;
};
} // namespace txtpack
