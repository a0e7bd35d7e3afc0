#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace txtpack::cli {
struct Options {
  enum class Command { None, Pack, Unpack, Help };

  Command command = Command::None;
  std::string pattern;                          // pack: glob or regex
  std::filesystem::path directory;              // pack: -d, --directory
  std::optional<std::filesystem::path> input;   // unpack: -i, stdin if unset
  std::filesystem::path output_dir = ".";       // unpack: -o, --output-dir
  bool verbose = false;                         // -v
  std::string usage_error; // set when the arguments could not be used

  /**
   * @brief Parse `txtpack <command> [options] [pattern]`.
   *
   * @p argv is permuted by getopt_long. Problems are reported through
   * usage_error rather than thrown.
   */
  Options(int argc, char **argv, std::string default_directory = ".");
};

/// @brief Usage text printed by --help and on usage errors.
std::string usage(const char *program);
} // namespace txtpack::cli
