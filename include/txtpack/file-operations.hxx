/**
 * @file file-operations.hxx
 * @brief File listing, reading and writing collaborators of the pack and
 * unpack workflows.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace txtpack {
/// @brief Reads a whole file; throws FileReadError on failure.
using FileReader = std::function<std::string(const std::filesystem::path &)>;

/// @brief Writes text to a file; throws FileWriteError on failure.
using FileWriter = std::function<void(const std::filesystem::path &,
                                      std::string_view)>;

/**
 * @brief Whether @p pattern is treated as a regular expression rather than a
 * glob.
 *
 * Patterns anchored with '^' or '$', or containing one of `\ ( ) | + {`, are
 * regular expressions; everything else is a glob.
 */
bool is_regex_pattern(std::string_view pattern) noexcept;

/**
 * @brief List regular files below @p search_directory that match @p pattern.
 *
 * Globs are matched with fnmatch(FNM_PATHNAME) against the path relative to
 * @p search_directory, so `*` does not cross directory separators. Regular
 * expressions (ECMAScript) are searched in the same relative path.
 *
 * @return Matching paths (search directory prefixed), sorted by relative path.
 * @throws PipelineError tagged SearchDirectoryNotFound or InvalidRegexPattern.
 */
std::vector<std::filesystem::path>
find_matching_files(const std::filesystem::path &search_directory,
                    std::string_view pattern);

/// @brief Raw bytes of @p path; throws FileReadError.
std::string read_file_bytes(const std::filesystem::path &path);

/**
 * @brief Bytes of @p path, which must be UTF-8 text.
 * @throws FileReadError when the file cannot be read or is not UTF-8.
 */
std::string read_file_text(const std::filesystem::path &path);

/**
 * @brief Create @p directory and its parents if missing.
 * @throws FileWriteError when creation fails or a non-directory is in the way.
 */
void ensure_directory_exists(const std::filesystem::path &directory);

/**
 * @brief Write @p content to @p path, creating parent directories, replacing
 * any existing file.
 * @throws FileWriteError on failure.
 */
void write_file_content(const std::filesystem::path &path,
                        std::string_view content);
} // namespace txtpack
