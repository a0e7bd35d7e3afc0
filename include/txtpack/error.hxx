/**
 * @file error.hxx
 * @brief Exception types and stable error tags reported by txtpack.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace txtpack {
/**
 * @brief Machine-readable failure categories surfaced by the command line.
 *
 * Each value maps to a fixed snake_case tag through to_string(), which is
 * what scripts are expected to match on.
 */
enum class ErrorTag {
  NoFilesFound,
  SearchDirectoryNotFound,
  InvalidRegexPattern,
  FailedToReadFile,
  NoInputContentToUnpack,
  NoValidFileDelimitersFound,
  FailedToReadInput,
  FailedToCreateOutputDirectory,
  FailedToWriteFile
};

/// @brief Returns the stable tag text for @p tag, e.g. "no_files_found".
std::string_view to_string(ErrorTag tag) noexcept;

/// @brief Base class of every exception thrown by txtpack.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A line has the outline of a start marker but its fields cannot be
 * parsed (missing fragment, bad byte count).
 */
class InvalidDelimiter : public Error {
public:
  using Error::Error;
};

/// @brief The declared byte count runs past the end of the buffer.
class TruncatedContent : public Error {
public:
  using Error::Error;
};

/// @brief A payload (or a file read for packing) is not valid UTF-8.
class DecodeError : public Error {
public:
  using Error::Error;
};

/// @brief A file could not be opened or read.
class FileReadError : public Error {
public:
  FileReadError(std::filesystem::path path, const std::string &what)
      : Error(what), path_(std::move(path)) {}

  const std::filesystem::path &path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/// @brief A file or directory could not be created or written.
class FileWriteError : public Error {
public:
  FileWriteError(std::filesystem::path path, const std::string &what)
      : Error(what), path_(std::move(path)) {}

  const std::filesystem::path &path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/**
 * @brief Workflow-level failure of pack_files() / unpack_content() and the
 * file listing collaborator, carrying the tag the command line reports.
 */
class PipelineError : public Error {
public:
  PipelineError(ErrorTag tag, const std::string &what)
      : Error(what), tag_(tag) {}

  ErrorTag tag() const noexcept { return tag_; }

private:
  ErrorTag tag_;
};
} // namespace txtpack
