#include <txtpack/error.hxx>

namespace txtpack {
std::string_view to_string(ErrorTag tag) noexcept {
  switch (tag) {
  case ErrorTag::NoFilesFound:
    return "no_files_found";
  case ErrorTag::SearchDirectoryNotFound:
    return "search_directory_not_found";
  case ErrorTag::InvalidRegexPattern:
    return "invalid_regex_pattern";
  case ErrorTag::FailedToReadFile:
    return "failed_to_read_file";
  case ErrorTag::NoInputContentToUnpack:
    return "no_input_content_to_unpack";
  case ErrorTag::NoValidFileDelimitersFound:
    return "no_valid_file_delimiters_found";
  case ErrorTag::FailedToReadInput:
    return "failed_to_read_input";
  case ErrorTag::FailedToCreateOutputDirectory:
    return "failed_to_create_output_directory";
  case ErrorTag::FailedToWriteFile:
    return "failed_to_write_file";
  }
  return "unknown_error";
}
} // namespace txtpack
