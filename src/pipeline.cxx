#include <txtpack/error.hxx>
#include <txtpack/pipeline.hxx>

#include <boost/iostreams/device/back_inserter.hpp>

namespace io = boost::iostreams;
namespace fs = std::filesystem;

namespace txtpack {
std::string pack_records(const std::vector<FileRecord> &records,
                         const DelimiterConfig &config) {
  std::string packed;
  auto sink = io::back_inserter(packed);
  write_records(sink, records, config);
  return packed;
}

std::vector<FileRecord> unpack_buffer(std::string_view buffer,
                                      const DelimiterConfig &config,
                                      const SkipObserver &on_skip) {
  std::vector<FileRecord> records;
  std::size_t pos = 0;

  while (pos < buffer.size()) {
    auto result = extract_next_record(buffer, pos, config);
    if (result.has_record()) {
      records.push_back(std::move(*result.record));
    } else if (on_skip && result.reason != SkipReason::BlankLine &&
               result.reason != SkipReason::EndOfInput) {
      on_skip(pos, result.reason);
    }

    if (result.next_position <= pos)
      break;
    pos = result.next_position;
  }
  return records;
}

std::string pack_files(std::string_view pattern,
                       const fs::path &search_directory,
                       const DelimiterConfig &config,
                       const FileReader &reader) {
  auto const paths = find_matching_files(search_directory, pattern);
  if (paths.empty())
    throw PipelineError(ErrorTag::NoFilesFound,
                        "no files found matching pattern '" +
                            std::string(pattern) + "' in " +
                            search_directory.string());

  auto const &read = reader ? reader : FileReader(read_file_text);

  std::vector<FileRecord> records;
  records.reserve(paths.size());
  for (const auto &path : paths) {
    FileRecord record;
    record.filename = path.lexically_relative(search_directory).generic_string();
    try {
      record.content = read(path);
    } catch (const FileReadError &e) {
      throw PipelineError(ErrorTag::FailedToReadFile, e.what());
    }
    records.push_back(std::move(record));
  }
  return pack_records(records, config);
}

std::vector<FileRecord> unpack_content(std::string_view content,
                                       const fs::path &output_directory,
                                       const DelimiterConfig &config,
                                       const FileWriter &writer,
                                       const SkipObserver &on_skip) {
  auto records = unpack_buffer(content, config, on_skip);
  if (records.empty())
    throw PipelineError(ErrorTag::NoValidFileDelimitersFound,
                        "no valid file delimiters found in content");

  try {
    ensure_directory_exists(output_directory);
  } catch (const FileWriteError &e) {
    throw PipelineError(ErrorTag::FailedToCreateOutputDirectory, e.what());
  }

  auto const &write = writer ? writer : FileWriter(write_file_content);
  for (const auto &record : records) {
    try {
      write(output_directory / record.filename, record.content);
    } catch (const FileWriteError &e) {
      throw PipelineError(ErrorTag::FailedToWriteFile, e.what());
    }
  }
  return records;
}
} // namespace txtpack
