/**
 * @file pipeline.hxx
 * @brief Pack and unpack workflows composed from the codec, the extractor and
 * the file collaborators.
 */

#pragma once

#include <txtpack/delimiter-codec.hxx>
#include <txtpack/delimiter-config.hxx>
#include <txtpack/file-operations.hxx>
#include <txtpack/file-record.hxx>
#include <txtpack/stream-extractor.hxx>

#include <boost/iostreams/operations.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <ios>
#include <string>
#include <string_view>
#include <vector>

namespace txtpack {
/**
 * @brief Observer of scan steps that skipped a non-blank line.
 *
 * Receives the position the skipped step started at and the reason.
 */
using SkipObserver = std::function<void(std::size_t position, SkipReason)>;

namespace detail {
template <typename Sink>
void write_text(Sink &sink, std::string_view text) {
  boost::iostreams::write(sink, text.data(),
                          static_cast<std::streamsize>(text.size()));
}
} // namespace detail

/**
 * @brief Write one framed record to a Boost.Iostreams Sink.
 *
 * Emits `start marker \n content \n end marker \n`. The byte count in the
 * start marker is the byte length of @p record.content.
 *
 * @tparam Sink Any Boost.Iostreams Sink or std::ostream.
 *
 * @code{.cpp}
 * namespace io = boost::iostreams;
 * io::filtering_ostream out;
 * out.push(io::file_sink("bundle.txt"));
 * txtpack::write_record(out, {"a.txt", "hello"});
 * @endcode
 */
template <typename Sink>
void write_record(Sink &sink, const FileRecord &record,
                  const DelimiterConfig &config = {}) {
  detail::write_text(sink, format_start(record.filename,
                                        record.content.size(), config));
  detail::write_text(sink, "\n");
  detail::write_text(sink, record.content);
  detail::write_text(sink, "\n");
  detail::write_text(sink, format_end(record.filename, config));
  detail::write_text(sink, "\n");
}

/// @brief Write every record of @p records, in order, to @p sink.
template <typename Sink>
void write_records(Sink &sink, const std::vector<FileRecord> &records,
                   const DelimiterConfig &config = {}) {
  for (const auto &record : records)
    write_record(sink, record, config);
}

/// @brief Pack @p records into one buffer.
std::string pack_records(const std::vector<FileRecord> &records,
                         const DelimiterConfig &config = {});

/**
 * @brief Recover every well-formed record from @p buffer, in order.
 *
 * Runs extract_next_record() from position 0 until the cursor stops moving
 * or reaches the end. Garbage lines, malformed markers and truncated or
 * undecodable payloads are skipped and reported to @p on_skip if given.
 */
std::vector<FileRecord> unpack_buffer(std::string_view buffer,
                                      const DelimiterConfig &config = {},
                                      const SkipObserver &on_skip = {});

/**
 * @brief List, read and pack the files matching @p pattern.
 *
 * Record names are the paths relative to @p search_directory with '/'
 * separators.
 *
 * @param reader Read collaborator; read_file_text() when empty.
 * @throws PipelineError tagged NoFilesFound, SearchDirectoryNotFound,
 * InvalidRegexPattern or FailedToReadFile.
 */
std::string pack_files(std::string_view pattern,
                       const std::filesystem::path &search_directory,
                       const DelimiterConfig &config = {},
                       const FileReader &reader = {});

/**
 * @brief Unpack @p content into @p output_directory.
 *
 * @warning Record names are joined to @p output_directory unchanged, so an
 * absolute name or one containing ".." is written outside of it.
 *
 * @param writer Write collaborator; write_file_content() when empty.
 * @return The records written, in buffer order.
 * @throws PipelineError tagged NoValidFileDelimitersFound,
 * FailedToCreateOutputDirectory or FailedToWriteFile.
 */
std::vector<FileRecord>
unpack_content(std::string_view content,
               const std::filesystem::path &output_directory,
               const DelimiterConfig &config = {},
               const FileWriter &writer = {},
               const SkipObserver &on_skip = {});
} // namespace txtpack
