#include <txtpack/detail/utf8.hxx>
#include <txtpack/error.hxx>
#include <txtpack/file-operations.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/device/file.hpp>

#include <fnmatch.h>

#include <algorithm>
#include <ios>
#include <regex>
#include <system_error>

namespace io = boost::iostreams;
namespace fs = std::filesystem;

namespace txtpack {
namespace {

/// @brief Matches the relative path @p rel against a compiled selector.
using PathMatcher = std::function<bool(const std::string &rel)>;

PathMatcher make_glob_matcher(std::string pattern) {
  return [pattern = std::move(pattern)](const std::string &rel) {
    return ::fnmatch(pattern.c_str(), rel.c_str(), FNM_PATHNAME) == 0;
  };
}

PathMatcher make_regex_matcher(const std::string &pattern) {
  try {
    std::regex re(pattern, std::regex::ECMAScript);
    return [re = std::move(re)](const std::string &rel) {
      return std::regex_search(rel, re);
    };
  } catch (const std::regex_error &e) {
    throw PipelineError(ErrorTag::InvalidRegexPattern,
                        "invalid regex pattern '" + pattern + "': " + e.what());
  }
}

} // unnamed namespace

bool is_regex_pattern(std::string_view pattern) noexcept {
  if (pattern.empty())
    return false;
  if (pattern.front() == '^' || pattern.back() == '$')
    return true;
  return pattern.find_first_of("\\()|+{") != std::string_view::npos;
}

std::vector<fs::path> find_matching_files(const fs::path &search_directory,
                                          std::string_view pattern) {
  std::error_code ec;
  if (!fs::is_directory(search_directory, ec))
    throw PipelineError(ErrorTag::SearchDirectoryNotFound,
                        "search directory not found: " +
                            search_directory.string());

  auto const matches = is_regex_pattern(pattern)
                           ? make_regex_matcher(std::string(pattern))
                           : make_glob_matcher(std::string(pattern));

  std::vector<std::pair<std::string, fs::path>> found;
  auto it = fs::recursive_directory_iterator(
      search_directory, fs::directory_options::skip_permission_denied, ec);
  if (ec)
    throw PipelineError(ErrorTag::SearchDirectoryNotFound,
                        "cannot list " + search_directory.string() + ": " +
                            ec.message());

  for (auto const end = fs::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec)
      throw PipelineError(ErrorTag::SearchDirectoryNotFound,
                          "failed while listing " + search_directory.string() +
                              ": " + ec.message());
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec))
      continue;
    auto rel = it->path().lexically_relative(search_directory).generic_string();
    if (matches(rel))
      found.emplace_back(std::move(rel), it->path());
  }

  std::sort(found.begin(), found.end(),
            [](auto const &a, auto const &b) { return a.first < b.first; });

  std::vector<fs::path> paths;
  paths.reserve(found.size());
  for (auto &entry : found)
    paths.push_back(std::move(entry.second));
  return paths;
}

std::string read_file_bytes(const fs::path &path) {
  io::file_source source(path.string(), std::ios::in | std::ios::binary);
  if (!source.is_open())
    throw FileReadError(path, "failed to open " + path.string());

  std::string bytes;
  try {
    io::copy(source, io::back_inserter(bytes));
  } catch (const std::ios_base::failure &e) {
    throw FileReadError(path,
                        "failed to read " + path.string() + ": " + e.what());
  }
  return bytes;
}

std::string read_file_text(const fs::path &path) {
  auto bytes = read_file_bytes(path);
  if (!detail::is_valid_utf8(bytes))
    throw FileReadError(path, path.string() + " is not valid UTF-8 text");
  return bytes;
}

void ensure_directory_exists(const fs::path &directory) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec)
    throw FileWriteError(directory, "failed to create directory " +
                                        directory.string() + ": " +
                                        ec.message());
  if (!fs::is_directory(directory, ec))
    throw FileWriteError(directory,
                         directory.string() + " exists and is not a directory");
}

void write_file_content(const fs::path &path, std::string_view content) {
  if (path.has_parent_path())
    ensure_directory_exists(path.parent_path());

  io::file_sink sink(path.string(),
                     std::ios::out | std::ios::binary | std::ios::trunc);
  if (!sink.is_open())
    throw FileWriteError(path, "failed to open " + path.string() +
                                   " for writing");

  auto const size = static_cast<std::streamsize>(content.size());
  auto const written = sink.write(content.data(), size);
  // close() discards the result of the final flush, so flush explicitly
  auto const flushed = sink.flush();
  sink.close();
  if (written != size || !flushed)
    throw FileWriteError(path, "failed to write " + path.string());
}
} // namespace txtpack
