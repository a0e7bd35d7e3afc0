#include "commands.hxx"

#include <txtpack/error.hxx>
#include <txtpack/file-operations.hxx>
#include <txtpack/pipeline.hxx>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/back_inserter.hpp>

#include <exception>
#include <iostream>
#include <string>

namespace io = boost::iostreams;
namespace fs = std::filesystem;

namespace txtpack::cli {
namespace {

int report(std::ostream &err, ErrorTag tag, const std::string &message) {
  err << "error: " << to_string(tag) << ": " << message << '\n';
  return 1;
}

bool is_blank(std::string_view text) {
  return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

} // unnamed namespace

int run_pack(const Options &options, const DelimiterConfig &config,
             std::ostream &out, std::ostream &err) {
  FileReader reader = [&](const fs::path &path) {
    if (options.verbose)
      err << "packing " << path.string() << '\n';
    return read_file_text(path);
  };

  std::string packed;
  try {
    packed = pack_files(options.pattern, options.directory, config, reader);
  } catch (const PipelineError &e) {
    return report(err, e.tag(), e.what());
  }

  out.write(packed.data(), static_cast<std::streamsize>(packed.size()));
  out.flush();
  return 0;
}

int run_unpack(const Options &options, const DelimiterConfig &config,
               std::istream &in, std::ostream &err) {
  std::string content;
  if (options.input) {
    try {
      content = read_file_bytes(*options.input);
    } catch (const FileReadError &e) {
      return report(err, ErrorTag::FailedToReadInput, e.what());
    }
  } else {
    try {
      io::copy(in, io::back_inserter(content));
    } catch (const std::ios_base::failure &e) {
      return report(err, ErrorTag::FailedToReadInput, e.what());
    }
  }

  if (is_blank(content))
    return report(err, ErrorTag::NoInputContentToUnpack,
                  "no input content to unpack");

  SkipObserver on_skip;
  FileWriter writer = write_file_content;
  if (options.verbose) {
    on_skip = [&](std::size_t position, SkipReason reason) {
      err << "skipped line at byte " << position << ": " << to_string(reason)
          << '\n';
    };
    writer = [&](const fs::path &path, std::string_view text) {
      write_file_content(path, text);
      err << "wrote " << path.string() << " (" << text.size() << " bytes)\n";
    };
  }

  try {
    unpack_content(content, options.output_dir, config, writer, on_skip);
  } catch (const PipelineError &e) {
    return report(err, e.tag(), e.what());
  }
  return 0;
}

int run(int argc, char **argv, std::istream &in, std::ostream &out,
        std::ostream &err) {
  const char *program = argc > 0 ? argv[0] : "txtpack";
  const DelimiterConfig config;
  const Options options(argc, argv, config.default_search_path());

  if (!options.usage_error.empty()) {
    err << program << ": " << options.usage_error << '\n' << usage(program);
    return 2;
  }

  try {
    switch (options.command) {
    case Options::Command::Help:
      out << usage(program);
      return 0;
    case Options::Command::Pack:
      return run_pack(options, config, out, err);
    case Options::Command::Unpack:
      return run_unpack(options, config, in, err);
    case Options::Command::None:
      break;
    }
  } catch (const std::exception &e) {
    err << "error: " << e.what() << '\n';
    return 1;
  }

  err << usage(program);
  return 2;
}
} // namespace txtpack::cli
