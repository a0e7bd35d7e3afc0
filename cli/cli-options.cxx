#include "cli-options.hxx"

#include <getopt.h>
#include <unistd.h>

#include <utility>

namespace txtpack::cli {
Options::Options(int argc, char **argv, std::string default_directory)
    : directory(std::move(default_directory)) {
  if (argc < 2) {
    usage_error = "missing command";
    return;
  }

  const std::string cmd = argv[1];
  if (cmd == "pack")
    command = Command::Pack;
  else if (cmd == "unpack")
    command = Command::Unpack;
  else if (cmd == "-h" || cmd == "--help" || cmd == "help") {
    command = Command::Help;
    return;
  } else {
    usage_error = "unknown command '" + cmd + "'";
    return;
  }

  static const option long_options[] = {
      /*   NAME          ARGUMENT           FLAG     SHORTNAME */
      {"directory",  required_argument, nullptr, 'd'},
      {"input",      required_argument, nullptr, 'i'},
      {"output-dir", required_argument, nullptr, 'o'},
      {"verbose",    no_argument,       nullptr, 'v'},
      {"help",       no_argument,       nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  // Options are parsed after the command word, which stands in for argv[0].
  // optind = 0 makes glibc reinitialise its scanner for repeated calls.
  int sub_argc = argc - 1;
  char **sub_argv = argv + 1;
  optind = 0;
  opterr = 0;

  int c;
  int option_index = 0;
  while ((c = getopt_long(sub_argc, sub_argv, "d:i:o:vh", long_options,
                          &option_index)) != -1) {
    switch (c) {
    case 'd':
      directory = optarg;
      break;
    case 'i':
      input = std::filesystem::path(optarg);
      break;
    case 'o':
      output_dir = optarg;
      break;
    case 'v':
      verbose = true;
      break;
    case 'h':
      command = Command::Help;
      return;
    default:
      usage_error = "invalid option for '" + cmd + "'";
      return;
    }
  }

  if (command == Command::Pack) {
    if (optind < sub_argc)
      pattern = sub_argv[optind++];
    else
      usage_error = "pack requires a PATTERN";
  }

  if (usage_error.empty() && optind < sub_argc)
    usage_error = "unexpected argument '" + std::string(sub_argv[optind]) + "'";
}

std::string usage(const char *program) {
  std::string p = program ? program : "txtpack";
  return "usage: " + p +
         " pack PATTERN [-d|--directory DIR] [-v|--verbose]\n"
         "       " +
         p +
         " unpack [-i|--input FILE] [-o|--output-dir DIR] [-v|--verbose]\n"
         "\n"
         "PATTERN is a glob (e.g. '*.txt') or, when anchored with ^/$ or\n"
         "using regex syntax, a regular expression matched against paths\n"
         "relative to DIR. Packed output goes to stdout; unpack reads stdin\n"
         "unless --input is given.\n";
}
} // namespace txtpack::cli
