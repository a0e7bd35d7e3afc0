#pragma once

#include "cli-options.hxx"

#include <txtpack/delimiter-config.hxx>

#include <iosfwd>

namespace txtpack::cli {
/**
 * @brief Pack the files selected by @p options to @p out.
 * @return 0 on success, 1 after printing `error: <tag>: ...` to @p err.
 */
int run_pack(const Options &options, const DelimiterConfig &config,
             std::ostream &out, std::ostream &err);

/**
 * @brief Unpack @p in (or options.input) into options.output_dir.
 * @return 0 on success, 1 after printing `error: <tag>: ...` to @p err.
 */
int run_unpack(const Options &options, const DelimiterConfig &config,
               std::istream &in, std::ostream &err);

/// @brief Parse @p argv and dispatch; the body of main().
int run(int argc, char **argv, std::istream &in, std::ostream &out,
        std::ostream &err);
} // namespace txtpack::cli
