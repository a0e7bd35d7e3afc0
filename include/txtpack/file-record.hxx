#pragma once

#include <string>

namespace txtpack {
/**
 * @struct FileRecord
 * @brief One file travelling through pack or unpack.
 *
 * On the pack side @ref content holds the raw file bytes; on the unpack side
 * it holds the payload decoded from the packed buffer.
 */
struct FileRecord {
  std::string filename;
  std::string content;

  bool operator==(const FileRecord &) const = default;
};
} // namespace txtpack
