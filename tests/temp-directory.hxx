#pragma once

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <random>
#include <string>
#include <string_view>

/**
 * @brief Test fixture owning a fresh directory under the system temp path.
 *
 * The directory is removed again in TearDown().
 */
class TempDirectoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = std::filesystem::temp_directory_path() /
            ("txtpack-" + std::string(info->name()) + "-" +
             std::to_string(rd()));
    std::filesystem::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  /// @brief Create @p relative (and its parents) holding @p content.
  std::filesystem::path create_file(const std::string &relative,
                                    std::string_view content) const {
    const auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return path;
  }

  /// @brief Whole content of @p path, read in binary mode.
  static std::string read_file(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in),
            std::istreambuf_iterator<char>{}};
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};
