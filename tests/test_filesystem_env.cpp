/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * captftpd is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * captftpd is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with captftpd.  If not, see <https://www.gnu.org/licenses/>.
 */

// NOLINTBEGIN
#include "captftp/filesystem.hpp"

#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>

using namespace captftp::filesystem;

class RootDirectoryEnvTest : public ::testing::Test {};

TEST_F(RootDirectoryEnvTest, ReturnsCustomPathWhenEnvSet)
{
  const char *env_path = std::getenv(root_env);

  ASSERT_NE(env_path, nullptr) << root_env << " must be set to run this test";
  ASSERT_EQ(std::string(env_path), "/custom/test/path")
      << root_env << " must be set to '/custom/test/path'";

  const auto &path = root_directory();

  EXPECT_EQ(path, std::filesystem::path("/custom/test/path"));
}

TEST_F(RootDirectoryEnvTest, ResolvesRelativeFilenamesUnderRoot)
{
  ASSERT_NE(std::getenv(root_env), nullptr);

  EXPECT_EQ(resolve("cap.bin"),
            std::filesystem::path("/custom/test/path/cap.bin"));
  EXPECT_EQ(resolve("dir/cap.bin"),
            std::filesystem::path("/custom/test/path/dir/cap.bin"));
  EXPECT_EQ(resolve("/abs/cap.bin"), std::filesystem::path("/abs/cap.bin"));
}
// NOLINTEND
