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
/**
 * @file filesystem.cpp
 * @brief This file implements filesystem utilities.
 */
#include "captftp/filesystem.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <format>

#include <unistd.h>
namespace captftp::filesystem {
auto count() noexcept -> std::atomic<std::uint16_t> &
{
  static auto count = std::atomic<std::uint16_t>(0);
  return count;
}

auto temp_directory(std::error_code &err) noexcept
    -> const std::filesystem::path &
{
  static const auto [path, error] = []() noexcept {
    auto init_err = std::error_code();
    auto path = std::filesystem::temp_directory_path(init_err);
    return std::pair{path, init_err};
  }();

  err = error;
  return path;
}

auto root_directory() noexcept -> const std::filesystem::path &
{
  static const auto root_path = []() noexcept {
    if (const char *path = std::getenv(root_env))
      return std::filesystem::path(path);

    return std::filesystem::path();
  }();

  return root_path;
}

auto resolve(std::string_view filename) -> std::filesystem::path
{
  auto path = std::filesystem::path(filename);
  if (path.is_absolute())
    return path;

  return root_directory() / path;
}

auto tmpname() -> std::filesystem::path
{
  std::error_code err;
  return (temp_directory(err) / prefix)
      .concat(std::format("{}.{:05d}", ::getpid(), count()++));
}

// NOLINTBEGIN(cppcoreguidelines-owning-memory)
auto touch(const std::filesystem::path &file) -> std::error_code
{
  auto *fstream = std::fopen(file.c_str(), "a");
  if (!fstream)
    return {errno, std::system_category()};

  (void)std::fclose(fstream);
  return {};
}
// NOLINTEND(cppcoreguidelines-owning-memory)

auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::shared_ptr<std::fstream>
{
  err.clear();
  auto fstream =
      std::make_shared<std::fstream>(file, std::ios::in | std::ios::binary);
  if (!fstream->is_open())
  {
    if (!std::filesystem::exists(file, err))
    {
      if (!err)
        err = std::make_error_code(std::errc::no_such_file_or_directory);
      return {};
    }

    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  // Directories open successfully but fail on the first read.
  if (std::filesystem::is_directory(file, err))
    err = std::make_error_code(std::errc::is_a_directory);

  if (err)
    return {};

  return fstream;
}

auto open_write(const std::filesystem::path &file, std::filesystem::path &tmp,
                bool &created,
                std::error_code &err) -> std::shared_ptr<std::fstream>
{
  err.clear();
  created = false;

  if (std::filesystem::is_directory(file, err))
  {
    err = std::make_error_code(std::errc::is_a_directory);
    return {};
  }

  created = !std::filesystem::exists(file, err);
  if (err)
    return {};

  err = touch(file);
  if (err)
  {
    created = false;
    return {};
  }

  tmp = tmpname();
  auto fstream = std::make_shared<std::fstream>(
      tmp, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!fstream->is_open())
  {
    tmp.clear();
    err = std::make_error_code(std::errc::permission_denied);
    return {};
  }

  return fstream;
}

auto commit(const std::filesystem::path &tmp,
            const std::filesystem::path &file) -> std::error_code
{
  using std::filesystem::copy_options;

  auto err = std::error_code();
  std::filesystem::rename(tmp, file, err);
  if (err != std::errc::cross_device_link)
    return err;

  if (!std::filesystem::copy_file(tmp, file, copy_options::overwrite_existing,
                                  err))
  {
    return err;
  }

  std::filesystem::remove(tmp, err);
  return err;
}
} // namespace captftp::filesystem
