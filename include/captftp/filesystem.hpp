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
 * @file filesystem.hpp
 * @brief This file declares functions for filesystem management.
 */
#pragma once
#ifndef CAPTFTP_FILESYSTEM_HPP
#define CAPTFTP_FILESYSTEM_HPP
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string_view>
#include <system_error>
/** @brief For capture file storage management. */
namespace captftp::filesystem {
/** @brief The temporary file prefix used for generating temporary filenames. */
constexpr auto prefix = "captftp.";
/** @brief The environment variable holding the root directory. */
constexpr auto root_env = "CAPTFTP_ROOT";

/**
 * @brief Returns a reference to the atomic counter for temporary file
 * generation.
 * @return Reference to an atomic uint16_t counter used for unique filename
 * generation.
 */
auto count() noexcept -> std::atomic<std::uint16_t> &;

/**
 * @brief Returns the system-defined temporary files directory.
 * @param err Output parameter for error reporting if directory cannot be
 * determined.
 * @return Const reference to the temporary directory path.
 */
auto temp_directory(std::error_code &err) noexcept
    -> const std::filesystem::path &;

/**
 * @brief Returns the directory that relative filenames are served from.
 * @details Read once from CAPTFTP_ROOT. Empty when the variable is unset,
 * in which case relative filenames resolve against the working directory.
 * @return Const reference to the root directory path.
 */
auto root_directory() noexcept -> const std::filesystem::path &;

/**
 * @brief Resolves a requested filename.
 * @param filename The filename from a TFTP request.
 * @return The filename itself if it is absolute, otherwise the filename
 * appended to root_directory().
 */
auto resolve(std::string_view filename) -> std::filesystem::path;

/**
 * @brief Generates the next available temporary filename.
 * @return Path to a uniquely generated temporary file (not yet created).
 */
auto tmpname() -> std::filesystem::path;

/**
 * @brief Creates a file or updates its modification time if it exists.
 * @param file Path to the file to touch.
 * @return Error code indicating success or failure of the operation.
 */
auto touch(const std::filesystem::path &file) -> std::error_code;

/**
 * @brief Opens a file for reading.
 * @param file The file to open.
 * @param[out] err An error code that is cleared on success and set on error.
 * `no_such_file_or_directory` if the file does not exist,
 * `is_a_directory` for directories and `permission_denied` otherwise.
 * @returns A shared pointer to an open file stream.
 */
auto open_read(const std::filesystem::path &file,
               std::error_code &err) -> std::shared_ptr<std::fstream>;

/**
 * @brief Opens a file for writing.
 * @details Writing a file to disk involves writing data to a
 * temporary file then committing it to the target destination. The target
 * is touched up front to check that it can be written.
 * @param file The file to open.
 * @param[out] tmp The path of the temporary file.
 * @param[out] created Set if touching the target created it.
 * @param[out] err An error code that is cleared on success and set on error.
 * @returns A shared pointer to an open file stream.
 */
auto open_write(const std::filesystem::path &file, std::filesystem::path &tmp,
                bool &created,
                std::error_code &err) -> std::shared_ptr<std::fstream>;

/**
 * @brief Moves a completed temporary file onto its target.
 * @details Falls back to copying when the temporary directory is on a
 * different filesystem than the target.
 * @param tmp The temporary file.
 * @param file The target.
 * @return Error code indicating success or failure of the operation.
 */
auto commit(const std::filesystem::path &tmp,
            const std::filesystem::path &file) -> std::error_code;
} // namespace captftp::filesystem
#endif // CAPTFTP_FILESYSTEM_HPP
