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
 * @file argument_parser.hpp
 * @brief This file declares a CLI argument parser.
 */
#pragma once
#ifndef CAPTFTP_ARGUMENT_PARSER_HPP
#define CAPTFTP_ARGUMENT_PARSER_HPP
#include <span>
#include <string_view>
#include <vector>
/** @brief For internal captftp server implementation details. */
namespace captftp::detail {
/** @brief A command line argument parser. */
struct argument_parser {
  /** @brief Command-line arguments are parsed into options. */
  struct option {
    /** @brief option flag. */
    std::string_view flag;
    /** @brief option value. */
    std::string_view value;

    /**
     * @brief Checks the flag against its short and long spelling.
     * @param short_flag e.g. "-p".
     * @param long_flag e.g. "--port".
     * @returns true if the flag is either one.
     */
    [[nodiscard]] auto is(std::string_view short_flag,
                          std::string_view long_flag) const noexcept -> bool;
  };
  /**
   * @brief Parse all command-line arguments.
   * @details The first argument is the program name and is skipped. A flag
   * takes at most one value, either the next argument when that is not a
   * flag or, for long flags, the text after '='. Values without a flag are
   * returned with an empty flag.
   * @param args The command line arguments to parse.
   * @returns The options in command-line order.
   */
  static auto parse(std::span<char const *const> args) -> std::vector<option>;
  /**
   * @brief Parse all command-line arguments.
   * @param argc The number of command-line arguments.
   * @param argv The command-line arguments.
   * @returns The options in command-line order.
   */
  static auto parse(int argc,
                    char const *const *argv) -> std::vector<option>
  {
    return parse({argv, static_cast<std::size_t>(argc)});
  }
};
} // namespace captftp::detail
#endif // CAPTFTP_ARGUMENT_PARSER_HPP
