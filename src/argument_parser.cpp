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
 * @file argument_parser.cpp
 * @brief This file implements a CLI argument parser.
 */
#include "captftp/detail/argument_parser.hpp"
namespace captftp::detail {
namespace {
using option = argument_parser::option;

auto is_flag(std::string_view token) noexcept -> bool
{
  return token.starts_with('-');
}

/** @brief Splits "--name=value" at the first '='. */
auto split_long_flag(std::string_view token) noexcept -> option
{
  if (token.size() < 3 || !token.starts_with("--"))
    return {.flag = token};

  const auto delim = token.find('=');
  if (delim == std::string_view::npos)
    return {.flag = token};

  return {.flag = token.substr(0, delim), .value = token.substr(delim + 1)};
}

/** @brief A bare '-' or '--', or a flag that has its value already, takes
 * nothing from the next argument. */
auto takes_value(const option &opt) noexcept -> bool
{
  return opt.value.empty() &&
         opt.flag.find_first_not_of('-') != std::string_view::npos;
}
} // namespace

auto argument_parser::option::is(std::string_view short_flag,
                                 std::string_view long_flag) const noexcept
    -> bool
{
  return !flag.empty() && (flag == short_flag || flag == long_flag);
}

auto argument_parser::parse(std::span<char const *const> args)
    -> std::vector<option>
{
  auto options = std::vector<option>();

  for (std::size_t i = 1; i < args.size(); ++i)
  {
    const auto token = std::string_view(args[i]);
    if (!is_flag(token))
    {
      options.push_back({.value = token});
      continue;
    }

    auto opt = split_long_flag(token);
    if (takes_value(opt) && i + 1 < args.size() && !is_flag(args[i + 1]))
      opt.value = args[++i];

    options.push_back(opt);
  }

  return options;
}
} // namespace captftp::detail
