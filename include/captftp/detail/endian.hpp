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
 * @file endian.hpp
 * @brief This file defines constexpr byte-order conversions for the 16-bit
 * fields of the TFTP wire format.
 */
#pragma once
#ifndef CAPTFTP_ENDIAN_HPP
#define CAPTFTP_ENDIAN_HPP
#include <array>
#include <bit>
#include <cstdint>
/** @brief Defines internal captftp implementation details. */
namespace captftp::detail {
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)

/**
 * @brief Converts a 16-bit unsigned integer from host to network byte order.
 * @param hostshort The 16-bit unsigned integer in host byte order.
 * @returns The 16-bit unsigned integer in network byte order.
 */
constexpr auto htons_(const std::uint16_t hostshort) noexcept -> std::uint16_t
{
  if constexpr (std::endian::native == std::endian::little)
  {
    return static_cast<std::uint16_t>((hostshort << 8) | (hostshort >> 8));
  }
  return hostshort;
}

/**
 * @brief Converts a 16-bit unsigned integer from network to host byte order.
 * @param netshort The 16-bit unsigned integer in network byte order.
 * @returns The 16-bit unsigned integer in host byte order.
 */
constexpr auto ntohs_(const std::uint16_t netshort) noexcept -> std::uint16_t
{
  if constexpr (std::endian::native == std::endian::little)
  {
    return static_cast<std::uint16_t>((netshort >> 8) | (netshort << 8));
  }
  return netshort;
}

/**
 * @brief Splits a host order 16-bit value into its two wire bytes.
 * @param value The value in host byte order.
 * @returns The big-endian byte pair.
 */
constexpr auto to_bytes(const std::uint16_t value) noexcept
    -> std::array<char, 2>
{
  return {static_cast<char>(value >> 8), static_cast<char>(value & 0xFF)};
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
} // namespace captftp::detail
#endif // CAPTFTP_ENDIAN_HPP
