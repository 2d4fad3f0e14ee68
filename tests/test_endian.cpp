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
#include "captftp/detail/endian.hpp"

#include <gtest/gtest.h>

#include <cstdint>

using namespace captftp::detail;

struct EndianTest16
    : public ::testing::TestWithParam<std::pair<std::uint16_t, std::uint16_t>> {
};

TEST_P(EndianTest16, HostToNetworkAndBack)
{
  const auto [value, swapped] = GetParam();

  if constexpr (std::endian::native == std::endian::little)
  {
    EXPECT_EQ(htons_(value), swapped);
    EXPECT_EQ(ntohs_(swapped), value);
  }
  else
  {
    EXPECT_EQ(htons_(value), value);
    EXPECT_EQ(ntohs_(value), value);
  }
}

TEST_P(EndianTest16, ToBytesIsBigEndian)
{
  const auto [value, swapped] = GetParam();
  const auto bytes = to_bytes(value);

  EXPECT_EQ(static_cast<unsigned char>(bytes[0]), value >> 8);
  EXPECT_EQ(static_cast<unsigned char>(bytes[1]), value & 0xFF);
}

INSTANTIATE_TEST_SUITE_P(
    EndianTests, EndianTest16,
    ::testing::Values(std::make_pair(std::uint16_t{0x0000},
                                     std::uint16_t{0x0000}),
                      std::make_pair(std::uint16_t{0x0001},
                                     std::uint16_t{0x0100}),
                      std::make_pair(std::uint16_t{0x1234},
                                     std::uint16_t{0x3412}),
                      std::make_pair(std::uint16_t{0xFF00},
                                     std::uint16_t{0x00FF}),
                      std::make_pair(std::uint16_t{0xFFFF},
                                     std::uint16_t{0xFFFF})));

static_assert(htons_(0x0102) == ntohs_(0x0102));
static_assert(to_bytes(0x0A0B)[0] == 0x0A);
