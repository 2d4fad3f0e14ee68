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
 * @file codec.cpp
 * @brief This file defines the TFTP packet encoders and decoders.
 */
#include "captftp/protocol/codec.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstring>
#include <string>
namespace captftp {
/** @brief The codec_errc error category. */
class codec_error_category final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override
  {
    return "captftp.codec";
  }

  [[nodiscard]] auto message(int err) const -> std::string override
  {
    switch (static_cast<codec_errc>(err))
    {
      case codec_errc::malformed_packet:
        return "Malformed packet.";

      case codec_errc::unknown_opcode:
        return "Unknown opcode.";

      case codec_errc::unexpected_opcode:
        return "Unexpected opcode.";

      default:
        return "Unknown error.";
    }
  }
};

auto codec_category() noexcept -> const std::error_category &
{
  static const auto category = codec_error_category();
  return category;
}

auto make_error_code(codec_errc err) noexcept -> std::error_code
{
  return {static_cast<int>(err), codec_category()};
}
} // namespace captftp

namespace captftp::codec {
/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] static constexpr auto
strnlen(const char *str, std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

/** @brief Converts a null terminated string to a view, empty if the
 * terminator is missing. */
static inline auto to_view(std::span<const std::byte> buf) -> std::string_view
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *str = reinterpret_cast<const char *>(buf.data());
  const auto len = strnlen(str, buf.size());
  if (len == buf.size())
    return {};

  return {str, len};
}

/** @brief Reads the 16-bit network order field at offset. */
static inline auto read_u16(std::span<const std::byte> buf,
                            std::size_t offset) noexcept -> std::uint16_t
{
  auto value = std::uint16_t();
  std::memcpy(&value, buf.subspan(offset, sizeof(value)).data(),
              sizeof(value));
  return detail::ntohs_(value);
}

/** @brief Appends a 16-bit field in network order. */
static inline auto put_u16(std::vector<char> &buf,
                           std::uint16_t value) -> void
{
  const auto bytes = detail::to_bytes(value);
  buf.insert(buf.end(), bytes.begin(), bytes.end());
}

/** @brief Checks the datagram is at least len bytes and carries opc. */
static inline auto expect(std::span<const std::byte> buf, std::uint16_t opc,
                          std::size_t len, std::error_code &err) noexcept
    -> bool
{
  const auto decoded = decode_opcode(buf, err);
  if (err)
    return false;

  if (buf.size() < len)
  {
    err = codec_errc::malformed_packet;
    return false;
  }

  if (decoded != opc)
  {
    err = codec_errc::unexpected_opcode;
    return false;
  }

  return true;
}

auto decode_opcode(std::span<const std::byte> buf,
                   std::error_code &err) noexcept -> std::uint16_t
{
  using enum messages::opcode_t;

  err.clear();
  if (buf.size() < messages::OPCLEN)
  {
    err = codec_errc::malformed_packet;
    return 0;
  }

  const auto opc = read_u16(buf, 0);
  if (opc < RRQ || opc > ERROR)
    err = codec_errc::unknown_opcode;

  return opc;
}

auto decode_request(std::span<const std::byte> buf,
                    std::error_code &err) noexcept -> messages::request
{
  using enum messages::opcode_t;

  const auto opc = decode_opcode(buf, err);
  if (err)
    return {};

  if (opc != RRQ && opc != WRQ)
  {
    err = codec_errc::unexpected_opcode;
    return {};
  }

  auto req = messages::request{.opc = opc};
  auto rest = buf.subspan(messages::OPCLEN);

  req.filename = to_view(rest);
  if (req.filename.empty())
  {
    err = codec_errc::malformed_packet;
    return {};
  }

  rest = rest.subspan(req.filename.size() + 1);
  req.mode = to_view(rest);
  return req;
}

auto encode_request(std::uint16_t opc, std::string_view filename,
                    std::string_view mode) -> std::vector<char>
{
  auto buf = std::vector<char>();
  buf.reserve(messages::OPCLEN + filename.size() + mode.size() + 2);

  put_u16(buf, opc);
  buf.insert(buf.end(), filename.begin(), filename.end());
  buf.push_back('\0');
  buf.insert(buf.end(), mode.begin(), mode.end());
  buf.push_back('\0');
  return buf;
}

auto encode_data(std::uint16_t block_num,
                 std::span<const char> payload) -> std::vector<char>
{
  using enum messages::opcode_t;
  assert(payload.size() <= messages::DATALEN &&
         "DATA payloads must be chunked into at most 512 bytes.");

  auto buf = std::vector<char>();
  buf.reserve(messages::HEADERLEN + payload.size());

  put_u16(buf, DATA);
  put_u16(buf, block_num);
  buf.insert(buf.end(), payload.begin(), payload.end());
  return buf;
}

auto decode_data(std::span<const std::byte> buf,
                 std::error_code &err) noexcept -> messages::data
{
  using enum messages::opcode_t;

  if (!expect(buf, DATA, messages::HEADERLEN, err))
    return {};

  if (buf.size() > messages::DATAMSG_MAXLEN)
  {
    err = codec_errc::malformed_packet;
    return {};
  }

  return {.block_num = read_u16(buf, messages::OPCLEN),
          .payload = buf.subspan(messages::HEADERLEN)};
}

auto encode_ack(std::uint16_t block_num) -> std::vector<char>
{
  using enum messages::opcode_t;

  auto buf = std::vector<char>();
  buf.reserve(messages::HEADERLEN);

  put_u16(buf, ACK);
  put_u16(buf, block_num);
  return buf;
}

auto decode_ack(std::span<const std::byte> buf,
                std::error_code &err) noexcept -> messages::ack
{
  using enum messages::opcode_t;

  if (!expect(buf, ACK, messages::HEADERLEN, err))
    return {};

  return {.block_num = read_u16(buf, messages::OPCLEN)};
}

auto encode_error(std::uint16_t code,
                  std::string_view message) -> std::vector<char>
{
  using enum messages::opcode_t;

  message = message.substr(0, message.find('\0'));

  auto buf = std::vector<char>();
  buf.reserve(messages::HEADERLEN + message.size() + 1);

  put_u16(buf, ERROR);
  put_u16(buf, code);
  buf.insert(buf.end(), message.begin(), message.end());
  buf.push_back('\0');
  return buf;
}

auto error_packet(std::uint16_t code) -> const std::vector<char> &
{
  using enum messages::error_t;

  static const auto packets = [] {
    auto packets = std::array<std::vector<char>, ABORTED>();
    for (std::uint16_t err = 0; err < packets.size(); ++err)
    {
      packets[err] = encode_error(err < TIMED_OUT ? err : NOT_DEFINED,
                                  errors::errstr(err));
    }
    return packets;
  }();

  return code < packets.size() ? packets[code] : packets[NOT_DEFINED];
}

auto decode_error(std::span<const std::byte> buf,
                  std::error_code &err) noexcept -> messages::error
{
  using enum messages::opcode_t;

  if (!expect(buf, ERROR, messages::HEADERLEN, err))
    return {};

  const auto rest = buf.subspan(messages::HEADERLEN);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *str = reinterpret_cast<const char *>(rest.data());

  // Tolerate a missing terminator, the message ends with the datagram.
  return {.code = read_u16(buf, messages::OPCLEN),
          .message = {str, strnlen(str, rest.size())}};
}
} // namespace captftp::codec
