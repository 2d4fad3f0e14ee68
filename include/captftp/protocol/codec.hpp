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
 * @file codec.hpp
 * @brief This file declares the TFTP packet encoders and decoders.
 * @details Decoders accept arbitrary bytes. They never read past the end of
 * the buffer and report malformed input through a std::error_code.
 */
#pragma once
#ifndef CAPTFTP_CODEC_HPP
#define CAPTFTP_CODEC_HPP
#include "tftp_protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>
namespace captftp {
/** @brief Packet decoding errors. */
enum class codec_errc : std::uint8_t {
  /** @brief The datagram is too short or too long for its opcode. */
  malformed_packet = 1,
  /** @brief The opcode is not one of RRQ, WRQ, DATA, ACK or ERROR. */
  unknown_opcode,
  /** @brief The opcode is valid but not the one being decoded. */
  unexpected_opcode
};

/**
 * @brief The error category of codec_errc.
 * @returns A reference to the category singleton.
 */
auto codec_category() noexcept -> const std::error_category &;

/**
 * @brief Makes a std::error_code from a codec error.
 * @param err The codec error.
 * @returns The error code.
 */
auto make_error_code(codec_errc err) noexcept -> std::error_code;
} // namespace captftp

template <>
struct std::is_error_code_enum<captftp::codec_errc> : std::true_type {};

/** @brief TFTP wire format encoding and decoding. */
namespace captftp::codec {
/**
 * @brief Decodes the opcode of a datagram.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set if the datagram is shorter than an
 * opcode or the opcode is unknown.
 * @returns The opcode in host byte order, 0 if the datagram is too short.
 */
auto decode_opcode(std::span<const std::byte> buf,
                   std::error_code &err) noexcept -> std::uint16_t;

/**
 * @brief Decodes an RRQ or WRQ.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set if the filename is empty or
 * unterminated.
 * @returns The request. The filename and mode view into buf.
 */
auto decode_request(std::span<const std::byte> buf,
                    std::error_code &err) noexcept -> messages::request;

/**
 * @brief Encodes an RRQ or WRQ.
 * @param opc RRQ or WRQ.
 * @param filename The filename, must not contain a null byte.
 * @param mode The transfer mode.
 * @returns The encoded request.
 */
auto encode_request(std::uint16_t opc, std::string_view filename,
                    std::string_view mode = "octet") -> std::vector<char>;

/**
 * @brief Encodes a DATA message.
 * @param block_num The block number.
 * @param payload At most messages::DATALEN bytes.
 * @returns The encoded message, payload.size() + 4 bytes long.
 */
auto encode_data(std::uint16_t block_num,
                 std::span<const char> payload) -> std::vector<char>;

/**
 * @brief Decodes a DATA message.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set if buf is not a DATA message of
 * 4 to 516 bytes.
 * @returns The block number and a view of the payload inside buf.
 */
auto decode_data(std::span<const std::byte> buf,
                 std::error_code &err) noexcept -> messages::data;

/**
 * @brief Encodes an ACK message.
 * @param block_num The acknowledged block number.
 * @returns The 4 byte encoded message.
 */
auto encode_ack(std::uint16_t block_num) -> std::vector<char>;

/**
 * @brief Decodes an ACK message.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set if buf is not an ACK message.
 * @returns The acknowledged block number.
 */
auto decode_ack(std::span<const std::byte> buf,
                std::error_code &err) noexcept -> messages::ack;

/**
 * @brief Encodes an ERROR message.
 * @param code The TFTP error code.
 * @param message ASCII text. Anything after an embedded null byte is dropped.
 * @returns The encoded, null terminated, message.
 */
auto encode_error(std::uint16_t code,
                  std::string_view message) -> std::vector<char>;

/**
 * @brief Looks up the ERROR message sent for an error code.
 * @details The packets are encoded once with encode_error() and
 * errors::errstr(), and live until the program exits. TIMED_OUT goes on the
 * wire as NOT_DEFINED, codes without a text of their own map to the
 * NOT_DEFINED packet.
 * @param code The TFTP error code.
 * @returns The encoded message.
 */
auto error_packet(std::uint16_t code) -> const std::vector<char> &;

/**
 * @brief Decodes an ERROR message.
 * @param buf The datagram.
 * @param[out] err Cleared on success, set if buf is not an ERROR message.
 * @returns The error code and a view of the message inside buf.
 */
auto decode_error(std::span<const std::byte> buf,
                  std::error_code &err) noexcept -> messages::error;
} // namespace captftp::codec
#endif // CAPTFTP_CODEC_HPP
