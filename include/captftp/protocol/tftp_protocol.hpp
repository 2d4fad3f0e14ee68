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
 * @file tftp_protocol.hpp
 * @brief This file declares the TFTP protocol definitions.
 */
#pragma once
#ifndef CAPTFTP_TFTP_PROTOCOL_HPP
#define CAPTFTP_TFTP_PROTOCOL_HPP
#include "captftp/detail/endian.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
/** @brief Capture file transfer services. */
namespace captftp {
// NOLINTBEGIN(performance-enum-size)
/** @brief A struct to contain TFTP message layouts and protocol
 * definitions. */
struct messages {
  /**
   * @brief Protocol defined operations (opcodes).
   * These are the valid TFTP operation codes as defined in RFC 1350.
   */
  enum opcode_t : std::uint16_t { RRQ = 1, WRQ, DATA, ACK, ERROR };

  /**
   * @brief Protocol defined error codes.
   * These are the standard TFTP error codes as defined in RFC 1350.
   */
  enum error_t : std::uint16_t {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND,
    ACCESS_VIOLATION,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_ALREADY_EXISTS,
    NO_SUCH_USER,
    // Errors below this point are all ALIASES to NOT_DEFINED.
    TIMED_OUT,
    // Terminates a transfer without notifying the peer.
    ABORTED
  };

  /**
   * @brief A decoded read or write request.
   * @details The views point into the datagram that was decoded.
   */
  struct request {
    /** @brief Operation Code (RRQ or WRQ). */
    std::uint16_t opc;
    /** @brief The requested filename. */
    std::string_view filename;
    /** @brief The transfer mode, empty if the client sent none. */
    std::string_view mode;
  };

  /** @brief A decoded DATA message. */
  struct data {
    /** @brief Block number (starts at 1). */
    std::uint16_t block_num;
    /** @brief The payload, at most DATALEN bytes. */
    std::span<const std::byte> payload;
  };

  /** @brief A decoded ACK message. */
  struct ack {
    /** @brief The acknowledged block number. */
    std::uint16_t block_num;
  };

  /** @brief A decoded ERROR message. */
  struct error {
    /** @brief Error code from error_t enum. */
    std::uint16_t code;
    /** @brief The error message. */
    std::string_view message;
  };

  /** @brief The size of the opcode field. */
  static constexpr auto OPCLEN = sizeof(std::uint16_t);
  /** @brief The size of the DATA, ACK and ERROR headers. */
  static constexpr auto HEADERLEN = 2 * sizeof(std::uint16_t);
  /** @brief The maximum data payload size in bytes (512 bytes per RFC 1350). */
  static constexpr auto DATALEN = 512UL;
  /** @brief The maximum total size of a DATA message (header + payload). */
  static constexpr auto DATAMSG_MAXLEN = HEADERLEN + DATALEN;
};
// NOLINTEND(performance-enum-size)

/** @brief Error messages. */
struct errors {
  /**
   * @brief Converts a TFTP error to a string.
   * @param error The TFTP error.
   * @returns A string_view containing the relevant error message.
   */
  static constexpr auto errstr(std::uint16_t error) noexcept -> std::string_view
  {
    using enum messages::error_t;
    switch (error)
    {
      case ACCESS_VIOLATION:
        return "Access violation.";

      case FILE_NOT_FOUND:
        return "File not found.";

      case DISK_FULL:
        return "Disk full.";

      case NO_SUCH_USER:
        return "No such user.";

      case FILE_ALREADY_EXISTS:
        return "File already exists.";

      case UNKNOWN_TID:
        return "Unknown TID.";

      case ILLEGAL_OPERATION:
        return "Illegal operation.";

      case TIMED_OUT:
        return "Timed out.";

      case ABORTED:
        return "Aborted.";

      default:
        return "Not defined.";
    }
  }
};

} // namespace captftp
#endif // CAPTFTP_TFTP_PROTOCOL_HPP
