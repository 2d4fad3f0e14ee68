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
 * @file tftp_session.hpp
 * @brief This file declares a TFTP session handle.
 */
#pragma once
#ifndef CAPTFTP_TFTP_SESSION_HPP
#define CAPTFTP_TFTP_SESSION_HPP
#include <net/timers/timers.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
/** @brief Capture file transfer services. */
namespace captftp {

/**
 * @brief A TFTP session holds all of the state of one transfer with one
 * client address.
 */
struct session {
  /** @brief The session clock. */
  using clock = std::chrono::steady_clock;
  /** @brief The session timestamp. */
  using timestamp = clock::time_point;
  /** @brief the session duration. */
  using duration = std::chrono::milliseconds;
  /** @brief The session timer. */
  using timer_id = net::timers::timer_id;
  /** @brief The invalid timer value. */
  static constexpr auto INVALID_TIMER = net::timers::INVALID_TIMER;
  /** @brief Timeout min value. */
  static constexpr auto TIMEOUT_MIN = std::chrono::milliseconds(2);
  /** @brief Timeout max value. */
  static constexpr auto TIMEOUT_MAX = std::chrono::milliseconds(200);
  /** @brief Retransmissions of the last packet before giving up. */
  static constexpr auto MAX_RETRIES = 5;

  /**
   * @brief Transfer states.
   * @details Reads stay in AWAITING_ACK until the short block is
   * acknowledged. Writes stay in AWAITING_DATA until the short block is
   * received, then linger in COMPLETE to re-acknowledge it.
   */
  enum status_t : std::uint8_t {
    START = 0,
    AWAITING_ACK,
    AWAITING_DATA,
    COMPLETE,
    ABORTED
  };

  /** @brief The session state. */
  struct state_t {
    /** @brief The requested filepath. */
    std::filesystem::path target;
    /** @brief The temporary filepath. */
    std::filesystem::path tmp;
    /** @brief Failure text sent with UNKNOWN_TID errors. */
    std::string errmsg;
    /** @brief The last packet sent, kept for retransmission. */
    std::shared_ptr<std::vector<char>> packet;
    /** @brief The fstream associated with the operation. */
    std::shared_ptr<std::fstream> file;
    /** @brief RTT statistics aggregate type. */
    struct statistics_t {
      /** @brief Used to mark the start time of an interval. */
      timestamp start_time{clock::now() - TIMEOUT_MAX / 2};
      /** @brief The aggregate avg round trip time. */
      duration avg_rtt{TIMEOUT_MAX};
    };
    /** @brief RTT statistics. */
    statistics_t statistics;
    /** @brief A timer id associated to the TFTP session. */
    timer_id timer{INVALID_TIMER};
    /** @brief Payload length of the last DATA sent or received. */
    std::size_t payload_len = 0;
    /** @brief The current protocol block number. */
    std::uint16_t block_num = 0;
    /** @brief The file operation. */
    std::uint16_t opc = 0;
    /** @brief Where the transfer is. */
    status_t status = START;
    /** @brief Set if the write target was created by this session. */
    bool created = false;
  };

  /** @brief The session state. */
  state_t state;
};

} // namespace captftp
#endif // CAPTFTP_TFTP_SESSION_HPP
