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
 * @file tftp_server.hpp
 * @brief This file declares the TFTP server.
 */
#pragma once
#ifndef CAPTFTP_TFTP_SERVER_HPP
#define CAPTFTP_TFTP_SERVER_HPP
#include "captftp.hpp"

#include <net/cppnet.hpp>

#include <string_view>
/** @namespace For top-level captftp services. */
namespace captftp {
/** @brief TFTP max buffer allocation. */
static constexpr auto BUFSIZE = messages::DATAMSG_MAXLEN;
/** @brief The service type to use. */
template <typename UDPStreamHandler>
using udp_base = net::service::async_udp_service<UDPStreamHandler, BUFSIZE>;

/**
 * @brief A TFTP server.
 * @details All sessions share the listening socket. Datagrams are
 * demultiplexed by source address, so a session only ever sees packets from
 * the client that started it.
 */
class server : public udp_base<server> {
public:
  /** @brief The base class. */
  using Base = udp_base<server>;
  /** @brief The socket message type. */
  using socket_message = io::socket::socket_message<sockaddr_in6>;

  /**
   * @brief Constructs a TFTP server on the socket address.
   * @tparam T The type of the socket_address.
   * @param address The local IP address to bind to.
   */
  template <typename T>
  explicit server(socket_address<T> address) noexcept : Base(address)
  {}

  /**
   * @brief Receives every datagram read off the listening socket.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The bytes that were read from the socket.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

  /**
   * @brief Services a datagram from an address without a session.
   * @details Only RRQ and WRQ start sessions, everything else is answered
   * with ILLEGAL_OPERATION.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param buf The bytes that were read from the socket.
   * @param truncated Set if the datagram was longer than BUFSIZE.
   * @param address The client address.
   */
  auto service(async_context &ctx, const socket_dialog &socket,
               std::span<const std::byte> buf, bool truncated,
               const address_type &address) -> void;

  /**
   * @brief Dispatches a datagram to the session bound to its address.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param buf The bytes that were read from the socket.
   * @param truncated Set if the datagram was longer than BUFSIZE.
   * @param siter An iterator pointing to the demultiplexed session.
   */
  auto tftp_route(async_context &ctx, const socket_dialog &socket,
                  std::span<const std::byte> buf, bool truncated,
                  iterator_t siter) -> void;

private:
  /** @brief The TFTP sessions. */
  sessions_t sessions_;

  // Application Logic.
  /**
   * @brief Sends an error notice to client and closes the session.
   * @details ABORTED closes the session without sending anything.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket to send the error on.
   * @param siter An iterator pointing to the session.
   * @param error The TFTP error code to send.
   */
  auto error(async_context &ctx, const socket_dialog &socket, iterator_t siter,
             std::uint16_t error) -> void;

  /**
   * @brief Services a read or write request.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param buf The data buffer containing the RRQ or WRQ packet.
   * @param address The client address.
   */
  auto request(async_context &ctx, const socket_dialog &socket,
               std::span<const std::byte> buf,
               const address_type &address) -> void;

  /**
   * @brief Services the ACK that answers a DATA block.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param msg The datagram received from the client.
   * @param siter An iterator pointing to the session.
   */
  auto ack(async_context &ctx, const socket_dialog &socket,
           std::span<const std::byte> msg, iterator_t siter) -> void;

  /**
   * @brief Services the DATA that answers an ACK.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param msg The datagram received from the client.
   * @param siter An iterator pointing to the session.
   */
  auto data(async_context &ctx, const socket_dialog &socket,
            std::span<const std::byte> msg, iterator_t siter) -> void;

  /**
   * @brief Arms the retransmission timer of a session.
   * @details The last packet is resent every 2 * avg_rtt. The session times
   * out after session::MAX_RETRIES retransmissions.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket to retransmit on.
   * @param siter An iterator pointing to the session.
   */
  auto arm(async_context &ctx, const socket_dialog &socket,
           iterator_t siter) -> void;

  /**
   * @brief Keeps a completed upload around for 5 * avg_rtt.
   * @details Until the timer fires a repeated final DATA block is answered
   * with the final ACK again. The session is cleaned up afterwards.
   * @param ctx The asynchronous context of the session.
   * @param siter An iterator pointing to the session.
   */
  auto linger(async_context &ctx, iterator_t siter) -> void;

  /**
   * @brief Cleans-up the session from the server.
   * @param ctx The asynchronous context of the session.
   * @param siter An iterator pointing to the session to clean up.
   */
  auto cleanup(async_context &ctx, iterator_t siter) -> void;

  /**
   * @brief Sends the last packet prepared by the session to its client.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket to send on.
   * @param siter An iterator pointing to the session.
   */
  static auto send_packet(async_context &ctx, const socket_dialog &socket,
                          iterator_t siter) -> void;

  /**
   * @brief Sends an error packet to an address.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket to send on.
   * @param address The destination.
   * @param error The TFTP error code.
   * @param message Replaces the canned error text when not empty.
   */
  static auto send_error(async_context &ctx, const socket_dialog &socket,
                         const address_type &address, std::uint16_t error,
                         std::string_view message = {}) -> void;
};
} // namespace captftp
#endif // CAPTFTP_TFTP_SERVER_HPP
