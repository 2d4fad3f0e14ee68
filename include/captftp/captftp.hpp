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
 * @file captftp.hpp
 * @brief This file declares the transfer session state machines.
 * @details Each handler advances one session and leaves the next packet to
 * send in `state.packet`. Handlers return 0 on success, the TFTP error to
 * send to the client, or `messages::ABORTED` when the transfer must stop
 * without notifying the client.
 */
#pragma once
#ifndef CAPTFTP_HPP
#define CAPTFTP_HPP
#include "protocol/tftp_protocol.hpp"
#include "protocol/tftp_session.hpp"

#include <net/cppnet.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>

#include <netinet/in.h>
/** @namespace For top-level captftp services. */
namespace captftp {
/** @brief The client address type that sessions are keyed on. */
using address_type = io::socket::socket_address<sockaddr_in6>;
/** @brief The TFTP sessions container, one session per client address. */
using sessions_t = std::map<address_type, session>;
/** @brief The TFTP sessions iterator. */
using iterator_t = sessions_t::iterator;

/**
 * @brief Starts a read or write transfer.
 * @details For RRQ the file is opened and DATA block 1 is prepared. For WRQ
 * the upload is opened and ACK 0 is prepared.
 * @param req The decoded RRQ or WRQ.
 * @param siter An iterator pointing to a new session.
 * @returns 0 if successful, a non-zero TFTP error otherwise.
 */
auto handle_request(const messages::request &req,
                    iterator_t siter) -> std::uint16_t;

/**
 * @brief Processes the datagram that answers a DATA block.
 * @details An ACK of the previous block is a late answer to a
 * retransmission and leaves the session unchanged. Anything other than an
 * ACK for the block just sent aborts the transfer.
 * @param msg The datagram received from the session's client.
 * @param siter An iterator pointing to the session.
 * @returns 0 if successful, a non-zero TFTP error otherwise.
 */
auto handle_ack(std::span<const std::byte> msg,
                iterator_t siter) -> std::uint16_t;

/**
 * @brief Processes the datagram that answers an ACK.
 * @details DATA repeating the last block leaves the session unchanged so
 * that its ACK is sent again, also after the upload completed. Anything else
 * other than DATA for the next block aborts the transfer.
 * @param msg The datagram received from the session's client.
 * @param siter An iterator pointing to the session.
 * @returns 0 if successful, a non-zero TFTP error otherwise.
 */
auto handle_data(std::span<const std::byte> msg,
                 iterator_t siter) -> std::uint16_t;
} // namespace captftp
#endif // CAPTFTP_HPP
