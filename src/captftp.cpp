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
 * @file captftp.cpp
 * @brief This file defines the transfer session state machines.
 */
#include "captftp/captftp.hpp"
#include "captftp/filesystem.hpp"
#include "captftp/protocol/codec.hpp"

#include <array>
namespace captftp {
/**
 * @brief Maps a filesystem error to the TFTP error reported to the client.
 * @param err The filesystem error.
 * @param state The session state, receives the failure text for errors
 * that have no TFTP equivalent.
 * @returns The TFTP error code.
 */
static inline auto to_error(const std::error_code &err,
                            session::state_t &state) -> std::uint16_t
{
  using enum messages::error_t;

  if (err == std::errc::no_such_file_or_directory)
    return FILE_NOT_FOUND;

  if (err == std::errc::permission_denied ||
      err == std::errc::operation_not_permitted ||
      err == std::errc::read_only_file_system)
  {
    return ACCESS_VIOLATION;
  }

  if (err == std::errc::no_space_on_device)
    return DISK_FULL; // GCOVR_EXCL_LINE

  state.errmsg = err.message();
  return UNKNOWN_TID;
}

/**
 * @brief Reads the next block of the file and encodes it as a DATA packet.
 * @details The block number wraps on overflow. A read that returns fewer
 * than DATALEN bytes (possibly zero) produces the final block.
 * @param siter An iterator pointing to the current session.
 * @return Returns 0 on success, ACCESS_VIOLATION on a file read error.
 */
static inline auto send_next(iterator_t siter) -> std::uint16_t
{
  auto &state = siter->second.state;

  auto read_buf = std::array<char, messages::DATALEN>();
  state.file->read(read_buf.data(), read_buf.size());
  if (state.file->bad()) [[unlikely]]
  {
    state.status = session::ABORTED;   // GCOVR_EXCL_LINE
    return messages::ACCESS_VIOLATION; // GCOVR_EXCL_LINE
  }

  state.payload_len = static_cast<std::size_t>(state.file->gcount());
  state.block_num += 1;
  state.packet = std::make_shared<std::vector<char>>(codec::encode_data(
      state.block_num, std::span(read_buf.data(), state.payload_len)));

  state.status = session::AWAITING_ACK;
  return 0;
}

/** @brief Marks the session as aborted. */
static inline auto abort_transfer(session::state_t &state) -> std::uint16_t
{
  state.status = session::ABORTED;
  return messages::ABORTED;
}

auto handle_request(const messages::request &req,
                    iterator_t siter) -> std::uint16_t
{
  using enum messages::opcode_t;

  if ((req.opc != RRQ && req.opc != WRQ) || req.filename.empty())
    return messages::ILLEGAL_OPERATION;

  auto &state = siter->second.state;

  state.opc = req.opc;
  state.target = filesystem::resolve(req.filename);

  auto err = std::error_code();
  if (req.opc == RRQ)
  {
    state.file = filesystem::open_read(state.target, err);
    if (!state.file)
    {
      state.status = session::ABORTED;
      return to_error(err, state);
    }

    return send_next(siter);
  }

  state.file =
      filesystem::open_write(state.target, state.tmp, state.created, err);
  if (!state.file)
  {
    state.status = session::ABORTED;
    return to_error(err, state);
  }

  // Block 0 is acked so that the client starts sending.
  state.block_num = 0;
  state.packet = std::make_shared<std::vector<char>>(codec::encode_ack(0));
  state.status = session::AWAITING_DATA;
  return 0;
}

auto handle_ack(std::span<const std::byte> msg,
                iterator_t siter) -> std::uint16_t
{
  using enum messages::opcode_t;

  auto &state = siter->second.state;

  if (state.opc != RRQ)
    return messages::UNKNOWN_TID;

  if (state.status != session::AWAITING_ACK)
    return abort_transfer(state);

  auto err = std::error_code();
  const auto ack = codec::decode_ack(msg, err);

  // A late ACK of the previous block answers a retransmission of it.
  if (!err && ack.block_num == static_cast<std::uint16_t>(state.block_num - 1))
    return 0;

  if (err || ack.block_num != state.block_num)
  {
    state.file.reset();
    return abort_transfer(state);
  }

  if (state.payload_len == messages::DATALEN)
    return send_next(siter);

  state.file->close();
  state.status = session::COMPLETE;
  return 0;
}

auto handle_data(std::span<const std::byte> msg,
                 iterator_t siter) -> std::uint16_t
{
  using enum messages::opcode_t;

  auto &state = siter->second.state;
  auto &file = state.file;

  if (state.opc != WRQ)
    return messages::UNKNOWN_TID;

  if (state.status != session::AWAITING_DATA &&
      state.status != session::COMPLETE)
  {
    return abort_transfer(state);
  }

  // Wraps block_num around
  const auto next_block = static_cast<std::uint16_t>(state.block_num + 1);

  auto err = std::error_code();
  const auto data = codec::decode_data(msg, err);

  // The last block repeated means its ACK was lost, the packet is resent.
  if (!err && data.block_num == state.block_num)
    return 0;

  if (err || state.status == session::COMPLETE ||
      data.block_num != next_block)
  {
    file.reset();
    return abort_transfer(state);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *payload = reinterpret_cast<const char *>(data.payload.data());
  const auto len = data.payload.size();

  file->write(payload, static_cast<std::streamsize>(len));
  if (file->fail()) [[unlikely]]
  {
    file.reset();                    // GCOVR_EXCL_LINE
    state.status = session::ABORTED; // GCOVR_EXCL_LINE
    return messages::DISK_FULL;      // GCOVR_EXCL_LINE
  }

  state.block_num = next_block;
  state.payload_len = len;
  state.packet =
      std::make_shared<std::vector<char>>(codec::encode_ack(next_block));

  if (len == messages::DATALEN)
    return 0;

  // File writing is complete.
  file->close();
  if (file->fail()) [[unlikely]]
  {
    state.status = session::ABORTED; // GCOVR_EXCL_LINE
    return messages::DISK_FULL;      // GCOVR_EXCL_LINE
  }

  if (auto error = filesystem::commit(state.tmp, state.target)) [[unlikely]]
  {
    state.status = session::ABORTED; // GCOVR_EXCL_LINE
    return to_error(error, state);   // GCOVR_EXCL_LINE
  }

  // The target now holds the upload and must survive the session.
  state.tmp.clear();
  state.created = false;
  state.status = session::COMPLETE;
  return 0;
}
} // namespace captftp
