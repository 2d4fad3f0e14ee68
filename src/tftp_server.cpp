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
 * @file tftp_server.cpp
 * @brief This file defines the TFTP server.
 */
#include "captftp/tftp_server.hpp"
#include "captftp/protocol/codec.hpp"
#include "captftp/protocol/tftp_protocol.hpp"

#include <net/timers/timers.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <memory>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
namespace captftp {
/** @brief Additional buffer length for <PORT>,[],: and null.  */
static constexpr auto ADDR_BUFLEN = 9UL;
/** @brief Socket address type. */
template <typename T> using socket_address = ::io::socket::socket_address<T>;

/** @brief Milliseconds type. */
using milliseconds = std::chrono::milliseconds;

/** @brief Converts the socket address to a string inside buf. */
[[nodiscard]] static inline auto
to_str(std::span<char> buf,
       socket_address<sockaddr_in6> addr) noexcept -> std::string_view
{
  assert(buf.size() >= INET6_ADDRSTRLEN + ADDR_BUFLEN &&
         "Buffer must be large enough to print an IPv6 address and a port "
         "number.");

  using namespace io::socket;
  using std::to_chars;

  std::memset(buf.data(), 0, buf.size());
  unsigned short port = 0;
  std::size_t len = 0;

  if (addr->sin6_family == AF_INET)
  {
    const auto *addr_v4 =
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(std::ranges::data(addr));
    inet_ntop(addr_v4->sin_family, &addr_v4->sin_addr, buf.data(), buf.size());
    port = ntohs(addr_v4->sin_port);
    len = std::strlen(buf.data());
  }
  else
  {
    buf[0] = '[';
    inet_ntop(addr->sin6_family, &addr->sin6_addr, buf.data() + 1,
              buf.size() - 1);
    port = ntohs(addr->sin6_port);
    len = std::strlen(buf.data());
    buf[len++] = ']';
  }

  buf[len++] = ':';
  to_chars(buf.data() + len, buf.data() + buf.size(), port);

  return {buf.data()};
}

/** @brief Names a transfer by its request opcode for logging. */
[[nodiscard]] static constexpr auto
to_tag(std::uint16_t opc) noexcept -> std::string_view
{
  using enum messages::opcode_t;
  return (opc == WRQ) ? "WRQ" : "RRQ";
}

/** @brief Maps IPv4 peers onto their sockaddr_in form so that every client
 * has exactly one session key. */
[[nodiscard]] static inline auto
to_key(socket_address<sockaddr_in6> address) noexcept -> address_type
{
  if (address->sin6_family == AF_INET)
  {
    address = socket_address(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(std::ranges::data(address)));
  }

  return address;
}

static inline auto
clamped_exp_weighted_average(milliseconds curr,
                             milliseconds prev) -> milliseconds
{
  auto avg = prev * 3 / 4 + curr / 4;
  avg = std::min(avg, session::TIMEOUT_MAX);
  avg = std::max(avg, session::TIMEOUT_MIN);
  return avg;
}

/** @brief Update session RTT statistics. */
static inline auto
update_statistics(session::state_t::statistics_t &statistics) noexcept -> void
{
  auto &[start_time, avg_rtt] = statistics;
  auto now = session::clock::now();
  avg_rtt = clamped_exp_weighted_average(
      std::chrono::duration_cast<milliseconds>(now - start_time), avg_rtt);
  start_time = now;
}

/**
 * @brief Picks the ERROR message for a code.
 * @details A non-empty message is encoded into a new packet. Otherwise the
 * packet is the one kept by the codec for that code.
 */
static inline auto error_message(std::uint16_t error, std::string_view message)
    -> std::shared_ptr<const std::vector<char>>
{
  // The codec owns its packets, the pointer does not.
  if (message.empty())
    return {std::shared_ptr<void>(), &codec::error_packet(error)};

  return std::make_shared<std::vector<char>>(
      codec::encode_error(error, message));
}

#ifndef CAPTFTP_SERVER_STATIC_TEST
auto server::send_error(async_context &ctx, const socket_dialog &socket,
                        const address_type &address, std::uint16_t error,
                        std::string_view message) -> void
{
  using namespace stdexec;

  auto packet = error_message(error, message);

  sender auto sendmsg =
      io::sendmsg(socket,
                  socket_message{.address = {address}, .buffers = *packet},
                  0) |
      then([packet](auto &&) {}) | upon_error([](auto &&) {});
  ctx.scope.spawn(std::move(sendmsg));
}

auto server::error(async_context &ctx, const socket_dialog &socket,
                   iterator_t siter, std::uint16_t error) -> void
{
  auto &[key, session] = *siter;

  // Aborted transfers stop silently, the client times out on its own.
  if (error != messages::ABORTED)
    send_error(ctx, socket, key, error, session.state.errmsg);

  session.state.status = session::ABORTED;
  cleanup(ctx, siter);
}

auto server::send_packet(async_context &ctx, const socket_dialog &socket,
                         iterator_t siter) -> void
{
  using namespace stdexec;
  auto &[key, session] = *siter;
  auto packet = session.state.packet;

  // The continuation owns the packet until the send completes.
  sender auto sendmsg =
      io::sendmsg(socket, socket_message{.address = {key}, .buffers = *packet},
                  0) |
      then([packet](auto &&) {}) | upon_error([](auto &&) {});

  ctx.scope.spawn(std::move(sendmsg));
}

auto server::arm(async_context &ctx, const socket_dialog &socket,
                 iterator_t siter) -> void
{
  auto &state = siter->second.state;
  auto &[start_time, avg_rtt] = state.statistics;

  state.timer = ctx.timers.remove(state.timer);
  state.timer = ctx.timers.add(
      2 * avg_rtt,
      [&, siter, socket, retries = 0](auto timer_id) mutable {
        auto &[key, session] = *siter;
        if (retries++ >= session::MAX_RETRIES)
        {
          auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
          spdlog::warn("{}:{}:Timed out at block {}.",
                       to_tag(session.state.opc), to_str(addrbuf, key),
                       session.state.block_num);
          return error(ctx, socket, siter, messages::TIMED_OUT);
        }

        send_packet(ctx, socket, siter);
      },
      2 * avg_rtt);
}

auto server::request(async_context &ctx, const socket_dialog &socket,
                     std::span<const std::byte> buf,
                     const address_type &address) -> void
{
  using enum messages::error_t;
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
  auto addrstr = to_str(addrbuf, address);

  auto err = std::error_code();
  const auto req = codec::decode_request(buf, err);
  if (err)
  {
    spdlog::error("{}:{}", addrstr, err.message());
    return send_error(ctx, socket, address, ILLEGAL_OPERATION);
  }

  const auto tag = to_tag(req.opc);
  spdlog::info("{}:{}:New {} for {}.", tag, addrstr, tag, req.filename);
  if (!req.mode.empty())
    spdlog::debug("{}:{}:Mode {} is sent as octet.", tag, addrstr, req.mode);

  auto siter = sessions_.emplace(address, session()).first;
  auto &state = siter->second.state;

  if (auto code = handle_request(req, siter))
  {
    spdlog::error("{}:{}:{}", tag, addrstr,
                  state.errmsg.empty() ? errors::errstr(code)
                                       : std::string_view(state.errmsg));
    return error(ctx, socket, siter, code);
  }

  send_packet(ctx, socket, siter);

  update_statistics(state.statistics);
  arm(ctx, socket, siter);
}

auto server::ack(async_context &ctx, const socket_dialog &socket,
                 std::span<const std::byte> msg, iterator_t siter) -> void
{
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};

  auto &[key, session] = *siter;
  auto addrstr = to_str(addrbuf, key);
  auto &state = session.state;

  const auto prev_block = state.block_num;
  auto err = handle_ack(msg, siter);
  if (err == messages::ABORTED)
  {
    spdlog::warn("RRQ:{}:Aborted {} at block {}.", addrstr,
                 state.target.c_str(), state.block_num);
    return error(ctx, socket, siter, err);
  }

  if (err)
  {
    spdlog::error("RRQ:{}:{}", addrstr, errors::errstr(err));
    return error(ctx, socket, siter, err);
  }

  if (state.status == session::COMPLETE)
  {
    spdlog::info("RRQ:{}:Completed {}.", addrstr, state.target.c_str());
    return cleanup(ctx, siter);
  }

  // Duplicate ACK, the running timer still covers the current block.
  if (state.block_num == prev_block)
  {
    spdlog::debug("RRQ:{}:Duplicate ACK {}.", addrstr,
                  static_cast<std::uint16_t>(prev_block - 1));
    return;
  }

  send_packet(ctx, socket, siter);

  update_statistics(state.statistics);
  arm(ctx, socket, siter);
}

auto server::data(async_context &ctx, const socket_dialog &socket,
                  std::span<const std::byte> msg, iterator_t siter) -> void
{
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};

  auto &[key, session] = *siter;
  auto addrstr = to_str(addrbuf, key);
  auto &state = session.state;

  const auto prev_block = state.block_num;
  auto err = handle_data(msg, siter);
  if (err == messages::ABORTED)
  {
    spdlog::warn("WRQ:{}:Aborted {} at block {}.", addrstr,
                 state.target.c_str(), state.block_num);
    return error(ctx, socket, siter, err);
  }

  if (err)
  {
    spdlog::error("WRQ:{}:{}", addrstr, errors::errstr(err));
    return error(ctx, socket, siter, err);
  }

  // A new block is acknowledged, a repeated one is acknowledged again.
  send_packet(ctx, socket, siter);

  if (state.block_num == prev_block)
  {
    spdlog::debug("WRQ:{}:Repeated DATA {}.", addrstr, prev_block);
    return;
  }

  update_statistics(state.statistics);
  if (state.status == session::COMPLETE)
  {
    spdlog::info("WRQ:{}:Completed {}.", addrstr, state.target.c_str());
    return linger(ctx, siter);
  }

  arm(ctx, socket, siter);
}

auto server::linger(async_context &ctx, iterator_t siter) -> void
{
  auto &state = siter->second.state;
  auto &[start_time, avg_rtt] = state.statistics;

  state.timer = ctx.timers.remove(state.timer);
  state.timer = ctx.timers.add(5 * avg_rtt,
                               [&, siter](auto) { cleanup(ctx, siter); });
}

auto server::cleanup(async_context &ctx, iterator_t siter) -> void
{
  namespace fs = std::filesystem;

  auto err = std::error_code();
  auto &[key, session] = *siter;
  auto &state = session.state;

  // Delete any associated timers.
  state.timer = ctx.timers.remove(state.timer);

  // Close the file if it is open.
  state.file.reset();

  // Delete any temporary files.
  if (!state.tmp.empty() && !fs::remove(state.tmp, err) && err) [[unlikely]]
  {
    spdlog::warn(                                            // GCOVR_EXCL_LINE
        "Failed to delete temporary file {} with error: {}", // GCOVR_EXCL_LINE
        state.tmp.c_str(), err.message());                   // GCOVR_EXCL_LINE
  }

  // Unfinished uploads leave no trace of a target they created.
  if (state.created && state.status != session::COMPLETE &&
      !fs::remove(state.target, err) && err) [[unlikely]]
  {
    spdlog::warn(                                  // GCOVR_EXCL_LINE
        "Failed to delete {} with error: {}",      // GCOVR_EXCL_LINE
        state.target.c_str(), err.message());      // GCOVR_EXCL_LINE
  }

  // Cleanup the rest of the session.
  sessions_.erase(siter);
}

auto server::tftp_route(async_context &ctx, const socket_dialog &socket,
                        std::span<const std::byte> buf, bool truncated,
                        iterator_t siter) -> void
{
  using enum messages::opcode_t;
  auto &state = siter->second.state;

  // A datagram that did not fit in BUFSIZE cannot be a valid block.
  if (truncated)
  {
    auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
    spdlog::warn("{}:{}:Aborted {} on an oversized datagram.",
                 to_tag(state.opc), to_str(addrbuf, siter->first),
                 state.target.c_str());
    return error(ctx, socket, siter, messages::ABORTED);
  }

  if (state.opc == RRQ)
    return ack(ctx, socket, buf, siter);

  return data(ctx, socket, buf, siter);
}

auto server::service(async_context &ctx, const socket_dialog &socket,
                     std::span<const std::byte> buf, bool truncated,
                     const address_type &address) -> void
{
  using enum messages::opcode_t;
  using enum messages::error_t;

  auto err = std::error_code();
  const auto opc = codec::decode_opcode(buf, err);
  if (err || truncated)
    return send_error(ctx, socket, address, ILLEGAL_OPERATION);

  switch (opc)
  {
    case RRQ:
    case WRQ:
      return request(ctx, socket, buf, address);

    default:
      return send_error(ctx, socket, address, ILLEGAL_OPERATION);
  }
}

auto server::operator()(async_context &ctx, const socket_dialog &socket,
                        const std::shared_ptr<read_context> &rctx,
                        std::span<const std::byte> buf) -> void
{
  if (!rctx)
    return;

  const auto address = to_key(*rctx->msg.address);
  const auto truncated = (rctx->msg.flags & MSG_TRUNC) != 0;

  if (auto siter = sessions_.find(address); siter != sessions_.end())
  {
    tftp_route(ctx, socket, buf, truncated, siter);
  }
  else
  {
    service(ctx, socket, buf, truncated, address);
  }

  reader(ctx, socket, rctx);
}
#endif // CAPTFTP_SERVER_STATIC_TEST
} // namespace captftp
