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
#include "captftp/detail/argument_parser.hpp"
#include "captftp/filesystem.hpp"
#include "captftp/tftp_server.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <arpa/inet.h>

using namespace net::service;
using namespace captftp;

using captftp_server = context_thread<server>;

static constexpr unsigned short PORT = 69;
static constexpr char const *const usage =
    "usage: {} [-a <ADDRESS>] [-p <PORT>] [-r <ROOT>] [-l <LEVEL>]\n"
    "\n"
    "Options:\n"
    "-h, --help                         print this help.\n"
    "-a, --address=<ADDRESS>            set the IPv4 or IPv6 address to "
    "listen on (default: ::).\n"
    "-p, --port=<PORT>                  set the port to listen on (default: "
    "69).\n"
    "-r, --root=<ROOT>                  set the directory that relative "
    "filenames resolve against.\n"
    "-l, --log-level=<LEVEL>            set the log-level (critical, error, "
    "warn, info, debug)\n";

static auto signal_mask() -> sigset_t *
{
  static auto set = sigset_t{};
  static sigset_t *setp = nullptr;
  static auto mtx = std::mutex{};

  if (auto lock = std::lock_guard{mtx}; !setp)
  {
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGINT);
    setp = &set;
  }
  return setp;
}

static auto signal_handler(captftp_server &server) -> std::jthread
{
  static const sigset_t *sigmask = nullptr;
  static auto mtx = std::mutex();

  if (auto lock = std::lock_guard{mtx}; !sigmask)
  {
    sigmask = signal_mask();
    pthread_sigmask(SIG_BLOCK, sigmask, nullptr);

    return std::jthread([&](const std::stop_token &token) noexcept {
      static const auto timeout = timespec{.tv_sec = 0, .tv_nsec = 50000000};

      while (!token.stop_requested())
      {
        using enum captftp_server::signals;
        switch (sigtimedwait(sigmask, nullptr, &timeout))
        {
          case SIGTERM:
          case SIGHUP:
          case SIGINT:
            server.signal(terminate);
            break;

          default:
            break;
        }
      }
    });
  }

  return {};
}

struct config {
  std::optional<io::socket::socket_address<sockaddr_in>> address_v4;
  io::socket::socket_address<sockaddr_in6> address_v6;
  unsigned short port = PORT;
};

static auto set_loglevel(std::string_view value) -> int
{
  using std::tolower;
  auto level = std::string(value);
  std::ranges::transform(level, level.begin(),
                         [](unsigned char chr) { return tolower(chr); });

  auto spdlog_level = spdlog::level::from_str(level);
  if (spdlog_level != spdlog::level::off || level == "off")
  {
    spdlog::set_level(spdlog_level);
    return 0;
  }

  std::cerr << std::format("Unrecognized log level: {}\n", value)
            << "Valid log levels are: ";

  int count = 0;
  for (const auto &level_str : spdlog::level::level_string_views)
  {
    if (count++ > 0)
      std::cerr << ", ";

    std::cerr << std::string(level_str.begin(), level_str.end());
  }
  std::cerr << "\n";
  return -1;
}

static auto set_address(config &conf, std::string_view value) -> int
{
  auto host = std::string(value);
  if (inet_pton(AF_INET6, host.c_str(), &conf.address_v6->sin6_addr) == 1)
  {
    conf.address_v4.reset();
    return 0;
  }

  auto address = io::socket::socket_address<sockaddr_in>{};
  if (inet_pton(AF_INET, host.c_str(), &address->sin_addr) == 1)
  {
    conf.address_v4 = address;
    return 0;
  }

  std::cerr << std::format("Invalid address: {}\n", value);
  return -1;
}

static auto set_root(std::string_view value) -> int
{
  auto err = std::error_code();
  auto path = std::filesystem::path(value);
  if (!std::filesystem::is_directory(path, err))
  {
    std::cerr << std::format("Root is not a directory: {}\n", value);
    return -1;
  }

  if (setenv(filesystem::root_env, path.c_str(), 1))
  {
    std::cerr << std::format(
        "Unable to set {}, error: {}\n", filesystem::root_env,
        std::error_code(errno, std::system_category()).message());
    return -1;
  }
  return 0;
}

// NOLINTNEXTLINE
auto parse_args(int argc, char const *const *argv) -> std::optional<config>
{
  using namespace captftp::detail;

  auto conf = config();
  auto progname = std::filesystem::path(*argv).stem();

  auto error = [&]() -> std::optional<config> {
    std::cerr << std::format(usage, progname.c_str());
    return std::nullopt;
  };

  for (const auto &option : argument_parser::parse(argc, argv))
  {
    const auto &[flag, value] = option;
    if (flag.empty())
    {
      std::cerr << std::format("Unexpected argument: {}\n", value);
      return error();
    }

    if (option.is("-h", "--help"))
    {
      std::cout << std::format(usage, progname.c_str());
      return std::nullopt;
    }

    if (option.is("-a", "--address"))
    {
      if (!set_address(conf, value))
        continue;

      return error();
    }

    if (option.is("-r", "--root"))
    {
      if (!set_root(value))
        continue;

      return error();
    }

    if (option.is("-l", "--log-level"))
    {
      if (!set_loglevel(value))
        continue;

      return error();
    }

    if (option.is("-p", "--port"))
    {
      auto [ptr, err] =
          std::from_chars(value.cbegin(), value.cend(), conf.port);
      if (err != std::errc{} || ptr != value.cend())
      {
        std::cerr << std::format("Invalid port number: {}\n", value);
        return error();
      }
      continue;
    }

    std::cerr << std::format("Unknown flag: {}\n", flag);
    return error();
  }

  return {conf};
}

auto main(int argc, char *argv[]) -> int
{
  auto conf = parse_args(argc, argv);
  if (!conf)
    return 0;

  auto server = captftp_server();
  auto sighandler = signal_handler(server);

  if (auto &address = conf->address_v4)
  {
    (*address)->sin_family = AF_INET;
    (*address)->sin_port = htons(conf->port);
    server.start(*address);
  }
  else
  {
    auto &address_v6 = conf->address_v6;
    address_v6->sin6_family = AF_INET6;
    address_v6->sin6_port = htons(conf->port);
    server.start(address_v6);
  }

  spdlog::info("captftpd starting on UDP port {}.", conf->port);
  if (auto root = filesystem::root_directory(); !root.empty())
    spdlog::info("Serving relative filenames from {}.", root.c_str());

  server.state.wait(server.PENDING);
  server.state.wait(server.STARTED);

  spdlog::info("captftpd stopped.");
  return 0;
}
