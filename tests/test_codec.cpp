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
// NOLINTBEGIN
#include "captftp/protocol/codec.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <tuple>
#include <vector>

using namespace captftp;

static auto as_bytes(const std::vector<char> &buf) -> std::span<const std::byte>
{
  return std::as_bytes(std::span(buf));
}

TEST(CodecTest, DecodeOpcodeTooShort)
{
  auto err = std::error_code();
  auto buf = std::vector<char>{0x00};

  EXPECT_EQ(codec::decode_opcode(as_bytes(buf), err), 0);
  EXPECT_EQ(err, codec_errc::malformed_packet);

  buf.clear();
  codec::decode_opcode(as_bytes(buf), err);
  EXPECT_EQ(err, codec_errc::malformed_packet);
}

TEST(CodecTest, DecodeOpcodeUnknown)
{
  auto err = std::error_code();
  auto zero = std::vector<char>{0x00, 0x00};
  auto six = std::vector<char>{0x00, 0x06};
  auto huge = std::vector<char>{char(0xFF), char(0xFF)};

  codec::decode_opcode(as_bytes(zero), err);
  EXPECT_EQ(err, codec_errc::unknown_opcode);

  EXPECT_EQ(codec::decode_opcode(as_bytes(six), err), 6);
  EXPECT_EQ(err, codec_errc::unknown_opcode);

  EXPECT_EQ(codec::decode_opcode(as_bytes(huge), err), 0xFFFF);
  EXPECT_EQ(err, codec_errc::unknown_opcode);
}

TEST(CodecTest, DecodeOpcodeClearsError)
{
  auto err = std::error_code(codec_errc::malformed_packet);
  auto buf = std::vector<char>{0x00, 0x04, 0x00, 0x01};

  EXPECT_EQ(codec::decode_opcode(as_bytes(buf), err), messages::ACK);
  EXPECT_FALSE(err);
}

TEST(CodecTest, EncodeRequestLayout)
{
  auto buf = codec::encode_request(messages::RRQ, "cap.bin");
  auto expected = std::vector<char>{0x00, 0x01, 'c', 'a', 'p', '.', 'b', 'i',
                                    'n',  0x00, 'o', 'c', 't', 'e', 't', 0x00};
  EXPECT_EQ(buf, expected);
}

TEST(CodecTest, DecodeRequest)
{
  auto err = std::error_code();
  auto buf = codec::encode_request(messages::WRQ, "upload.bin", "netascii");

  auto req = codec::decode_request(as_bytes(buf), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(req.opc, messages::WRQ);
  EXPECT_EQ(req.filename, "upload.bin");
  EXPECT_EQ(req.mode, "netascii");
}

TEST(CodecTest, DecodeRequestWithoutMode)
{
  auto err = std::error_code();
  auto buf = std::vector<char>{0x00, 0x01, 'a', 0x00};

  auto req = codec::decode_request(as_bytes(buf), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(req.filename, "a");
  EXPECT_TRUE(req.mode.empty());
}

TEST(CodecTest, DecodeRequestMalformed)
{
  auto err = std::error_code();

  auto unterminated = std::vector<char>{0x00, 0x01, 'a', 'b'};
  codec::decode_request(as_bytes(unterminated), err);
  EXPECT_EQ(err, codec_errc::malformed_packet);

  auto empty_name = std::vector<char>{0x00, 0x02, 0x00, 'o', 0x00};
  codec::decode_request(as_bytes(empty_name), err);
  EXPECT_EQ(err, codec_errc::malformed_packet);

  auto header_only = std::vector<char>{0x00, 0x01};
  codec::decode_request(as_bytes(header_only), err);
  EXPECT_EQ(err, codec_errc::malformed_packet);
}

TEST(CodecTest, DecodeRequestWrongOpcode)
{
  auto err = std::error_code();
  auto buf = codec::encode_ack(1);

  codec::decode_request(as_bytes(buf), err);
  EXPECT_EQ(err, codec_errc::unexpected_opcode);
}

TEST(CodecTest, EncodeDataLayout)
{
  auto payload = std::vector<char>(300, 'x');
  auto buf = codec::encode_data(0x0102, payload);

  ASSERT_EQ(buf.size(), 304);
  EXPECT_EQ(buf[0], 0x00);
  EXPECT_EQ(buf[1], 0x03);
  EXPECT_EQ(buf[2], 0x01);
  EXPECT_EQ(buf[3], 0x02);
  EXPECT_EQ(std::memcmp(buf.data() + 4, payload.data(), payload.size()), 0);
}

TEST(CodecTest, EncodeEmptyData)
{
  auto buf = codec::encode_data(3, {});
  auto expected = std::vector<char>{0x00, 0x03, 0x00, 0x03};
  EXPECT_EQ(buf, expected);
}

TEST(CodecTest, DecodeData)
{
  auto err = std::error_code();
  auto payload = std::vector<char>(messages::DATALEN, 'y');
  auto buf = codec::encode_data(65535, payload);

  auto data = codec::decode_data(as_bytes(buf), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(data.block_num, 65535);
  ASSERT_EQ(data.payload.size(), messages::DATALEN);
  EXPECT_EQ(std::memcmp(data.payload.data(), payload.data(), payload.size()),
            0);
}

TEST(CodecTest, DecodeDataMalformed)
{
  auto err = std::error_code();

  auto short_header = std::vector<char>{0x00, 0x03, 0x00};
  codec::decode_data(as_bytes(short_header), err);
  EXPECT_EQ(err, codec_errc::malformed_packet);

  auto oversized = std::vector<char>(messages::DATAMSG_MAXLEN + 1);
  oversized[1] = 0x03;
  codec::decode_data(as_bytes(oversized), err);
  EXPECT_EQ(err, codec_errc::malformed_packet);

  auto ack = codec::encode_ack(1);
  codec::decode_data(as_bytes(ack), err);
  EXPECT_EQ(err, codec_errc::unexpected_opcode);
}

TEST(CodecTest, AckLayout)
{
  auto err = std::error_code();
  auto buf = codec::encode_ack(0xBEEF);
  auto expected = std::vector<char>{0x00, 0x04, char(0xBE), char(0xEF)};
  EXPECT_EQ(buf, expected);

  auto ack = codec::decode_ack(as_bytes(buf), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(ack.block_num, 0xBEEF);
}

TEST(CodecTest, DecodeAckMalformed)
{
  auto err = std::error_code();

  auto short_ack = std::vector<char>{0x00, 0x04, 0x00};
  codec::decode_ack(as_bytes(short_ack), err);
  EXPECT_EQ(err, codec_errc::malformed_packet);

  auto error = codec::encode_error(messages::NOT_DEFINED, "stop");
  codec::decode_ack(as_bytes(error), err);
  EXPECT_EQ(err, codec_errc::unexpected_opcode);
}

TEST(CodecTest, EncodeErrorLayout)
{
  auto buf = codec::encode_error(messages::UNKNOWN_TID, "Is a directory");

  ASSERT_EQ(buf.size(), 4 + std::strlen("Is a directory") + 1);
  EXPECT_EQ(buf[1], messages::ERROR);
  EXPECT_EQ(buf[3], messages::UNKNOWN_TID);
  EXPECT_STREQ(buf.data() + 4, "Is a directory");
  EXPECT_EQ(buf.back(), '\0');
}

TEST(CodecTest, EncodeErrorTruncatesAtNull)
{
  using namespace std::string_view_literals;
  auto buf = codec::encode_error(messages::NOT_DEFINED, "abc\0def"sv);

  auto expected = std::vector<char>{0x00, 0x05, 0x00, 0x00, 'a', 'b', 'c', 0x00};
  EXPECT_EQ(buf, expected);
}

TEST(CodecTest, DecodeError)
{
  auto err = std::error_code();
  auto buf = codec::encode_error(messages::FILE_NOT_FOUND, "File not found.");

  auto error = codec::decode_error(as_bytes(buf), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(error.code, messages::FILE_NOT_FOUND);
  EXPECT_EQ(error.message, "File not found.");
}

TEST(CodecTest, DecodeErrorWithoutTerminator)
{
  auto err = std::error_code();
  auto buf = std::vector<char>{0x00, 0x05, 0x00, 0x03, 'f', 'u', 'l', 'l'};

  auto error = codec::decode_error(as_bytes(buf), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(error.code, messages::DISK_FULL);
  EXPECT_EQ(error.message, "full");
}

TEST(CodecTest, ErrorCategory)
{
  auto err = std::error_code(codec_errc::unknown_opcode);

  EXPECT_STREQ(err.category().name(), "captftp.codec");
  EXPECT_EQ(err.message(), "Unknown opcode.");
  EXPECT_EQ(std::error_code(codec_errc::malformed_packet).message(),
            "Malformed packet.");
  EXPECT_EQ(std::error_code(codec_errc::unexpected_opcode).message(),
            "Unexpected opcode.");
}

TEST(CodecTest, ErrorPacketLayout)
{
  const auto &buf = codec::error_packet(messages::FILE_NOT_FOUND);
  auto expected = std::vector<char>{0x00, 0x05, 0x00, 0x01, 'F', 'i', 'l',
                                    'e',  ' ',  'n',  'o',  't', ' ', 'f',
                                    'o',  'u',  'n',  'd',  '.', 0x00};
  EXPECT_EQ(buf, expected);
  EXPECT_EQ(&buf, &codec::error_packet(messages::FILE_NOT_FOUND));
}

TEST(CodecTest, ErrorPacketCodes)
{
  using enum messages::error_t;

  for (std::uint16_t code : {ACCESS_VIOLATION, DISK_FULL, UNKNOWN_TID,
                             ILLEGAL_OPERATION, FILE_ALREADY_EXISTS})
  {
    auto err = std::error_code();
    auto error = codec::decode_error(as_bytes(codec::error_packet(code)), err);
    ASSERT_FALSE(err);
    EXPECT_EQ(error.code, code);
    EXPECT_EQ(error.message, errors::errstr(code));
  }
}

TEST(CodecTest, ErrorPacketAliases)
{
  using enum messages::error_t;
  auto err = std::error_code();

  auto timed_out =
      codec::decode_error(as_bytes(codec::error_packet(TIMED_OUT)), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(timed_out.code, NOT_DEFINED);
  EXPECT_EQ(timed_out.message, "Timed out.");

  EXPECT_EQ(codec::error_packet(ABORTED), codec::error_packet(NOT_DEFINED));
  EXPECT_EQ(codec::error_packet(99), codec::error_packet(NOT_DEFINED));
}

// Every block number edge against every payload size edge.
class CodecBlockTest
    : public ::testing::TestWithParam<std::tuple<std::uint16_t, std::size_t>> {
};

TEST_P(CodecBlockTest, DataRoundTrip)
{
  const auto [block_num, len] = GetParam();
  auto err = std::error_code();
  auto payload = std::vector<char>(len);
  for (std::size_t i = 0; i < len; ++i)
    payload[i] = static_cast<char>(i ^ block_num);

  auto buf = codec::encode_data(block_num, payload);
  ASSERT_EQ(buf.size(), messages::HEADERLEN + len);

  auto data = codec::decode_data(as_bytes(buf), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(data.block_num, block_num);
  ASSERT_EQ(data.payload.size(), len);
  EXPECT_EQ(std::memcmp(data.payload.data(), payload.data(), len), 0);
}

TEST_P(CodecBlockTest, AckRoundTrip)
{
  const auto block_num = std::get<0>(GetParam());
  auto err = std::error_code();

  auto ack = codec::decode_ack(as_bytes(codec::encode_ack(block_num)), err);
  ASSERT_FALSE(err);
  EXPECT_EQ(ack.block_num, block_num);
}

INSTANTIATE_TEST_SUITE_P(
    BlockEdges, CodecBlockTest,
    ::testing::Combine(::testing::Values(0, 1, 255, 256, 65534, 65535),
                       ::testing::Values(0, 1, 511, 512)));

class CodecRequestTest : public ::testing::TestWithParam<std::string> {};

TEST_P(CodecRequestTest, FilenameRoundTrip)
{
  const auto &filename = GetParam();
  auto err = std::error_code();

  for (std::uint16_t opc : {messages::RRQ, messages::WRQ})
  {
    auto buf = codec::encode_request(opc, filename);
    auto req = codec::decode_request(as_bytes(buf), err);
    ASSERT_FALSE(err);
    EXPECT_EQ(req.opc, opc);
    EXPECT_EQ(req.filename, filename);
    EXPECT_EQ(req.mode, "octet");
  }
}

INSTANTIATE_TEST_SUITE_P(
    Filenames, CodecRequestTest,
    ::testing::Values("a", "capture.pcap", "dir/sub/file.bin",
                      "/abs/path/trace.pcapng", "name with spaces",
                      "..hidden", std::string(255, 'f')));
// NOLINTEND
