/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>

#include <gossipnet/wire/codec.hpp>

using gossipnet::peer::Address;
using gossipnet::wire::CodecError;
using gossipnet::wire::decode;
using gossipnet::wire::encode;
using gossipnet::wire::Message;
using gossipnet::wire::PeerInfo;
using gossipnet::wire::WireEnvelope;

namespace {
  Address addr(std::string_view str) {
    return Address::parse(str).value();
  }

  std::error_code decodeError(std::string_view line) {
    auto r = decode(line);
    EXPECT_FALSE(r.has_value()) << line;
    return r.has_value() ? std::error_code{} : r.error();
  }
}  // namespace

/**
 * @given message
 * @when encoding it
 * @then one json line with "type" before "data" is produced
 */
TEST(CodecTest, EncodeMessageLayout) {
  Message message{"42", addr("127.0.0.1:9000"), 1700000000};
  EXPECT_EQ(encode(message),
            R"({"type":"Message","data":{"content":"42","from":"127.0.0.1:9000","timestamp":1700000000}})"
            "\n");
}

TEST(CodecTest, EncodePeerInfoLayout) {
  PeerInfo peer_info{9001, {addr("127.0.0.1:9000"), addr("127.0.0.1:9002")}};
  EXPECT_EQ(encode(peer_info),
            R"({"type":"PeerInfo","data":{"port":9001,"known_peers":["127.0.0.1:9000","127.0.0.1:9002"]}})"
            "\n");
}

/**
 * @given envelopes with boundary values
 * @when encoding and decoding them
 * @then original envelopes are restored
 */
TEST(CodecTest, RoundTripBoundaries) {
  std::vector<WireEnvelope> envelopes{
      Message{"", addr("127.0.0.1:0"), 0},
      Message{"4294967295",
              addr("[::1]:65535"),
              std::numeric_limits<uint64_t>::max()},
      PeerInfo{65535, {}},
      PeerInfo{0, {addr("127.0.0.1:1"), addr("10.1.2.3:65535")}},
  };
  for (auto &envelope : envelopes) {
    auto line = encode(envelope);
    auto decoded = decode(line);
    ASSERT_TRUE(decoded.has_value()) << line << decoded.error().message();
    EXPECT_EQ(decoded.value(), envelope) << line;
  }
}

/**
 * @given content with newlines and other control characters
 * @when encoding it
 * @then line contains only the terminating newline and decodes back
 */
TEST(CodecTest, ContentCannotBreakFraming) {
  Message message{"a\nb\r\nc\td\x01", addr("127.0.0.1:9000"), 5};
  auto line = encode(message);
  EXPECT_EQ(std::ranges::count(line, '\n'), 1);
  EXPECT_EQ(line.back(), '\n');
  EXPECT_EQ(std::ranges::count(line, '\r'), 0);
  auto decoded = decode(line);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(std::get<Message>(decoded.value()), message);
}

TEST(CodecTest, DecodeAcceptsCrlfAndNoTerminator) {
  auto json =
      std::string{R"({"type":"PeerInfo","data":{"port":1,"known_peers":[]}})"};
  EXPECT_TRUE(decode(json).has_value());
  EXPECT_TRUE(decode(json + "\r\n").has_value());
}

/**
 * @given lines which are not well-formed envelopes
 * @when decoding them
 * @then corresponding error is returned
 */
TEST(CodecTest, DecodeErrors) {
  EXPECT_EQ(decodeError("not json"), make_error_code(CodecError::MALFORMED_JSON));
  EXPECT_EQ(decodeError(R"({"type":"Message")"),
            make_error_code(CodecError::MALFORMED_JSON));
  EXPECT_EQ(decodeError("[1,2]"), make_error_code(CodecError::NOT_AN_OBJECT));
  EXPECT_EQ(decodeError(R"({"type":"Ping","data":{}})"),
            make_error_code(CodecError::UNKNOWN_TYPE));
  EXPECT_EQ(decodeError(R"({"data":{}})"),
            make_error_code(CodecError::MISSING_FIELD));
  EXPECT_EQ(
      decodeError(R"({"type":"Message","data":{"content":"1","timestamp":1}})"),
      make_error_code(CodecError::MISSING_FIELD));
  EXPECT_EQ(
      decodeError(
          R"({"type":"Message","data":{"content":1,"from":"127.0.0.1:1","timestamp":1}})"),
      make_error_code(CodecError::INVALID_FIELD));
  EXPECT_EQ(
      decodeError(
          R"({"type":"Message","data":{"content":"1","from":"127.0.0.1:1","timestamp":-1}})"),
      make_error_code(CodecError::INVALID_FIELD));
  EXPECT_EQ(
      decodeError(
          R"({"type":"Message","data":{"content":"1","from":"nowhere","timestamp":1}})"),
      make_error_code(CodecError::INVALID_ADDRESS));
  EXPECT_EQ(
      decodeError(R"({"type":"PeerInfo","data":{"port":65536,"known_peers":[]}})"),
      make_error_code(CodecError::INVALID_FIELD));
  EXPECT_EQ(
      decodeError(R"({"type":"PeerInfo","data":{"port":1,"known_peers":[5]}})"),
      make_error_code(CodecError::INVALID_FIELD));
}
