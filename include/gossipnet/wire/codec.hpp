/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <gossipnet/wire/envelope.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace gossipnet::wire {
  enum class CodecError {
    MALFORMED_JSON,
    NOT_AN_OBJECT,
    UNKNOWN_TYPE,
    MISSING_FIELD,
    INVALID_FIELD,
    INVALID_ADDRESS,
  };
  Q_ENUM_ERROR_CODE(CodecError) {
    using E = decltype(e);
    switch (e) {
      case E::MALFORMED_JSON:
        return "Line is not valid json";
      case E::NOT_AN_OBJECT:
        return "Envelope is not a json object";
      case E::UNKNOWN_TYPE:
        return "Envelope type is unknown";
      case E::MISSING_FIELD:
        return "Envelope field is missing";
      case E::INVALID_FIELD:
        return "Envelope field has wrong type or range";
      case E::INVALID_ADDRESS:
        return "Envelope contains invalid address";
    }
    abort();
  }

  /**
   * Serializes envelope to one json line terminated by '\n'.
   *   {"type":"Message","data":{"content":..,"from":"ip:port","timestamp":..}}
   *   {"type":"PeerInfo","data":{"port":..,"known_peers":["ip:port",..]}}
   * Control characters inside strings are escaped,
   * so the result never contains other newlines.
   */
  std::string encode(const WireEnvelope &envelope);

  /// Parses one line, trailing "\n" or "\r\n" is allowed.
  outcome::result<WireEnvelope> decode(std::string_view line);
}  // namespace gossipnet::wire
