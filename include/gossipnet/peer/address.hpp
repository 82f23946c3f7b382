/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <fmt/format.h>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace gossipnet::peer {
  enum class AddressError {
    MISSING_PORT,
    INVALID_PORT,
    INVALID_IP,
  };
  Q_ENUM_ERROR_CODE(AddressError) {
    using E = decltype(e);
    switch (e) {
      case E::MISSING_PORT:
        return "Address has no port";
      case E::INVALID_PORT:
        return "Address port is not a number in range 0..65535";
      case E::INVALID_IP:
        return "Address ip is invalid";
    }
    abort();
  }

  /**
   * Peer identity and endpoint: ip and listening port.
   * Text form is "ip:port", "[ip]:port" for ipv6.
   */
  struct Address {
    boost::asio::ip::address ip;
    uint16_t port = 0;

    static outcome::result<Address> parse(std::string_view str);

    static Address fromEndpoint(const boost::asio::ip::tcp::endpoint &endpoint);

    boost::asio::ip::tcp::endpoint endpoint() const {
      return {ip, port};
    }

    std::string toString() const;

    bool operator==(const Address &other) const {
      return port == other.port and ip == other.ip;
    }

    bool operator<(const Address &other) const {
      if (ip != other.ip) {
        return ip < other.ip;
      }
      return port < other.port;
    }
  };
}  // namespace gossipnet::peer

template <>
struct std::hash<gossipnet::peer::Address> {
  size_t operator()(const gossipnet::peer::Address &address) const;
};

template <>
struct fmt::formatter<gossipnet::peer::Address>
    : fmt::formatter<std::string_view> {
  auto format(const gossipnet::peer::Address &address,
              format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(address.toString(), ctx);
  }
};
