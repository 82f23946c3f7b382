/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/peer/address.hpp>

#include <charconv>

#include <boost/container_hash/hash.hpp>

namespace gossipnet::peer {
  outcome::result<Address> Address::parse(std::string_view str) {
    auto colon = str.rfind(':');
    if (colon == std::string_view::npos) {
      return AddressError::MISSING_PORT;
    }
    auto host = str.substr(0, colon);
    auto port_str = str.substr(colon + 1);
    if (port_str.empty()) {
      return AddressError::MISSING_PORT;
    }
    if (host.size() >= 2 and host.front() == '[' and host.back() == ']') {
      host = host.substr(1, host.size() - 2);
    } else if (host.find(':') != std::string_view::npos) {
      // ipv6 without brackets is ambiguous with the port separator
      return AddressError::INVALID_IP;
    }

    uint16_t port = 0;
    auto r = std::from_chars(
        port_str.data(), port_str.data() + port_str.size(), port);
    if (r.ec != std::errc{} or r.ptr != port_str.data() + port_str.size()) {
      return AddressError::INVALID_PORT;
    }

    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(std::string{host}, ec);
    if (ec) {
      return AddressError::INVALID_IP;
    }
    return Address{ip, port};
  }

  Address Address::fromEndpoint(
      const boost::asio::ip::tcp::endpoint &endpoint) {
    auto ip = endpoint.address();
    if (ip.is_v6() and ip.to_v6().is_v4_mapped()) {
      ip = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped,
                                            ip.to_v6());
    }
    return Address{ip, endpoint.port()};
  }

  std::string Address::toString() const {
    if (ip.is_v6()) {
      return fmt::format("[{}]:{}", ip.to_string(), port);
    }
    return fmt::format("{}:{}", ip.to_string(), port);
  }
}  // namespace gossipnet::peer

size_t std::hash<gossipnet::peer::Address>::operator()(
    const gossipnet::peer::Address &address) const {
  size_t seed = 0;
  if (address.ip.is_v4()) {
    boost::hash_combine(seed, address.ip.to_v4().to_uint());
  } else {
    auto bytes = address.ip.to_v6().to_bytes();
    boost::hash_range(seed, bytes.begin(), bytes.end());
  }
  boost::hash_combine(seed, address.port);
  return seed;
}
