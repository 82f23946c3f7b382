/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/wire/codec.hpp>

#include <limits>

#include <nlohmann/json.hpp>

namespace gossipnet::wire {
  namespace {
    using Json = nlohmann::ordered_json;

    constexpr std::string_view kMessage = "Message";
    constexpr std::string_view kPeerInfo = "PeerInfo";

    outcome::result<const Json *> field(const Json &object,
                                        std::string_view name) {
      auto it = object.find(std::string{name});
      if (it == object.end()) {
        return CodecError::MISSING_FIELD;
      }
      return &*it;
    }

    outcome::result<peer::Address> address(const Json &json) {
      if (not json.is_string()) {
        return CodecError::INVALID_FIELD;
      }
      auto r = peer::Address::parse(json.get_ref<const std::string &>());
      if (not r.has_value()) {
        return CodecError::INVALID_ADDRESS;
      }
      return r.value();
    }

    outcome::result<Message> decodeMessage(const Json &data) {
      BOOST_OUTCOME_TRY(auto content, field(data, "content"));
      BOOST_OUTCOME_TRY(auto from, field(data, "from"));
      BOOST_OUTCOME_TRY(auto timestamp, field(data, "timestamp"));
      if (not content->is_string() or not timestamp->is_number_unsigned()) {
        return CodecError::INVALID_FIELD;
      }
      BOOST_OUTCOME_TRY(auto from_address, address(*from));
      return Message{
          .content = content->get<std::string>(),
          .from = from_address,
          .timestamp = timestamp->get<uint64_t>(),
      };
    }

    outcome::result<PeerInfo> decodePeerInfo(const Json &data) {
      BOOST_OUTCOME_TRY(auto port, field(data, "port"));
      BOOST_OUTCOME_TRY(auto known_peers, field(data, "known_peers"));
      if (not port->is_number_unsigned()
          or port->get<uint64_t>() > std::numeric_limits<uint16_t>::max()
          or not known_peers->is_array()) {
        return CodecError::INVALID_FIELD;
      }
      PeerInfo peer_info{.port = port->get<uint16_t>()};
      peer_info.known_peers.reserve(known_peers->size());
      for (auto &item : *known_peers) {
        BOOST_OUTCOME_TRY(auto known, address(item));
        peer_info.known_peers.emplace_back(known);
      }
      return peer_info;
    }
  }  // namespace

  std::string encode(const WireEnvelope &envelope) {
    Json json;
    if (auto *message = std::get_if<Message>(&envelope)) {
      json["type"] = std::string{kMessage};
      json["data"] = {
          {"content", message->content},
          {"from", message->from.toString()},
          {"timestamp", message->timestamp},
      };
    } else {
      auto &peer_info = std::get<PeerInfo>(envelope);
      auto known_peers = Json::array();
      for (auto &known : peer_info.known_peers) {
        known_peers.push_back(known.toString());
      }
      json["type"] = std::string{kPeerInfo};
      json["data"] = {
          {"port", peer_info.port},
          {"known_peers", std::move(known_peers)},
      };
    }
    auto line = json.dump(-1, ' ', false, Json::error_handler_t::replace);
    line.push_back('\n');
    return line;
  }

  outcome::result<WireEnvelope> decode(std::string_view line) {
    if (line.ends_with('\n')) {
      line.remove_suffix(1);
    }
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
    auto json = Json::parse(line, nullptr, false);
    if (json.is_discarded()) {
      return CodecError::MALFORMED_JSON;
    }
    if (not json.is_object()) {
      return CodecError::NOT_AN_OBJECT;
    }
    BOOST_OUTCOME_TRY(auto type, field(json, "type"));
    BOOST_OUTCOME_TRY(auto data, field(json, "data"));
    if (not type->is_string()) {
      return CodecError::INVALID_FIELD;
    }
    if (not data->is_object()) {
      return CodecError::NOT_AN_OBJECT;
    }
    auto &type_str = type->get_ref<const std::string &>();
    if (type_str == kMessage) {
      BOOST_OUTCOME_TRY(auto message, decodeMessage(*data));
      return WireEnvelope{std::move(message)};
    }
    if (type_str == kPeerInfo) {
      BOOST_OUTCOME_TRY(auto peer_info, decodePeerInfo(*data));
      return WireEnvelope{std::move(peer_info)};
    }
    return CodecError::UNKNOWN_TYPE;
  }
}  // namespace gossipnet::wire
