/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/di.hpp>

#include <gossipnet/host/gossip_node.hpp>

namespace gossipnet::injector {

  /**
   * @brief Instruct injector to run node on existing io_context,
   * several nodes may share one io_context.
   */
  inline auto useIoContext(std::shared_ptr<boost::asio::io_context> io) {
    return boost::di::bind<boost::asio::io_context>().to(
        std::move(io))[boost::di::override];
  }

  /**
   * @brief Instruct injector to use this clock for log line prefixes.
   */
  inline auto useUptime(std::shared_ptr<Uptime> uptime) {
    return boost::di::bind<Uptime>().to(
        std::move(uptime))[boost::di::override];
  }

  /**
   * @brief Creates injector of a complete gossip node.
   *
   * Usage example:
   * @code
   * auto injector = makeNodeInjector(config);
   * auto io_context =
   *     injector.create<std::shared_ptr<boost::asio::io_context>>();
   * auto node = injector.create<std::shared_ptr<host::GossipNode>>();
   * @endcode
   *
   * Components are singletons of the injector, so every component of
   * one node shares directory, relay hub and connection manager.
   *
   * @param config node configuration
   * @param args injector bindings that override default bindings
   */
  template <typename InjectorConfig = BOOST_DI_CFG, typename... Ts>
  inline auto makeNodeInjector(host::NodeConfig config, Ts &&...args) {
    namespace di = boost::di;

    auto directory =
        std::make_shared<peer::PeerDirectory>(config.localAddress());
    auto hub = std::make_shared<relay::RelayHub>(config.relay_capacity);

    // clang-format off
    return di::make_injector<InjectorConfig>(
        di::bind<boost::asio::io_context>.to(std::make_shared<boost::asio::io_context>()),
        di::bind<host::NodeConfig>.to(std::move(config)),
        di::bind<peer::PeerDirectory>.to(std::move(directory)),
        di::bind<relay::RelayHub>.to(std::move(hub)),
        di::bind<Uptime>.to(std::make_shared<Uptime>()),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...
    );
    // clang-format on
  }

}  // namespace gossipnet::injector
