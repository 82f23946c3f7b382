/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <csignal>
#include <cstdio>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>
#include <gossipnet/injector/node_injector.hpp>
#include <gossipnet/log/configure.hpp>

// Gossip node over loopback tcp.
// How to run (in separate terminals):
//  1) gossipnet_node --period 2 --port 9000
//  2) gossipnet_node --period 2 --port 9001 --connect 127.0.0.1:9000
// Each node prints messages originated by the other nodes of the mesh.

int main(int argc, char **argv) {
  auto config_res = gossipnet::host::parseCommandLine(argc, argv);
  if (not config_res.has_value()) {
    if (config_res.error()
        == make_error_code(gossipnet::host::ConfigError::HELP_REQUESTED)) {
      fmt::print("{}", gossipnet::host::usage(argv[0]));
      return EXIT_SUCCESS;
    }
    fmt::print(stderr,
               "error: {}\n{}",
               config_res.error().message(),
               gossipnet::host::usage(argv[0]));
    return 2;
  }
  auto &config = config_res.value();

  gossipnet::log::configureConsoleLogging(config.log_level);
  auto log = gossipnet::log::createLogger("main");

  auto injector = gossipnet::injector::makeNodeInjector(config);
  auto io_context =
      injector.create<std::shared_ptr<boost::asio::io_context>>();
  auto node = injector.create<std::shared_ptr<gossipnet::host::GossipNode>>();

  if (auto r = node->start(); not r.has_value()) {
    log->critical("Cannot start node: {}", r.error());
    return EXIT_FAILURE;
  }

  auto work = boost::asio::make_work_guard(*io_context);
  boost::asio::steady_timer deadline{*io_context};
  boost::asio::signal_set signals{*io_context, SIGINT, SIGTERM};
  signals.async_wait([&](boost::system::error_code ec, int signal) {
    if (ec) {
      return;
    }
    log->info("Signal {} received, stopping", signal);
    node->stop();
    work.reset();
    // links closed by stop finish their tasks, then run() returns
    deadline.expires_after(std::chrono::seconds{1});
    deadline.async_wait([&](boost::system::error_code timer_ec) {
      if (not timer_ec) {
        io_context->stop();
      }
    });
  });

  std::vector<std::thread> threads;
  for (size_t i = 1; i < config.threads; ++i) {
    threads.emplace_back([&] { io_context->run(); });
  }
  io_context->run();
  for (auto &thread : threads) {
    thread.join();
  }
  return EXIT_SUCCESS;
}
