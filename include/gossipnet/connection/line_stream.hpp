/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>
#include <gossipnet/coro/coro.hpp>
#include <gossipnet/peer/address.hpp>
#include <qtils/enum_error_code.hpp>

namespace gossipnet::connection {
  /**
   * Tcp link framed by '\n'.
   * Socket executor must be a strand, all awaitable methods
   * must be called from coroutines running on it.
   * At most one `readLine` and one `writeLine` may be in flight.
   */
  class LineStream : public std::enable_shared_from_this<LineStream> {
   public:
    enum class Error {
      CLOSED_BY_PEER,
      LINE_TOO_LONG,
      TIMEOUT,
      STREAM_CLOSED,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::CLOSED_BY_PEER:
          return "Connection closed by peer";
        case E::LINE_TOO_LONG:
          return "Line exceeds maximum length";
        case E::TIMEOUT:
          return "Read timed out";
        case E::STREAM_CLOSED:
          return "Stream is closed";
      }
      abort();
    }

    LineStream(boost::asio::ip::tcp::socket socket, size_t max_line_length);

    /// Reads next line without terminator ("\n" or "\r\n").
    CoroOutcome<std::string> readLine();

    /// `readLine` which fails with `TIMEOUT` after `timeout`.
    CoroOutcome<std::string> readLine(std::chrono::milliseconds timeout);

    /// Writes `line` which must end with '\n'.
    CoroOutcome<void> writeLine(std::string line);

    /// Remote endpoint captured when the stream was created.
    const peer::Address &remoteAddress() const {
      return remote_;
    }

    const boost::asio::any_io_executor &executor() const {
      return executor_;
    }

    bool isClosed() const {
      return closed_;
    }

    /// Closes socket on its strand, pending operations are cancelled.
    void close();

   private:
    void doClose();

    boost::asio::any_io_executor executor_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::streambuf buffer_;
    peer::Address remote_;
    std::atomic_bool closed_ = false;
  };
}  // namespace gossipnet::connection
