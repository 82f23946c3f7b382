/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/connection/line_stream.hpp>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <gossipnet/common/weak_macro.hpp>
#include <gossipnet/coro/asio.hpp>

namespace gossipnet::connection {
  namespace {
    peer::Address remoteOf(const boost::asio::ip::tcp::socket &socket) {
      boost::system::error_code ec;
      auto endpoint = socket.remote_endpoint(ec);
      if (ec) {
        return {};
      }
      return peer::Address::fromEndpoint(endpoint);
    }
  }  // namespace

  LineStream::LineStream(boost::asio::ip::tcp::socket socket,
                         size_t max_line_length)
      : executor_{socket.get_executor()},
        socket_{std::move(socket)},
        buffer_{max_line_length + 1},
        remote_{remoteOf(socket_)} {}

  CoroOutcome<std::string> LineStream::readLine() {
    if (closed_) {
      co_return Error::STREAM_CLOSED;
    }
    auto [ec, size] = co_await boost::asio::async_read_until(
        socket_, buffer_, '\n', useCoroOutcome);
    if (ec == boost::asio::error::eof) {
      co_return Error::CLOSED_BY_PEER;
    }
    if (ec == boost::asio::error::not_found) {
      co_return Error::LINE_TOO_LONG;
    }
    if (ec) {
      if (closed_) {
        co_return Error::STREAM_CLOSED;
      }
      co_return std::error_code{ec};
    }
    auto begin = boost::asio::buffers_begin(buffer_.data());
    std::string line{begin, begin + size - 1};
    buffer_.consume(size);
    if (line.ends_with('\r')) {
      line.pop_back();
    }
    co_return line;
  }

  CoroOutcome<std::string> LineStream::readLine(
      std::chrono::milliseconds timeout) {
    auto expired = std::make_shared<bool>(false);
    boost::asio::steady_timer timer{executor_};
    timer.expires_after(timeout);
    timer.async_wait(
        [WEAK_SELF, expired](boost::system::error_code ec) {
          if (ec) {
            return;
          }
          WEAK_LOCK(self);
          *expired = true;
          self->socket_.cancel(ec);
        });
    auto line = co_await readLine();
    timer.cancel();
    if (not line.has_value() and *expired) {
      co_return Error::TIMEOUT;
    }
    co_return line;
  }

  CoroOutcome<void> LineStream::writeLine(std::string line) {
    BOOST_ASSERT(line.ends_with('\n'));
    if (closed_) {
      co_return Error::STREAM_CLOSED;
    }
    BOOST_OUTCOME_CO_TRY(coroOutcome(co_await boost::asio::async_write(
        socket_, boost::asio::buffer(line), useCoroOutcome)));
    co_return outcome::success();
  }

  void LineStream::close() {
    if (closed_.exchange(true)) {
      return;
    }
    boost::asio::post(executor_, [self{shared_from_this()}] {
      self->doClose();
    });
  }

  void LineStream::doClose() {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
}  // namespace gossipnet::connection
