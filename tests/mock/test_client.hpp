// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include <boost/asio.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace test {
    // Blocking line client with per-read timeouts, for talking to a server on loopback.
    class test_client {
    public:
        explicit test_client(uint16_t port)
            : socket_(ctx_) {
            socket_.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
        }

        void send(std::string_view line) {
            std::string data(line);
            data += "\r\n";
            boost::asio::write(socket_, boost::asio::buffer(data));
        }

        // Terminator stripped. nullopt on timeout or when the server closed the connection.
        std::optional<std::string> read_line(std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
            std::optional<std::string> result;
            boost::asio::async_read_until(socket_,
                                          buffer_,
                                          '\n',
                                          [this, &result](boost::system::error_code ec, std::size_t length) {
                                              if (ec) {
                                                  closed_ = ec == boost::asio::error::eof ||
                                                            ec == boost::asio::error::connection_reset;
                                                  return;
                                              }
                                              auto data = buffer_.data();
                                              std::string line(boost::asio::buffers_begin(data),
                                                               boost::asio::buffers_begin(data) + length);
                                              buffer_.consume(length);
                                              while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                                                  line.pop_back();
                                              }
                                              result = std::move(line);
                                          });

            ctx_.restart();
            ctx_.run_for(timeout);
            if (!ctx_.stopped()) {
                // timed out, let the cancelled read complete
                boost::system::error_code ec;
                socket_.cancel(ec);
                ctx_.restart();
                ctx_.run();
            }
            return result;
        }

        // Skips lines until one starts with prefix. Everything read on the way is kept in skipped.
        std::optional<std::string> read_until(std::string_view prefix,
                                              std::vector<std::string>* skipped = nullptr,
                                              std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                                  std::chrono::steady_clock::now());
                auto line = read_line(std::max(left, std::chrono::milliseconds(1)));
                if (!line.has_value()) {
                    if (closed_) {
                        return std::nullopt;
                    }
                    continue;
                }
                if (line->starts_with(prefix)) {
                    return line;
                }
                if (skipped) {
                    skipped->push_back(*line);
                }
            }
            return std::nullopt;
        }

        bool closed() const noexcept { return closed_; }

        // The server knows this client by it.
        boost::asio::ip::tcp::endpoint local_endpoint() const { return socket_.local_endpoint(); }

    private:
        boost::asio::io_context ctx_;
        boost::asio::ip::tcp::socket socket_;
        boost::asio::streambuf buffer_;
        bool closed_ = false;
    };
} // namespace test
