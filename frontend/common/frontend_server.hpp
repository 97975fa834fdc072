// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "frontend_connection.hpp"
#include "protocol_config.hpp"
#include "utility/logger.hpp"
#include "utility/thread_pool_manager.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cassert>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace frontend {
    // Accept loop shared by line-oriented servers.
    //
    // DerivedConnection must derive from frontend_connection and provide
    //   static std::string build_too_many_connections_error();
    // The derived server decides admission and builds connections for accepted sockets.
    template<typename DerivedConnection>
    class frontend_server {
    public:
        explicit frontend_server(const frontend_server_config& config)
            : thread_pool_manager_(config.pool_size)
            , endpoint_(boost::asio::ip::make_address(config.host), config.port)
            , acceptor_(thread_pool_manager_.ctx())
            , log_(get_logger(logger_tag::FSD_SERVER)) {
            assert(log_);
        }

        frontend_server(const frontend_server&) = delete;
        frontend_server& operator=(const frontend_server&) = delete;

        virtual ~frontend_server() = default;

        // Throws boost::system::system_error when the endpoint cannot be bound.
        void start() {
            acceptor_.open(endpoint_.protocol());
            acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
            acceptor_.bind(endpoint_);
            acceptor_.listen();
            log_->info("Listening on {}", connection_string(acceptor_.local_endpoint()));

            accept_connections();
            thread_pool_manager_.start();
        }

        void stop() { shutdown(); }

        uint16_t local_port() const {
            boost::system::error_code ec;
            auto endpoint = acceptor_.local_endpoint(ec);
            return ec ? 0 : endpoint.port();
        }

    protected:
        virtual bool has_capacity() const = 0;
        virtual std::shared_ptr<DerivedConnection> make_connection(boost::asio::ip::tcp::socket socket) = 0;

        thread_pool_manager& pool() { return thread_pool_manager_; }

        // Stops the pool first so nothing else touches the acceptor or the sockets, then closes
        // every connection and runs the handlers that closing leaves behind on this thread.
        void shutdown() {
            if (shutting_down_.exchange(true)) {
                return;
            }

            thread_pool_manager_.stop();

            boost::system::error_code ec;
            acceptor_.close(ec);

            std::vector<std::weak_ptr<DerivedConnection>> connections;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections.swap(connections_);
            }
            for (auto& weak : connections) {
                if (auto conn = weak.lock(); conn) {
                    conn->finish();
                }
            }

            thread_pool_manager_.drain();
            log_->info("Server stopped");
        }

    private:
        void accept_connections() {
            if (shutting_down_.load()) {
                return;
            }

            acceptor_.async_accept(
                boost::asio::make_strand(thread_pool_manager_.ctx()),
                [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
                    if (ec == boost::asio::error::operation_aborted || shutting_down_.load()) {
                        return;
                    }

                    if (ec) {
                        log_->error("Accept failed: {}, retrying", ec.message());
                        auto timer = std::make_shared<boost::asio::steady_timer>(thread_pool_manager_.ctx(),
                                                                                 CONNECTION_EXCEPTION_TIMEOUT);
                        timer->async_wait([this, timer](boost::system::error_code) { accept_connections(); });
                        return;
                    }

                    if (has_capacity()) {
                        handle_accepted(std::move(socket));
                    } else {
                        reject_connection(std::move(socket));
                    }
                    accept_connections();
                });
        }

        // A socket whose peer is already gone has no identity; the port 0 endpoint it would get belongs to the server.
        void handle_accepted(boost::asio::ip::tcp::socket socket) {
            boost::system::error_code ec;
            socket.remote_endpoint(ec);
            if (ec) {
                log_->warn("Dropping accepted socket without a peer address: {}", ec.message());
                socket.close(ec);
                return;
            }

            try {
                auto conn = make_connection(std::move(socket));
                {
                    std::lock_guard<std::mutex> lock(connections_mutex_);
                    std::erase_if(connections_, [](const auto& weak) { return weak.expired(); });
                    connections_.push_back(conn);
                }
                conn->start();
            } catch (const std::exception& e) {
                log_->error("Failed to start connection: {}", e.what());
            }
        }

        void reject_connection(boost::asio::ip::tcp::socket socket) {
            boost::system::error_code ec;
            auto remote = socket.remote_endpoint(ec);
            log_->warn("Connection limit reached: rejecting {}", ec ? "unknown peer" : connection_string(remote));

            auto rejected = std::make_shared<boost::asio::ip::tcp::socket>(std::move(socket));
            auto message = std::make_shared<std::string>(DerivedConnection::build_too_many_connections_error());
            boost::asio::async_write(*rejected,
                                     boost::asio::buffer(*message),
                                     [this, rejected, message](boost::system::error_code ec, std::size_t) {
                                         if (ec) {
                                             log_->error("Failed to send rejection packet: {}", ec.message());
                                         }
                                         boost::system::error_code close_ec;
                                         rejected->shutdown(boost::asio::ip::tcp::socket::shutdown_both, close_ec);
                                         rejected->close(close_ec);
                                     });
        }

        thread_pool_manager thread_pool_manager_;
        boost::asio::ip::tcp::endpoint endpoint_;
        boost::asio::ip::tcp::acceptor acceptor_;
        std::atomic<bool> shutting_down_{false};

        std::mutex connections_mutex_;
        std::vector<std::weak_ptr<DerivedConnection>> connections_;
        log_t log_;
    };
} // namespace frontend
