// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#include "frontend_connection.hpp"

#include <cassert>

namespace {
    inline bool is_user_disconnect(const boost::system::error_code& ec) {
        return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset;
    }
} // namespace

namespace frontend {
    frontend_connection::frontend_connection(boost::asio::ip::tcp::socket socket, std::chrono::seconds read_timeout)
        : socket_(std::move(socket))
        , id_(socket_.remote_endpoint())
        , read_buffer_(MAX_LINE_LENGTH)
        , read_timer_(socket_.get_executor())
        , read_timeout_(read_timeout) {}

    boost::asio::ip::tcp::socket& frontend_connection::socket() { return socket_; }

    log_t& frontend_connection::logger() {
        auto& log = get_logger_impl();
        assert(log);
        return log;
    }

    void frontend_connection::start() {
        logger()->info("[Connection {}] START: Client connected", connection_string(id_));
        boost::asio::dispatch(socket_.get_executor(), [self = shared_from_this()]() { self->start_impl(); });
    }

    void frontend_connection::finish() {
        boost::asio::dispatch(socket_.get_executor(), [self = shared_from_this()]() { self->finish_impl(); });
    }

    void frontend_connection::finish_impl() {
        if (finished_.exchange(true)) {
            return;
        }

        logger()->info("[Connection {}] FINISH: Client disconnected", connection_string(id_));
        boost::system::error_code ec;
        read_timer_.cancel();
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        on_finish();
    }

    void frontend_connection::arm_read_timer() {
        if (read_timeout_.count() == 0) {
            return;
        }

        read_timer_.expires_after(read_timeout_);
        read_timer_.async_wait([this, self = shared_from_this()](boost::system::error_code ec) {
            if (!ec) {
                logger()->warn("[Connection {}] READ: timeout, disconnecting", connection_string(id_));
                finish_impl();
            }
        });
    }

    void frontend_connection::read_line() {
        if (finished()) {
            return;
        }

        arm_read_timer();
        boost::asio::async_read_until(
            socket_,
            read_buffer_,
            '\n',
            safe_callback([this](boost::system::error_code ec, std::size_t length) {
                read_timer_.cancel();

                if (ec) {
                    if (is_user_disconnect(ec)) {
                        logger()->info("[Connection {}] READ: Client disconnected", connection_string(id_));
                    } else if (ec == boost::asio::error::not_found) {
                        logger()->warn("[Connection {}] READ: line exceeds {} bytes, disconnecting",
                                       connection_string(id_),
                                       MAX_LINE_LENGTH);
                    } else if (ec != boost::asio::error::operation_aborted) {
                        logger()->error("[Connection {}] READ: Network read error: {}",
                                        connection_string(id_),
                                        ec.message());
                    }
                    finish_impl();
                    return;
                }

                auto data = read_buffer_.data();
                std::string line(boost::asio::buffers_begin(data), boost::asio::buffers_begin(data) + length);
                read_buffer_.consume(length);

                if (handle_line(std::move(line))) {
                    read_line();
                }
            }));
    }

    void frontend_connection::write_line(std::string line, std::function<void()> on_written) {
        auto buffer = std::make_shared<std::string>(std::move(line));
        boost::asio::async_write(
            socket_,
            boost::asio::buffer(*buffer),
            safe_callback([this, buffer, on_written = std::move(on_written)](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    if (ec != boost::asio::error::operation_aborted) {
                        logger()->error("[Connection {}] SEND: failed: {}", connection_string(id_), ec.message());
                    }
                    finish_impl();
                    return;
                }
                if (on_written) {
                    on_written();
                }
            }));
    }
} // namespace frontend
