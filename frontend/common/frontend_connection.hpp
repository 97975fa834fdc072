// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "protocol_config.hpp"
#include "utility/connection_uid.hpp"
#include "utility/logger.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace frontend {
    // Owns one accepted socket and reads newline terminated lines from it.
    // All socket work runs on the socket's strand; finish() may be called from any thread.
    class frontend_connection : public std::enable_shared_from_this<frontend_connection> {
    public:
        // Throws boost::system::system_error when the socket has no peer address.
        frontend_connection(boost::asio::ip::tcp::socket socket, std::chrono::seconds read_timeout);

        virtual ~frontend_connection() = default;

        frontend_connection(const frontend_connection&) = delete;
        frontend_connection& operator=(const frontend_connection&) = delete;

        boost::asio::ip::tcp::socket& socket();
        const connection_id& id() const noexcept { return id_; }
        log_t& logger();

        void start();
        void finish();
        bool finished() const noexcept { return finished_.load(); }

    protected:
        template<typename Callable>
        auto safe_callback(Callable&& callback) {
            return [this, self = shared_from_this(), callback = std::forward<Callable>(callback)](auto&&... args) {
                try {
                    callback(std::forward<decltype(args)>(args)...);
                } catch (const std::exception& e) {
                    logger()->error("[Connection {}] EXCEPTION: {}, disconnecting...", connection_string(id_), e.what());
                    finish_impl();
                }
            };
        }

        template<typename Derived>
        std::shared_ptr<Derived> shared_from_base() {
            return std::static_pointer_cast<Derived>(shared_from_this());
        }

        virtual void start_impl() = 0;
        virtual log_t& get_logger_impl() = 0;

        // One line with its terminator still attached. Returning false pauses the read loop until the
        // derived connection calls read_line() again.
        virtual bool handle_line(std::string line) = 0;

        // Runs once, on the strand, after the socket is closed.
        virtual void on_finish() = 0;

        void read_line(); // method for getting into line-read loop

        // At most one write may be in flight; on_written runs on the strand after success.
        void write_line(std::string line, std::function<void()> on_written);

        boost::asio::ip::tcp::socket socket_;
        connection_id id_;

    private:
        void finish_impl();
        void arm_read_timer();

        boost::asio::streambuf read_buffer_;
        boost::asio::steady_timer read_timer_;
        std::chrono::seconds read_timeout_;
        std::atomic<bool> finished_{false};
    };
} // namespace frontend
