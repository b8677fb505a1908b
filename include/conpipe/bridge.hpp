#pragma once

#include <conpipe/config.hpp>
#include <conpipe/errors.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <ostream>

namespace conpipe {

    /// Forwarding driver
    /// Wires the local input through the selected transport to the remote
    /// endpoint, and writes every message received from it to the output sink.
    /// A Bridge runs one session: open() once, run() once.
    class Bridge {
      private:
        Config config_;
        Endpoint remote_;
        std::ostream &out_;
        dp::i32 input_fd_;
        HandoffQueue<Message> outbound_;
        std::optional<Transport> transport_;
        std::unique_ptr<InputBridge> input_;
        dp::u64 messages_written_;
        // Guards transport_ teardown against stop() from other threads
        std::mutex mutex_;

        dp::Res<void> write_message(const Message &message) {
            out_ << "New Message\n" << message.display().c_str() << "\n";
            out_.flush();
            if (!out_) {
                return dp::result::err(dp::Error::io_error("failed to write to output"));
            }

            messages_written_++;
            if (config_.verbose > 0) {
                echo::info("message #", messages_written_, " (", category_name(message.category), ", ",
                           message.text.size(), " bytes)");
            }
            return dp::result::ok();
        }

        void finish() {
            if (input_) {
                input_->stop();
            }
            std::lock_guard<std::mutex> lock(mutex_);
            if (transport_) {
                conpipe::close(*transport_);
            }
        }

      public:
        /// remote is the already resolved endpoint; config.remote is only the
        /// text the CLI parsed it from and is not read here
        Bridge(const Config &config, const Endpoint &remote, std::ostream &out, dp::i32 input_fd = STDIN_FILENO)
            : config_(config), remote_(remote), out_(out), input_fd_(input_fd), messages_written_(0) {}

        ~Bridge() { finish(); }

        Bridge(const Bridge &) = delete;
        Bridge &operator=(const Bridge &) = delete;

        /// Build the configured transport and connect/bind it
        /// An error here is a connection failure
        dp::Res<void> open() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (transport_) {
                return dp::result::err(dp::Error::invalid_argument("bridge already opened"));
            }

            transport_.emplace(make_transport(config_.transport, remote_));
            auto res = conpipe::open(*transport_);
            if (res.is_err()) {
                echo::error("unable to open ", transport_name(config_.transport), " transport to ",
                            remote_.to_string(), ": ", res.error().message.c_str());
                return res;
            }

            if (config_.quiet == 0) {
                echo::info("relaying console over ", transport_name(config_.transport), " to ", remote_.to_string());
            }
            return dp::result::ok();
        }

        /// Relay until the inbound stream ends or an I/O error occurs
        /// Both directions are closed before this returns
        dp::Res<void> run() {
            if (!transport_) {
                return dp::result::err(dp::Error::invalid_argument("bridge not opened"));
            }
            if (input_) {
                return dp::result::err(dp::Error::invalid_argument("bridge already ran"));
            }

            input_.reset(new InputBridge(input_fd_, outbound_, config_.input_mode));
            auto input_res = input_->start();
            if (input_res.is_err()) {
                finish();
                return input_res;
            }

            auto start_res = conpipe::start(*transport_, outbound_);
            if (start_res.is_err()) {
                finish();
                return start_res;
            }

            dp::Res<void> result = dp::result::ok();
            while (true) {
                auto next_res = conpipe::next(*transport_);
                if (next_res.is_err()) {
                    result = dp::result::err(next_res.error());
                    break;
                }
                if (!next_res.value().has_value()) {
                    break;
                }

                auto write_res = write_message(*next_res.value());
                if (write_res.is_err()) {
                    echo::error(write_res.error().message.c_str());
                    result = write_res;
                    break;
                }
            }

            finish();
            if (config_.quiet == 0) {
                echo::info("session with ", remote_.to_string(), " ended after ", messages_written_, " messages");
            }
            return result;
        }

        /// Ask a running session to end; safe from any thread
        void stop() {
            std::lock_guard<std::mutex> lock(mutex_);
            outbound_.close();
            if (transport_) {
                conpipe::shutdown(*transport_);
            }
        }

        dp::u64 messages_written() const { return messages_written_; }
    };

} // namespace conpipe
