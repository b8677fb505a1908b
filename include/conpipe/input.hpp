#pragma once

#include <conpipe/handoff.hpp>
#include <conpipe/message.hpp>

#include <atomic>
#include <fcntl.h>
#include <poll.h>
#include <thread>

namespace conpipe {

    /// Size of one local input read
    constexpr dp::usize INPUT_CHUNK_SIZE = 1024;

    /// What the input bridge enqueues for each chunk it reads
    enum class InputMode : dp::u8 {
        Content = 0, // Info message carrying the chunk bytes
        Pulse = 1    // Default placeholder message, chunk bytes discarded
    };

    /// Turns a blocking local byte source into a sequence of messages
    /// Reads run on a dedicated thread; every chunk is handed to the transport
    /// through a rendezvous queue, so the reader only advances as fast as the
    /// transport consumes.
    class InputBridge {
      private:
        dp::i32 fd_;
        HandoffQueue<Message> &queue_;
        InputMode mode_;
        dp::i32 wake_[2];
        std::thread reader_thread_;
        std::atomic<bool> running_;
        std::atomic<dp::u64> chunks_read_;

        void read_loop() {
            echo::debug("input reader started on fd=", fd_);
            dp::u8 buffer[INPUT_CHUNK_SIZE];

            while (running_) {
                struct pollfd fds[2];
                fds[0] = {fd_, POLLIN, 0};
                fds[1] = {wake_[0], POLLIN, 0};

                if (::poll(fds, 2, -1) < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    echo::error("input poll failed: ", strerror(errno));
                    break;
                }
                if (fds[1].revents != 0) {
                    echo::trace("input reader woken for shutdown");
                    break;
                }

                auto read_res = read_some(fd_, buffer, sizeof(buffer));
                if (read_res.is_err()) {
                    echo::error("input read failed: ", read_res.error().message.c_str());
                    break;
                }
                dp::usize n = read_res.value();
                if (n == 0) {
                    echo::debug("end of input");
                    break;
                }

                chunks_read_++;
                Message message = mode_ == InputMode::Content ? Message::from_bytes(buffer, n) : Message{};
                echo::trace("input chunk ", n, " bytes, handing off");

                if (!queue_.send(std::move(message))) {
                    echo::debug("handoff queue closed, input reader stopping");
                    break;
                }
            }

            queue_.close();
            echo::debug("input reader stopped");
        }

      public:
        InputBridge(dp::i32 fd, HandoffQueue<Message> &queue, InputMode mode = InputMode::Content)
            : fd_(fd), queue_(queue), mode_(mode), wake_{-1, -1}, running_(false), chunks_read_(0) {}

        ~InputBridge() {
            stop();
            if (wake_[0] >= 0) {
                ::close(wake_[0]);
                ::close(wake_[1]);
            }
        }

        InputBridge(const InputBridge &) = delete;
        InputBridge &operator=(const InputBridge &) = delete;

        /// Spawn the reader thread
        dp::Res<void> start() {
            if (running_) {
                return dp::result::err(dp::Error::invalid_argument("input bridge already started"));
            }
            if (wake_[0] < 0 && ::pipe2(wake_, O_CLOEXEC | O_NONBLOCK) < 0) {
                echo::error("input wake pipe failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("pipe failed"));
            }

            running_ = true;
            reader_thread_ = std::thread(&InputBridge::read_loop, this);
            return dp::result::ok();
        }

        /// Stop reading and close the queue
        /// Wakes the reader whether it is blocked on input or on the hand-off
        void stop() {
            running_ = false;
            if (wake_[1] >= 0) {
                dp::u8 b = 0;
                while (::write(wake_[1], &b, 1) < 0 && errno == EINTR) {
                }
            }
            queue_.close();
            if (reader_thread_.joinable()) {
                reader_thread_.join();
            }
        }

        /// Number of non-empty chunks read from the source so far
        dp::u64 chunks_read() const { return chunks_read_.load(); }
    };

} // namespace conpipe
