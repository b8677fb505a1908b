#pragma once

#include <conpipe/codec.hpp>
#include <conpipe/handoff.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

namespace conpipe {

    /// Outbound half of a transport session
    /// Drains the hand-off queue on its own thread, encodes every message and
    /// passes the frame to the transport's send function. A failed send ends
    /// the session: the error is kept for the receiving side, the queue is
    /// closed so the input stops, and the abort hook wakes the receiver.
    class Forwarder {
      public:
        using SendFn = std::function<dp::Res<void>(const Frame &)>;
        using AbortFn = std::function<void()>;

      private:
        std::thread thread_;
        mutable std::mutex mutex_;
        dp::Res<void> result_;
        std::atomic<bool> failed_;
        std::atomic<dp::u64> frames_sent_;
        std::atomic<dp::u64> frames_dropped_;

        void forward_loop(HandoffQueue<Message> &queue, SendFn send, AbortFn abort) {
            echo::debug("forwarder started");

            while (true) {
                auto message = queue.recv();
                if (!message.has_value()) {
                    break;
                }

                auto frame_res = codec::encode(*message);
                if (frame_res.is_err()) {
                    // Nothing goes on the wire for this message
                    frames_dropped_++;
                    echo::warn("encode failed, message dropped: ", frame_res.error().message.c_str());
                    continue;
                }

                auto send_res = send(frame_res.value());
                if (send_res.is_err()) {
                    echo::error("failed to write to socket: ", send_res.error().message.c_str());
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        result_ = send_res;
                    }
                    failed_ = true;
                    queue.close();
                    abort();
                    break;
                }
                frames_sent_++;
            }

            echo::debug("forwarder stopped after ", frames_sent_.load(), " frames");
        }

      public:
        Forwarder() : result_(dp::result::ok()), failed_(false), frames_sent_(0), frames_dropped_(0) {}

        ~Forwarder() { join(); }

        Forwarder(const Forwarder &) = delete;
        Forwarder &operator=(const Forwarder &) = delete;

        void start(HandoffQueue<Message> &queue, SendFn send, AbortFn abort) {
            thread_ = std::thread(&Forwarder::forward_loop, this, std::ref(queue), std::move(send), std::move(abort));
        }

        /// Wait for the forwarding thread; the queue must be closed or drained first
        void join() {
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        bool failed() const { return failed_.load(); }

        /// ok while forwarding is healthy, the write error once it failed
        dp::Res<void> status() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return result_;
        }

        dp::u64 frames_sent() const { return frames_sent_.load(); }
        dp::u64 frames_dropped() const { return frames_dropped_.load(); }
    };

} // namespace conpipe
