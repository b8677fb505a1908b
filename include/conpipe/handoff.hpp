#pragma once

#include <conpipe/common.hpp>

#include <condition_variable>
#include <mutex>
#include <optional>

namespace conpipe {

    /// Zero-capacity rendezvous channel
    /// send() returns only once the consumer has taken the value, so a slow
    /// consumer stalls the producer instead of letting values pile up.
    /// One producer, one consumer.
    template <typename T> class HandoffQueue {
      private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::optional<T> slot_;
        dp::u64 offered_;
        dp::u64 taken_;
        bool closed_;

      public:
        HandoffQueue() : offered_(0), taken_(0), closed_(false) {}

        HandoffQueue(const HandoffQueue &) = delete;
        HandoffQueue &operator=(const HandoffQueue &) = delete;

        /// Offer a value and wait for the consumer to take it
        /// Returns false if the queue is (or becomes) closed before the hand-off
        bool send(T value) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !slot_.has_value() || closed_; });
            if (closed_) {
                return false;
            }

            slot_ = std::move(value);
            dp::u64 ticket = ++offered_;
            cv_.notify_all();

            cv_.wait(lock, [this, ticket] { return taken_ >= ticket || closed_; });
            return taken_ >= ticket;
        }

        /// Wait for a value; nullopt once the queue is closed
        std::optional<T> recv() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return slot_.has_value() || closed_; });
            if (closed_) {
                return std::nullopt;
            }

            std::optional<T> value = std::move(slot_);
            slot_.reset();
            ++taken_;
            cv_.notify_all();
            return value;
        }

        /// Close the queue; wakes a blocked sender and a blocked receiver
        /// An offered value that was not taken yet is dropped
        void close() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            slot_.reset();
            cv_.notify_all();
            echo::trace("handoff queue closed");
        }

        bool is_closed() {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }
    };

} // namespace conpipe
