#include <chrono>
#include <cstring>
#include <string>
#include <doctest/doctest.h>
#include <conpipe/input.hpp>
#include <thread>

namespace {
    struct Pipe {
        int fds[2] = {-1, -1};
        Pipe() { REQUIRE(::pipe(fds) == 0); }
        ~Pipe() {
            close_write();
            if (fds[0] >= 0)
                ::close(fds[0]);
        }
        void write(const char *text) { REQUIRE(::write(fds[1], text, std::strlen(text)) == static_cast<ssize_t>(std::strlen(text))); }
        void close_write() {
            if (fds[1] >= 0) {
                ::close(fds[1]);
                fds[1] = -1;
            }
        }
    };
} // namespace

TEST_CASE("InputBridge - content mode") {
    Pipe pipe;
    conpipe::HandoffQueue<conpipe::Message> queue;
    conpipe::InputBridge input(pipe.fds[0], queue);
    REQUIRE(input.start().is_ok());

    pipe.write("hello\n");
    auto first = queue.recv();
    REQUIRE(first.has_value());
    CHECK(first->category == conpipe::Category::Info);
    CHECK(first->text == "hello\n");

    pipe.write("world\n");
    auto second = queue.recv();
    REQUIRE(second.has_value());
    CHECK(second->text == "world\n");

    SUBCASE("end of input closes the queue") {
        pipe.close_write();
        CHECK_FALSE(queue.recv().has_value());
        CHECK(input.chunks_read() == 2);
    }

    SUBCASE("stop closes the queue while the source is still open") {
        input.stop();
        CHECK(queue.is_closed());
        CHECK_FALSE(queue.recv().has_value());
    }
}

TEST_CASE("InputBridge - pulse mode enqueues placeholders") {
    Pipe pipe;
    conpipe::HandoffQueue<conpipe::Message> queue;
    conpipe::InputBridge input(pipe.fds[0], queue, conpipe::InputMode::Pulse);
    REQUIRE(input.start().is_ok());

    pipe.write("ignored bytes");
    auto message = queue.recv();
    REQUIRE(message.has_value());
    CHECK(*message == conpipe::Message{});

    pipe.close_write();
    CHECK_FALSE(queue.recv().has_value());
}

TEST_CASE("InputBridge - chunks are at most 1024 bytes") {
    Pipe pipe;
    conpipe::HandoffQueue<conpipe::Message> queue;
    conpipe::InputBridge input(pipe.fds[0], queue);

    std::string big(3000, 'x');
    pipe.write(big.c_str());
    pipe.close_write();
    REQUIRE(input.start().is_ok());

    dp::usize total = 0;
    while (auto message = queue.recv()) {
        CHECK(message->text.size() <= conpipe::INPUT_CHUNK_SIZE);
        CHECK(message->text.size() > 0);
        total += message->text.size();
    }
    CHECK(total == 3000);
}

TEST_CASE("InputBridge - backpressure stalls the reader") {
    Pipe pipe;
    conpipe::HandoffQueue<conpipe::Message> queue;
    conpipe::InputBridge input(pipe.fds[0], queue);
    REQUIRE(input.start().is_ok());

    // Nobody consumes: the first chunk blocks in the hand-off, later input stays unread
    pipe.write("one");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    pipe.write("two");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    pipe.write("three");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    CHECK(input.chunks_read() == 1);

    auto first = queue.recv();
    REQUIRE(first.has_value());
    CHECK(first->text == "one");

    input.stop();
}

TEST_CASE("InputBridge - stop before start") {
    conpipe::HandoffQueue<conpipe::Message> queue;
    conpipe::InputBridge input(-1, queue);
    input.stop();
    CHECK(queue.is_closed());
}
