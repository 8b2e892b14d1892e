#include <gtest/gtest.h>
#include "mcp_echo/transport/stdio_transport.hpp"
#include "mcp_echo/error.hpp"
#include <unistd.h>
#include <csignal>
#include <stdexcept>
#include <string>

using namespace mcp_echo;

namespace {

// Pipe pair: the test writes into `in`, the transport reads it and writes
// into `out`.
struct Pipes {
    int in[2]{-1, -1};
    int out[2]{-1, -1};

    Pipes() {
        if (pipe(in) < 0 || pipe(out) < 0) {
            throw std::runtime_error("pipe failed");
        }
    }

    void feed(const std::string& data) {
        ASSERT_EQ(::write(in[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_input() {
        ::close(in[1]);
        in[1] = -1;
    }
};

} // namespace

TEST(StdioTransport, ReadsLinesInOrder) {
    Pipes p;
    p.feed("first\nsecond\r\n\nthird");
    p.close_input();

    StdioTransport t(p.in[0], ::dup(p.out[1]));
    EXPECT_EQ(t.read_line(), "first");
    EXPECT_EQ(t.read_line(), "second");
    EXPECT_EQ(t.read_line(), "");
    EXPECT_EQ(t.read_line(), "third");
    EXPECT_FALSE(t.read_line().has_value());
    EXPECT_FALSE(t.read_line().has_value());
    EXPECT_FALSE(t.is_connected());
    ::close(p.out[1]);
    ::close(p.out[0]);
}

TEST(StdioTransport, EmptyInputIsEndOfStream) {
    Pipes p;
    p.close_input();

    StdioTransport t(p.in[0], ::dup(p.out[1]));
    EXPECT_TRUE(t.is_connected());
    EXPECT_FALSE(t.read_line().has_value());
    EXPECT_FALSE(t.is_connected());
    ::close(p.out[1]);
    ::close(p.out[0]);
}

TEST(StdioTransport, WritesOneLinePerCall) {
    Pipes p;
    p.close_input();
    {
        StdioTransport t(p.in[0], p.out[1]);
        t.write_line(R"({"id":1})");
        t.write_line(R"({"id":2})");
    }
    // The transport closed out[1]; read what it wrote.
    std::string result;
    char buf[256];
    ssize_t n;
    while ((n = ::read(p.out[0], buf, sizeof(buf))) > 0) {
        result.append(buf, static_cast<size_t>(n));
    }
    ::close(p.out[0]);
    EXPECT_EQ(result, "{\"id\":1}\n{\"id\":2}\n");
}

TEST(StdioTransport, OversizedLineIsDiscardedAndStreamContinues) {
    Pipes p;
    p.feed(std::string(100, 'x') + "\nok\n");
    p.close_input();

    StdioTransport t(p.in[0], ::dup(p.out[1]), 16);
    EXPECT_THROW(t.read_line(), FrameTooLargeError);
    EXPECT_EQ(t.read_line(), "ok");
    EXPECT_FALSE(t.read_line().has_value());
    ::close(p.out[1]);
    ::close(p.out[0]);
}

TEST(StdioTransport, OversizedLineSpanningReads) {
    Pipes p;
    p.feed(std::string(10000, 'y') + "\nafter\n");
    p.close_input();

    StdioTransport t(p.in[0], ::dup(p.out[1]), 1024);
    EXPECT_THROW(t.read_line(), FrameTooLargeError);
    EXPECT_EQ(t.read_line(), "after");
    ::close(p.out[1]);
    ::close(p.out[0]);
}

TEST(StdioTransport, WriteToClosedPipeThrows) {
    Pipes p;
    p.close_input();
    ::close(p.out[0]);
    // Without SIGPIPE ignored the process would die here.
    std::signal(SIGPIPE, SIG_IGN);

    StdioTransport t(p.in[0], p.out[1]);
    EXPECT_THROW(t.write_line("lost"), TransportError);
}

TEST(StdioTransport, ShutdownStopsReading) {
    Pipes p;
    p.feed("pending\n");
    p.close_input();

    StdioTransport t(p.in[0], ::dup(p.out[1]));
    t.shutdown();
    EXPECT_FALSE(t.is_connected());
    EXPECT_FALSE(t.read_line().has_value());
    ::close(p.out[1]);
    ::close(p.out[0]);
}
