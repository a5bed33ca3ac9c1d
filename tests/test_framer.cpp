#include <doctest/doctest.h>
#include "ledlink/framer.hpp"
#include "ledlink/transport/tcp_stream.hpp"

#include <chrono>
#include <memory>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

using namespace ledlink;

// Framer on one end of a socketpair; the test drives the other end raw.
struct Pair {
    std::shared_ptr<transport::TcpStream> stream = std::make_shared<transport::TcpStream>();
    int peer = -1;

    Pair() {
        int fds[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        stream->adopt(fds[0]);
        peer = fds[1];
    }
    ~Pair() { if (peer >= 0) ::close(peer); }

    void send(const Bytes& b) const {
        REQUIRE(::write(peer, b.data(), b.size()) == static_cast<ssize_t>(b.size()));
    }
};

static Bytes frame_of(CmdType cmd, std::initializer_list<uint8_t> body) {
    Bytes b(4 + body.size());
    put_u16(b.data(), static_cast<uint16_t>(b.size()));
    put_u16(b.data() + 2, static_cast<uint16_t>(cmd));
    std::copy(body.begin(), body.end(), b.begin() + 4);
    return b;
}

TEST_CASE("A frame split across two writes is returned whole") {
    Pair p;
    Framer f(p.stream, 2000);
    Bytes full = frame_of(CmdType::ErrorAnswer, {4, 0});

    std::thread writer([&] {
        p.send(Bytes(full.begin(), full.begin() + 3));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        p.send(Bytes(full.begin() + 3, full.end()));
    });

    Packet pkt;
    Error err;
    REQUIRE(f.read_frame(pkt, err));
    writer.join();

    CHECK(pkt.command == CmdType::ErrorAnswer);
    CHECK(pkt.bytes == full);
    CHECK(pkt.length() == 6);
}

TEST_CASE("Frames sharing one write come out one at a time") {
    Pair p;
    Framer f(p.stream, 2000);
    Bytes a = frame_of(CmdType::HeartbeatAnswer, {});
    Bytes b = frame_of(CmdType::ServiceAnswer, {5, 0, 0, 1});
    Bytes c = frame_of(CmdType::FileEndAnswer, {1, 0});

    Bytes joined = a;
    joined.insert(joined.end(), b.begin(), b.end());
    joined.insert(joined.end(), c.begin(), c.end());
    p.send(joined);

    Packet pkt;
    Error err;
    REQUIRE(f.read_frame(pkt, err));
    CHECK(pkt.bytes == a);
    REQUIRE(f.read_frame(pkt, err));
    CHECK(pkt.bytes == b);
    REQUIRE(f.read_frame(pkt, err));
    CHECK(pkt.bytes == c);
}

TEST_CASE("Length below the header size is InvalidLength") {
    Pair p;
    Framer f(p.stream, 500);
    p.send(Bytes{3, 0, 0, 0});

    Packet pkt;
    Error err;
    CHECK_FALSE(f.read_frame(pkt, err));
    CHECK(err.kind == ErrorKind::Protocol);
    CHECK(err.protocol == ProtocolFault::InvalidLength);
}

TEST_CASE("Silence past the deadline is an Io timeout") {
    Pair p;
    Framer f(p.stream, 100);
    Packet pkt;
    Error err;
    CHECK_FALSE(f.read_frame(pkt, err));
    CHECK(err.kind == ErrorKind::Io);
    CHECK(err.io == IoFault::Timeout);
}

TEST_CASE("Peer close mid-frame is Io closed") {
    Pair p;
    Framer f(p.stream, 1000);
    p.send(Bytes{10, 0, 0x04, 0x20});
    ::close(p.peer);
    p.peer = -1;

    Packet pkt;
    Error err;
    CHECK_FALSE(f.read_frame(pkt, err));
    CHECK(err.kind == ErrorKind::Io);
    CHECK(err.io == IoFault::Closed);
}

TEST_CASE("Shutdown from another thread fails a blocked read") {
    Pair p;
    Framer f(p.stream, 5000);

    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        f.shutdown();
    });

    const auto t0 = std::chrono::steady_clock::now();
    Packet pkt;
    Error err;
    CHECK_FALSE(f.read_frame(pkt, err));
    closer.join();

    CHECK(err.kind == ErrorKind::Io);
    CHECK(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(4));
}

TEST_CASE("write_frame sends exactly the frame and rejects bad sizes") {
    Pair p;
    Framer f(p.stream, 1000);
    Error err;

    Bytes hb = make_heartbeat_ask();
    REQUIRE(f.write_frame(hb, err));

    uint8_t buf[16] = {};
    REQUIRE(::read(p.peer, buf, sizeof(buf)) == 4);
    CHECK(Bytes(buf, buf + 4) == hb);

    CHECK_FALSE(f.write_frame(Bytes{1, 2, 3}, err));
    CHECK(err.protocol == ProtocolFault::InvalidLength);
}
