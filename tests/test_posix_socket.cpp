#include "../src/Net/posix_socket_factory.hpp"
#include "test_common.h"
#include <arpa/inet.h>
#include <chrono>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace tunnel;
using test::TestStats;
using test::check;

// 回环上的对端，用阻塞 BSD socket 实现
class Peer {
public:
    explicit Peer(int type) : fd_(::socket(AF_INET, type, 0)) {
        if (fd_ < 0) return;

        timeval tv{1, 0};
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        sa.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) return;
        if (type == SOCK_STREAM && ::listen(fd_, 1) != 0) return;

        socklen_t len = sizeof(sa);
        if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&sa), &len) != 0) return;
        port_ = ntohs(sa.sin_port);
    }

    ~Peer() { if (fd_ >= 0) ::close(fd_); }

    Peer(const Peer&) = delete;
    Peer& operator=(const Peer&) = delete;

    bool ok() const { return port_ != 0; }
    int fd() const { return fd_; }
    SocketAddr addr() const { return SocketAddr(IpAddr::fromV4(0x7f000001), port_); }

private:
    int fd_;
    uint16_t port_ = 0;
};

template <typename F>
static IoStatus pollUntil(F&& op) {
    IoStatus st = IoStatus::WouldBlock;
    for (int i = 0; i < 200 && st == IoStatus::WouldBlock; ++i) {
        st = op();
        if (st == IoStatus::WouldBlock) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    return st;
}

void testUdp(TestStats& stats) {
    std::cout << "\n[A. UDP Tests]\n";

    PosixSocketFactory factory;
    auto sock = factory.bindUdp(IpFamily::V4);
    check(stats, sock != nullptr, "bindUdp(V4) returns a socket");
    if (!sock) return;

    std::vector<uint8_t> out;
    SocketAddr from;
    check(stats, sock->recvFrom(out, from) == IoStatus::WouldBlock, "recvFrom on an idle socket would block");

    Peer peer(SOCK_DGRAM);
    check(stats, peer.ok(), "loopback UDP peer bound");
    if (!peer.ok()) return;

    const std::string ping = "ping";
    check(stats, sock->sendTo(peer.addr(), reinterpret_cast<const uint8_t*>(ping.data()), ping.size()) == IoStatus::Ok,
          "sendTo loopback succeeds");

    uint8_t buf[64];
    sockaddr_in src{};
    socklen_t slen = sizeof(src);
    ssize_t n = ::recvfrom(peer.fd(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&src), &slen);
    check(stats, n == 4 && std::memcmp(buf, "ping", 4) == 0, "peer receives the datagram");
    if (n != 4) return;

    ::sendto(peer.fd(), "pong!", 5, 0, reinterpret_cast<sockaddr*>(&src), slen);

    IoStatus st = pollUntil([&] { return sock->recvFrom(out, from); });
    check(stats, st == IoStatus::Ok, "reply arrives");
    check(stats, std::string(out.begin(), out.end()) == "pong!", "reply payload is one whole datagram");
    check(stats, from == peer.addr(), "reply source is the peer address");

    auto sock6 = factory.bindUdp(IpFamily::V6);
    if (sock6) {
        check(stats, sock6->recvFrom(out, from) == IoStatus::WouldBlock, "bindUdp(V6) yields a non-blocking socket");
    } else {
        std::cout << "  - IPv6 unavailable, skipped\n";
    }
}

void testTcp(TestStats& stats) {
    std::cout << "\n[B. TCP Tests]\n";

    Peer listener(SOCK_STREAM);
    check(stats, listener.ok(), "loopback TCP listener bound");
    if (!listener.ok()) return;

    PosixSocketFactory factory;
    auto stream = factory.connectTcp(listener.addr());
    check(stats, stream != nullptr, "connectTcp returns a stream");
    if (!stream) return;

    check(stats, pollUntil([&] { return stream->pollConnected(); }) == IoStatus::Ok, "connection completes");

    int conn = ::accept(listener.fd(), nullptr, nullptr);
    check(stats, conn >= 0, "listener accepts");
    if (conn < 0) return;

    const uint8_t query[] = {0x00, 0x02, 0xab, 0xcd};
    size_t written = 0;
    check(stats, stream->send(query, sizeof(query), written) == IoStatus::Ok && written == sizeof(query),
          "send writes all bytes");

    uint8_t buf[16];
    ssize_t n = ::recv(conn, buf, sizeof(buf), MSG_WAITALL);
    check(stats, n == 4 && std::memcmp(buf, query, 4) == 0, "peer reads the bytes in order");

    ::send(conn, "abc", 3, 0);
    std::vector<uint8_t> out;
    check(stats, pollUntil([&] { return stream->recv(out); }) == IoStatus::Ok, "recv gets the reply");
    check(stats, std::string(out.begin(), out.end()) == "abc", "recv appends the reply bytes");

    ::close(conn);
    IoStatus st = pollUntil([&] { return stream->recv(out); });
    check(stats, st == IoStatus::Error, "peer close is reported as Error");
}

void testRefused(TestStats& stats) {
    std::cout << "\n[C. Connection Failure Tests]\n";

    SocketAddr closed;
    {
        // 取一个刚释放的端口，此时没有监听者
        Peer tmp(SOCK_STREAM);
        if (!tmp.ok()) return;
        closed = tmp.addr();
    }

    PosixSocketFactory factory;
    auto stream = factory.connectTcp(closed);
    if (!stream) {
        check(stats, true, "connect to a closed port fails immediately");
        return;
    }
    check(stats, pollUntil([&] { return stream->pollConnected(); }) == IoStatus::Error,
          "connect to a closed port reports Error");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  POSIX Socket Unit Tests\n";
    std::cout << "========================================\n";

    TestStats stats;

    try {
        testUdp(stats);
        testTcp(stats);
        testRefused(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return test::finish(stats);
}
