#include "posix_socket_factory.hpp"
#include "../Common/logging.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tunnel {

namespace {

bool wouldBlock(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINPROGRESS;
}

bool setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

socklen_t toSockaddr(const SocketAddr& sa, sockaddr_storage& out) {
    std::memset(&out, 0, sizeof(out));
    if (sa.ip.isV4()) {
        auto* in = reinterpret_cast<sockaddr_in*>(&out);
        in->sin_family = AF_INET;
        in->sin_port = htons(sa.port);
        sa.ip.toBytes(reinterpret_cast<uint8_t*>(&in->sin_addr));
        return sizeof(sockaddr_in);
    }
    auto* in6 = reinterpret_cast<sockaddr_in6*>(&out);
    in6->sin6_family = AF_INET6;
    in6->sin6_port = htons(sa.port);
    sa.ip.toBytes(in6->sin6_addr.s6_addr);
    return sizeof(sockaddr_in6);
}

std::optional<SocketAddr> fromSockaddr(const sockaddr_storage& ss) {
    if (ss.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&ss);
        return SocketAddr(IpAddr::fromV4Bytes(reinterpret_cast<const uint8_t*>(&in->sin_addr)),
                          ntohs(in->sin_port));
    }
    if (ss.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        return SocketAddr(IpAddr::fromV6Bytes(in6->sin6_addr.s6_addr), ntohs(in6->sin6_port));
    }
    return std::nullopt;
}

// 持有 fd，析构时关闭
class Fd {
public:
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { if (fd_ >= 0) ::close(fd_); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return fd_; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

class PosixUdpSocket : public UdpSocket {
public:
    explicit PosixUdpSocket(int fd) : fd_(fd) {}

    int fd() const { return fd_.get(); }

    IoStatus sendTo(const SocketAddr& dst, const uint8_t* data, size_t len) override {
        sockaddr_storage ss;
        socklen_t slen = toSockaddr(dst, ss);
        ssize_t n = ::sendto(fd_.get(), data, len, 0, reinterpret_cast<sockaddr*>(&ss), slen);
        if (n >= 0) return IoStatus::Ok;
        if (wouldBlock(errno)) return IoStatus::WouldBlock;
        TUN_LOG_DEBUG("udp sendto %s failed: %s", dst.toString().c_str(), std::strerror(errno));
        return IoStatus::Error;
    }

    IoStatus recvFrom(std::vector<uint8_t>& out, SocketAddr& from) override {
        uint8_t buf[65536];
        sockaddr_storage ss;
        socklen_t slen = sizeof(ss);
        ssize_t n = ::recvfrom(fd_.get(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&ss), &slen);
        if (n < 0) {
            if (wouldBlock(errno)) return IoStatus::WouldBlock;
            TUN_LOG_DEBUG("udp recvfrom failed: %s", std::strerror(errno));
            return IoStatus::Error;
        }

        auto addr = fromSockaddr(ss);
        if (!addr) return IoStatus::Error;

        from = *addr;
        out.assign(buf, buf + n);
        return IoStatus::Ok;
    }

private:
    Fd fd_;
};

class PosixTcpStream : public TcpStream {
public:
    PosixTcpStream(int fd, bool connected) : fd_(fd), connected_(connected) {}

    IoStatus pollConnected() override {
        if (connected_) return IoStatus::Ok;

        // 非阻塞 connect 完成后 socket 可写；用 getpeername 判断是否已连上
        sockaddr_storage ss;
        socklen_t slen = sizeof(ss);
        if (::getpeername(fd_.get(), reinterpret_cast<sockaddr*>(&ss), &slen) == 0) {
            connected_ = true;
            return IoStatus::Ok;
        }
        if (errno != ENOTCONN) return IoStatus::Error;

        int err = 0;
        socklen_t elen = sizeof(err);
        if (::getsockopt(fd_.get(), SOL_SOCKET, SO_ERROR, &err, &elen) != 0) return IoStatus::Error;
        if (err != 0 && !wouldBlock(err)) {
            TUN_LOG_DEBUG("tcp connect failed: %s", std::strerror(err));
            return IoStatus::Error;
        }
        return IoStatus::WouldBlock;
    }

    IoStatus send(const uint8_t* data, size_t len, size_t& written) override {
        written = 0;
        ssize_t n = ::send(fd_.get(), data, len, MSG_NOSIGNAL);
        if (n >= 0) {
            written = static_cast<size_t>(n);
            return IoStatus::Ok;
        }
        if (wouldBlock(errno)) return IoStatus::WouldBlock;
        return IoStatus::Error;
    }

    IoStatus recv(std::vector<uint8_t>& out) override {
        uint8_t buf[4096];
        ssize_t n = ::recv(fd_.get(), buf, sizeof(buf), 0);
        if (n > 0) {
            out.insert(out.end(), buf, buf + n);
            return IoStatus::Ok;
        }
        if (n < 0 && wouldBlock(errno)) return IoStatus::WouldBlock;
        return IoStatus::Error;
    }

private:
    Fd fd_;
    bool connected_;
};

} // namespace

std::unique_ptr<UdpSocket> PosixSocketFactory::bindUdp(IpFamily family) {
    int domain = family == IpFamily::V4 ? AF_INET : AF_INET6;
    int fd = ::socket(domain, SOCK_DGRAM, 0);
    if (fd < 0) {
        TUN_LOG_WARN("udp socket() failed: %s", std::strerror(errno));
        return nullptr;
    }
    auto sock = std::make_unique<PosixUdpSocket>(fd);

    if (!setNonBlocking(sock->fd())) {
        TUN_LOG_WARN("udp socket: cannot set O_NONBLOCK: %s", std::strerror(errno));
        return nullptr;
    }

    // 绑定到未指定地址 + 临时端口
    SocketAddr any(family == IpFamily::V4 ? IpAddr::fromV4(0) : IpAddr::fromV6(0, 0), 0);
    sockaddr_storage ss;
    socklen_t slen = toSockaddr(any, ss);
    if (::bind(sock->fd(), reinterpret_cast<sockaddr*>(&ss), slen) != 0) {
        TUN_LOG_WARN("udp bind failed: %s", std::strerror(errno));
        return nullptr;
    }
    return sock;
}

std::unique_ptr<TcpStream> PosixSocketFactory::connectTcp(const SocketAddr& remote) {
    int domain = remote.ip.isV4() ? AF_INET : AF_INET6;
    int fd = ::socket(domain, SOCK_STREAM, 0);
    if (fd < 0) {
        TUN_LOG_WARN("tcp socket() failed: %s", std::strerror(errno));
        return nullptr;
    }
    Fd guard(fd);

    if (!setNonBlocking(fd)) {
        TUN_LOG_WARN("tcp socket: cannot set O_NONBLOCK: %s", std::strerror(errno));
        return nullptr;
    }

    sockaddr_storage ss;
    socklen_t slen = toSockaddr(remote, ss);
    bool connected = true;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&ss), slen) != 0) {
        if (errno != EINPROGRESS) {
            TUN_LOG_DEBUG("tcp connect %s failed: %s", remote.toString().c_str(), std::strerror(errno));
            return nullptr;
        }
        connected = false;
    }

    return std::make_unique<PosixTcpStream>(guard.release(), connected);
}

} // namespace tunnel
