#ifndef socket_factory_hpp
#define socket_factory_hpp

#include <cstdint>
#include <memory>
#include <vector>

#include "../Common/ip_addr.hpp"

namespace tunnel {

enum class IoStatus {
    Ok,
    WouldBlock,
    Error
};

/**
 * 非阻塞 UDP socket
 */
class UdpSocket {
public:
    virtual ~UdpSocket() = default;

    virtual IoStatus sendTo(const SocketAddr& dst, const uint8_t* data, size_t len) = 0;

    // 成功时 out 为一个完整的数据报
    virtual IoStatus recvFrom(std::vector<uint8_t>& out, SocketAddr& from) = 0;
};

/**
 * 非阻塞 TCP 连接
 */
class TcpStream {
public:
    virtual ~TcpStream() = default;

    // Ok：已连接；WouldBlock：仍在连接；Error：连接失败
    virtual IoStatus pollConnected() = 0;

    virtual IoStatus send(const uint8_t* data, size_t len, size_t& written) = 0;

    // 把读到的字节追加到 out；对端关闭视为 Error
    virtual IoStatus recv(std::vector<uint8_t>& out) = 0;
};

class SocketFactory {
public:
    virtual ~SocketFactory() = default;

    // 失败返回 nullptr
    virtual std::unique_ptr<UdpSocket> bindUdp(IpFamily family) = 0;
    virtual std::unique_ptr<TcpStream> connectTcp(const SocketAddr& remote) = 0;
};

} // namespace tunnel

#endif // socket_factory_hpp
