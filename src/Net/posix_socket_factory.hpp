#ifndef posix_socket_factory_hpp
#define posix_socket_factory_hpp

#include "socket_factory.hpp"

namespace tunnel {

// 基于 BSD socket 的非阻塞实现
class PosixSocketFactory : public SocketFactory {
public:
    std::unique_ptr<UdpSocket> bindUdp(IpFamily family) override;
    std::unique_ptr<TcpStream> connectTcp(const SocketAddr& remote) override;
};

} // namespace tunnel

#endif // posix_socket_factory_hpp
