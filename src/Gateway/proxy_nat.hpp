#ifndef proxy_nat_hpp
#define proxy_nat_hpp

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../Common/clock.hpp"
#include "../Common/expiring_map.hpp"
#include "../Common/ip_addr.hpp"
#include "../Packet/ip_packet.hpp"
#include "../Protocol/p2p_control.hpp"

namespace tunnel {

/**
 * 网关侧：代理 IP -> 真实地址 的 NAT
 *
 * 每个客户端一个实例。收到 AssignedIps 后结合网关自己的解析结果建立映射：
 * 每个代理 IP 轮流对应一个同地址族的真实地址，没有同族地址时退而使用另一族，
 * 地址族不同的报文经过 NAT64 / NAT46 转换（源地址换成客户端对应地址族的隧道地址）。
 *
 * 会话是对称 NAT：多个代理 IP 可能对应同一个真实地址，客户端源端口冲突时
 * 网关侧换一个端口，回包再按网关端口找回原来的代理 IP 和客户端端口。
 */
class ProxyNat {
public:
    // 会话空闲超时
    static constexpr Duration kSessionTtl = std::chrono::minutes(2);

    // clientV4 / clientV6 是客户端的隧道地址，地址族不对时抛出 std::invalid_argument
    ProxyNat(const IpAddr& clientV4, const IpAddr& clientV6);

    // 返回要回给客户端的 DomainStatus：至少有一个真实地址时为 Active
    p2p::DomainStatus handleAssignedIps(const p2p::AssignedIps& msg, const std::vector<IpAddr>& resolved);

    // 客户端发来的控制报文里取出 AssignedIps，其他报文或解码失败返回 nullopt。
    // 域名交给网关自己解析，结果再交给 answerAssignedIps
    static std::optional<p2p::AssignedIps> readAssignedIps(const IpPacket& packet);

    // handleAssignedIps，并把 DomainStatus 封装成发回客户端的控制报文
    std::optional<IpPacket> answerAssignedIps(const p2p::AssignedIps& msg, const std::vector<IpAddr>& resolved);

    // 客户端 -> 资源；目标不是代理 IP 时原样返回，转换失败返回 nullopt
    std::optional<IpPacket> translateOutbound(IpPacket packet, Instant now);

    // 资源 -> 客户端；不属于任何 NAT 会话时原样返回，转换失败返回 nullopt
    std::optional<IpPacket> translateInbound(IpPacket packet, Instant now);

    std::optional<IpAddr> realAddress(const IpAddr& proxyIp) const;

    void removeDomain(const std::string& domain);
    void clear();

    void handleTimeout(Instant now);
    std::optional<Instant> pollTimeout() const { return sessions_.pollTimeout(); }

    size_t mappingCount() const { return mappings_.size(); }
    size_t sessionCount() const { return sessions_.size(); }

private:
    struct Mapping {
        IpAddr real;
        std::string domain;
        ResourceId resource;
    };

    /**
     * NAT 会话的一端：(协议, 本端端口, 对端地址, 对端端口)
     *
     * ICMP 与 ICMPv6 归一成同一个协议号，本端端口放 echo identifier，对端端口为 0。
     * 客户端一侧的对端地址是代理 IP，资源一侧是真实地址。
     */
    struct NatTuple {
        uint8_t protocol = 0;
        uint16_t port = 0;
        IpAddr remote;
        uint16_t remotePort = 0;

        bool operator==(const NatTuple& o) const {
            return protocol == o.protocol && port == o.port && remote == o.remote && remotePort == o.remotePort;
        }
    };

    struct NatTupleHash {
        size_t operator()(const NatTuple& k) const {
            size_t seed = std::hash<IpAddr>{}(k.remote);
            seed ^= std::hash<uint32_t>{}((static_cast<uint32_t>(k.port) << 16) | k.remotePort) + 0x9e3779b9 +
                    (seed << 6) + (seed >> 2);
            seed ^= std::hash<uint8_t>{}(k.protocol) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            return seed;
        }
    };

    struct Session {
        NatTuple outside;
        IpAddr client;
    };

    static std::optional<NatTuple> outboundTuple(const IpPacket& packet);
    static std::optional<NatTuple> inboundTuple(const IpPacket& packet);
    static bool rewritePort(IpPacket& packet, bool source, uint16_t port);

    // 从客户端端口开始找第一个没被占用的网关端口
    std::optional<uint16_t> allocatePort(const NatTuple& inside, const IpAddr& real) const;
    void dropSession(const NatTuple& inside);

    const IpAddr& clientAddress(IpFamily family) const { return family == IpFamily::V4 ? client_v4_ : client_v6_; }

private:
    IpAddr client_v4_;
    IpAddr client_v6_;

    std::unordered_map<IpAddr, Mapping> mappings_;

    // 客户端一侧 -> 会话；资源一侧 -> 客户端一侧
    ExpiringMap<NatTuple, Session, NatTupleHash> sessions_;
    std::unordered_map<NatTuple, NatTuple, NatTupleHash> by_outside_;
};

} // namespace tunnel

#endif // proxy_nat_hpp
