#ifndef dns_resource_nat_hpp
#define dns_resource_nat_hpp

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "p2p_control.hpp"
#include "../Common/clock.hpp"
#include "../Common/uuid.hpp"
#include "../Packet/ip_packet.hpp"
#include "../Packet/unique_packet_buffer.hpp"

namespace tunnel {

struct DnsResourceNatOptions {
    Duration resendInterval = std::chrono::seconds(2);
    size_t bufferCapacity = 32;
};

// 待发给网关的 AssignedIps 控制报文
struct AssignedIpsPacket {
    GatewayId gateway;
    std::string domain;
    IpPacket packet;
};

/**
 * 客户端侧：每个 (网关, 域名) 的 DNS 资源 NAT 状态
 *
 * 代理 IP 由客户端分配，网关要建立 NAT 表后才能转发到真实地址；
 * 在此之前发往这些地址的报文先缓冲起来，收到 DomainStatus::Active 后一次性放行。
 *
 *   Pending     已发送 AssignedIps，等待网关确认（每 resendInterval 重发一次）
 *   Confirmed   网关已确认
 *   Failed      网关回复 Inactive
 *   Recreating  客户端重新查询了该域名，下次 update() 时重发 AssignedIps
 */
class DnsResourceNat {
public:
    explicit DnsResourceNat(DnsResourceNatOptions options = {});

    // proxyIps 个数不是 4 或 8 时抛出 p2p::InvalidProxyIpCount，
    // 域名无法编码时抛出 p2p::EncodeError；两种情况都不建立状态
    void update(const std::string& domain, const GatewayId& gateway, const ResourceId& resource,
                const std::vector<IpAddr>& proxyIps, std::vector<IpPacket> packetsForDomain, Instant now);

    // 客户端每次查询该域名时调用，让网关重新解析
    void recreate(const std::string& domain);

    // 需要缓冲时返回 nullopt，否则原样返回报文
    std::optional<IpPacket> handleOutgoing(const GatewayId& gateway, const std::string& domain,
                                           IpPacket packet, Instant now);

    // 返回可以放行的缓冲报文
    std::vector<IpPacket> onDomainStatus(const GatewayId& gateway, const p2p::DomainStatus& status);

    std::optional<AssignedIpsPacket> pollPacket();

    void clearByGateway(const GatewayId& gateway);
    void clearByDomain(const std::string& domain);
    void clear();

    enum class StateKind {
        Pending,
        Recreating,
        Confirmed,
        Failed,
    };

    std::optional<StateKind> state(const GatewayId& gateway, const std::string& domain) const;
    size_t bufferedPackets(const GatewayId& gateway, const std::string& domain) const;

private:
    struct Entry {
        StateKind kind;
        Instant sentAt;
        UniquePacketBuffer buffered;
        bool shouldBuffer;
        IpPacket assignedIps;
    };

    using Key = std::pair<GatewayId, std::string>;

    bool shouldResend(Instant now, Instant sentAt) const { return now - sentAt >= options_.resendInterval; }
    void queueAssignedIps(const Key& key, const Entry& entry);

private:
    DnsResourceNatOptions options_;
    std::map<Key, Entry> entries_;
    std::deque<AssignedIpsPacket> assigned_ips_packets_;
};

} // namespace tunnel

#endif // dns_resource_nat_hpp
