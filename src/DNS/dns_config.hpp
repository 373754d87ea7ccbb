#ifndef dns_config_hpp
#define dns_config_hpp

#include <deque>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../Common/ip_addr.hpp"

namespace dns {

using tunnel::IpAddr;
using tunnel::SocketAddr;

/**
 * 哨兵 IP <-> 真实上游 DNS 服务器 的双向映射
 *
 * 保留分配顺序（sentinelServers() 的顺序就是上游的优先级顺序）。
 */
class DnsMapping {
public:
    DnsMapping() = default;

    void add(const IpAddr& sentinel, const SocketAddr& upstream);

    std::vector<IpAddr> sentinelServers() const;
    std::vector<SocketAddr> upstreamServers() const;

    std::optional<IpAddr> sentinelByUpstream(const SocketAddr& upstream) const;
    std::optional<SocketAddr> upstreamBySentinel(const IpAddr& sentinel) const;

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    bool operator==(const DnsMapping& o) const { return entries_ == o.entries_; }
    bool operator!=(const DnsMapping& o) const { return !(*this == o); }

private:
    std::vector<std::pair<IpAddr, SocketAddr>> entries_;
    std::unordered_map<IpAddr, size_t> bySentinel_;
    std::unordered_map<SocketAddr, size_t> byUpstream_;
};

struct DnsServersUpdated {
    DnsMapping mapping;
};

/**
 * 计算生效的上游 DNS 服务器并维护哨兵映射
 *
 * 优先级：门户下发的 Do53 > 系统解析器 > 回退解析器。
 * 落在哨兵网段内的地址一律剔除，避免解析环路。
 * 生效集合（无序）不变时不做任何事；变化时整体重算映射，
 * 且新哨兵不复用旧哨兵 IP。
 */
class DnsConfig {
public:
    DnsConfig() = default;

    // 返回映射是否发生变化
    bool updateSystemResolvers(const std::vector<IpAddr>& servers);
    bool updateUpstreamDo53(const std::vector<SocketAddr>& servers);
    bool updateFallbackResolvers(const std::vector<IpAddr>& servers);

    // 即使生效集合未变也重新分配哨兵（网络切换时使用）
    bool recompute();

    const DnsMapping& mapping() const { return mapping_; }
    std::vector<SocketAddr> effectiveServers() const;

    bool hasCustomUpstream() const { return !upstream_do53_.empty(); }
    const std::vector<IpAddr>& systemResolvers() const { return system_resolvers_; }

    std::optional<DnsServersUpdated> pollEvent();

    static DnsMapping sentinelDnsMapping(const std::vector<SocketAddr>& servers,
                                         const std::vector<IpAddr>& oldSentinels);

private:
    bool updateDnsMapping(bool force);

private:
    std::vector<IpAddr> system_resolvers_;
    std::vector<SocketAddr> upstream_do53_;
    std::vector<IpAddr> fallback_do53_;
    // 未过滤的原始回退列表，用于识别系统解析器就是回退配置的情况
    std::vector<IpAddr> fallback_configured_;

    DnsMapping mapping_;
    std::deque<DnsServersUpdated> events_;
};

} // namespace dns

#endif // dns_config_hpp
