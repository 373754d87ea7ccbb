#include "dns_config.hpp"
#include "../Common/ip_provider.hpp"
#include "../Common/logging.hpp"

#include <unordered_set>

namespace dns {

static constexpr uint16_t kDnsPort = 53;

static std::string joinServers(const std::vector<SocketAddr>& servers) {
    std::string out;
    for (const auto& s : servers) {
        if (!out.empty()) out += ", ";
        out += s.toString();
    }
    return out;
}

void DnsMapping::add(const IpAddr& sentinel, const SocketAddr& upstream) {
    size_t index = entries_.size();
    entries_.emplace_back(sentinel, upstream);
    bySentinel_[sentinel] = index;
    byUpstream_.emplace(upstream, index);
}

std::vector<IpAddr> DnsMapping::sentinelServers() const {
    std::vector<IpAddr> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.first);
    return out;
}

std::vector<SocketAddr> DnsMapping::upstreamServers() const {
    std::vector<SocketAddr> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.second);
    return out;
}

std::optional<IpAddr> DnsMapping::sentinelByUpstream(const SocketAddr& upstream) const {
    auto it = byUpstream_.find(upstream);
    if (it == byUpstream_.end()) return std::nullopt;
    return entries_[it->second].first;
}

std::optional<SocketAddr> DnsMapping::upstreamBySentinel(const IpAddr& sentinel) const {
    auto it = bySentinel_.find(sentinel);
    if (it == bySentinel_.end()) return std::nullopt;
    return entries_[it->second].second;
}

template <typename T, typename F>
static std::vector<T> withoutSentinels(const std::vector<T>& servers, F&& ipOf) {
    std::vector<T> out;
    for (const auto& s : servers) {
        if (tunnel::ranges::isSentinel(ipOf(s))) {
            TUN_LOG_DEBUG("dns config: dropping sentinel %s from server list", ipOf(s).toString().c_str());
            continue;
        }
        out.push_back(s);
    }
    return out;
}

static const IpAddr& ipOfIp(const IpAddr& ip) { return ip; }
static const IpAddr& ipOfSocket(const SocketAddr& sa) { return sa.ip; }

bool DnsConfig::updateSystemResolvers(const std::vector<IpAddr>& servers) {
    if (servers == fallback_configured_) {
        TUN_LOG_DEBUG("dns config: system resolvers equal the fallback resolvers, ignoring");
        return false;
    }

    system_resolvers_ = withoutSentinels(servers, ipOfIp);
    return updateDnsMapping(false);
}

bool DnsConfig::updateUpstreamDo53(const std::vector<SocketAddr>& servers) {
    upstream_do53_ = withoutSentinels(servers, ipOfSocket);
    return updateDnsMapping(false);
}

bool DnsConfig::updateFallbackResolvers(const std::vector<IpAddr>& servers) {
    fallback_configured_ = servers;
    fallback_do53_ = withoutSentinels(servers, ipOfIp);
    return updateDnsMapping(false);
}

bool DnsConfig::recompute() {
    return updateDnsMapping(true);
}

std::vector<SocketAddr> DnsConfig::effectiveServers() const {
    if (!upstream_do53_.empty()) {
        return upstream_do53_;
    }

    const auto& ips = !system_resolvers_.empty() ? system_resolvers_ : fallback_do53_;

    std::vector<SocketAddr> out;
    out.reserve(ips.size());
    for (const auto& ip : ips) {
        out.emplace_back(ip, kDnsPort);
    }
    return out;
}

bool DnsConfig::updateDnsMapping(bool force) {
    auto effective = effectiveServers();

    std::unordered_set<SocketAddr> next(effective.begin(), effective.end());
    auto currentList = mapping_.upstreamServers();
    std::unordered_set<SocketAddr> current(currentList.begin(), currentList.end());

    if (next == current && (!force || effective.empty())) {
        TUN_LOG_DEBUG("dns config: effective DNS servers are unchanged (%s)", joinServers(effective).c_str());
        return false;
    }

    mapping_ = sentinelDnsMapping(effective, mapping_.sentinelServers());

    TUN_LOG_INFO("dns config: effective DNS servers changed to [%s]", joinServers(effective).c_str());
    events_.push_back(DnsServersUpdated{mapping_});
    return true;
}

DnsMapping DnsConfig::sentinelDnsMapping(const std::vector<SocketAddr>& servers,
                                         const std::vector<IpAddr>& oldSentinels) {
    auto provider = tunnel::IpProvider::forStubDnsServers(oldSentinels);

    DnsMapping mapping;
    for (const auto& server : servers) {
        if (mapping.sentinelByUpstream(server)) {
            continue;
        }

        auto sentinel = provider.nextFor(server.ip.family);
        if (!sentinel) {
            TUN_LOG_WARN("dns config: no sentinel left for %s", server.toString().c_str());
            continue;
        }
        mapping.add(*sentinel, server);
    }
    return mapping;
}

std::optional<DnsServersUpdated> DnsConfig::pollEvent() {
    if (events_.empty()) return std::nullopt;
    DnsServersUpdated ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

} // namespace dns
