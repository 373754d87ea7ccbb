#include "dns_resource_nat.hpp"
#include "../Common/logging.hpp"

namespace tunnel {

DnsResourceNat::DnsResourceNat(DnsResourceNatOptions options) : options_(options) {}

void DnsResourceNat::queueAssignedIps(const Key& key, const Entry& entry) {
    assigned_ips_packets_.push_back(AssignedIpsPacket{key.first, key.second, entry.assignedIps});
}

void DnsResourceNat::update(const std::string& domain, const GatewayId& gateway, const ResourceId& resource,
                            const std::vector<IpAddr>& proxyIps, std::vector<IpPacket> packetsForDomain,
                            Instant now) {
    Key key(gateway, domain);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        p2p::AssignedIps msg(resource, domain, proxyIps);
        auto packet = p2p::makeControlPacket(p2p::encodeAssignedIps(msg));
        if (!packet) {
            return;
        }

        Entry entry{StateKind::Pending, now, UniquePacketBuffer(options_.bufferCapacity, "dns-resource-nat-initial"),
                    true, std::move(*packet)};
        entry.buffered.extend(std::move(packetsForDomain));

        it = entries_.emplace(key, std::move(entry)).first;
        queueAssignedIps(key, it->second);
        TUN_LOG_DEBUG("dns resource nat: setting up NAT for %s on gateway %s", domain.c_str(),
                      gateway.toString().c_str());
        return;
    }

    Entry& entry = it->second;
    switch (entry.kind) {
        case StateKind::Failed:
        case StateKind::Confirmed:
            break;
        case StateKind::Recreating:
            entry.kind = StateKind::Pending;
            entry.sentAt = now;
            entry.buffered = UniquePacketBuffer(options_.bufferCapacity, "dns-resource-nat-recreating");
            entry.buffered.extend(std::move(packetsForDomain));
            queueAssignedIps(key, entry);
            break;
        case StateKind::Pending:
            entry.buffered.extend(std::move(packetsForDomain));
            if (shouldResend(now, entry.sentAt)) {
                entry.sentAt = now;
                queueAssignedIps(key, entry);
            }
            break;
    }
}

void DnsResourceNat::recreate(const std::string& domain) {
    for (auto& [key, entry] : entries_) {
        if (key.second != domain) continue;

        switch (entry.kind) {
            case StateKind::Recreating:
            case StateKind::Pending:
                continue;
            case StateKind::Confirmed:
                // 已确认的 NAT 继续转发，不缓冲
                entry.shouldBuffer = false;
                break;
            case StateKind::Failed:
                entry.shouldBuffer = true;
                break;
        }

        TUN_LOG_DEBUG("dns resource nat: re-creating NAT for %s", domain.c_str());
        entry.kind = StateKind::Recreating;
    }
}

std::optional<IpPacket> DnsResourceNat::handleOutgoing(const GatewayId& gateway, const std::string& domain,
                                                       IpPacket packet, Instant now) {
    Key key(gateway, domain);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        TUN_LOG_DEBUG("dns resource nat: no entry for %s on gateway %s", domain.c_str(),
                      gateway.toString().c_str());
        return packet;
    }

    Entry& entry = it->second;
    if (entry.kind != StateKind::Pending) {
        // Failed 状态下网关可能会丢弃这些报文，这里无能为力
        return packet;
    }

    if (shouldResend(now, entry.sentAt)) {
        entry.sentAt = now;
        queueAssignedIps(key, entry);
    }

    if (entry.shouldBuffer) {
        entry.buffered.push(std::move(packet));
        return std::nullopt;
    }
    return packet;
}

std::vector<IpPacket> DnsResourceNat::onDomainStatus(const GatewayId& gateway, const p2p::DomainStatus& status) {
    auto it = entries_.find(Key(gateway, status.domain));
    if (it == entries_.end()) {
        TUN_LOG_DEBUG("dns resource nat: no state for %s on gateway %s, ignoring status", status.domain.c_str(),
                      gateway.toString().c_str());
        return {};
    }

    Entry& entry = it->second;

    if (status.status != p2p::NatStatus::Active) {
        TUN_LOG_DEBUG("dns resource nat: NAT for %s is not active", status.domain.c_str());
        entry.kind = StateKind::Failed;
        entry.buffered.drain();
        return {};
    }

    TUN_LOG_DEBUG("dns resource nat: NAT for %s is active, releasing %zu buffered packets", status.domain.c_str(),
                  entry.kind == StateKind::Pending ? entry.buffered.size() : size_t(0));

    std::vector<IpPacket> released;
    if (entry.kind == StateKind::Pending) {
        released = entry.buffered.drain();
    }
    entry.kind = StateKind::Confirmed;
    return released;
}

std::optional<AssignedIpsPacket> DnsResourceNat::pollPacket() {
    if (assigned_ips_packets_.empty()) return std::nullopt;
    AssignedIpsPacket p = std::move(assigned_ips_packets_.front());
    assigned_ips_packets_.pop_front();
    return p;
}

void DnsResourceNat::clearByGateway(const GatewayId& gateway) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.first == gateway) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void DnsResourceNat::clearByDomain(const std::string& domain) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.second == domain) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void DnsResourceNat::clear() {
    entries_.clear();
}

std::optional<DnsResourceNat::StateKind> DnsResourceNat::state(const GatewayId& gateway,
                                                              const std::string& domain) const {
    auto it = entries_.find(Key(gateway, domain));
    if (it == entries_.end()) return std::nullopt;
    return it->second.kind;
}

size_t DnsResourceNat::bufferedPackets(const GatewayId& gateway, const std::string& domain) const {
    auto it = entries_.find(Key(gateway, domain));
    if (it == entries_.end() || it->second.kind != StateKind::Pending) return 0;
    return it->second.buffered.size();
}

} // namespace tunnel
