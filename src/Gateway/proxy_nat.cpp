#include "proxy_nat.hpp"
#include "../Common/logging.hpp"

#include <stdexcept>

namespace tunnel {

ProxyNat::ProxyNat(const IpAddr& clientV4, const IpAddr& clientV6)
    : client_v4_(clientV4), client_v6_(clientV6) {
    if (!clientV4.isV4() || !clientV6.isV6()) {
        throw std::invalid_argument("ProxyNat needs the client's IPv4 and IPv6 tunnel addresses");
    }
}

p2p::DomainStatus ProxyNat::handleAssignedIps(const p2p::AssignedIps& msg, const std::vector<IpAddr>& resolved) {
    // 同一 (资源, 域名) 之前的映射整体替换
    for (auto it = mappings_.begin(); it != mappings_.end();) {
        if (it->second.domain == msg.domain() && it->second.resource == msg.resource()) {
            it = mappings_.erase(it);
        } else {
            ++it;
        }
    }

    std::vector<IpAddr> v4;
    std::vector<IpAddr> v6;
    for (const auto& ip : resolved) {
        (ip.isV4() ? v4 : v6).push_back(ip);
    }

    p2p::DomainStatus status;
    status.resource = msg.resource();
    status.domain = msg.domain();

    if (resolved.empty()) {
        TUN_LOG_DEBUG("proxy nat: %s did not resolve to any address", msg.domain().c_str());
        status.status = p2p::NatStatus::Inactive;
        return status;
    }

    size_t next4 = 0;
    size_t next6 = 0;
    for (const auto& proxy : msg.proxyIps()) {
        const std::vector<IpAddr>* pool = proxy.isV4() ? &v4 : &v6;
        size_t* cursor = proxy.isV4() ? &next4 : &next6;
        if (pool->empty()) {
            // 没有同族地址，借用另一族
            pool = proxy.isV4() ? &v6 : &v4;
            cursor = proxy.isV4() ? &next6 : &next4;
        }

        const IpAddr& real = (*pool)[*cursor % pool->size()];
        ++*cursor;

        mappings_[proxy] = Mapping{real, msg.domain(), msg.resource()};
        TUN_LOG_TRACE("proxy nat: %s -> %s (%s)", proxy.toString().c_str(), real.toString().c_str(),
                      msg.domain().c_str());
    }

    TUN_LOG_DEBUG("proxy nat: %zu proxy IPs set up for %s", msg.proxyIps().size(), msg.domain().c_str());
    status.status = p2p::NatStatus::Active;
    return status;
}

std::optional<ProxyNat::NatTuple> ProxyNat::outboundTuple(const IpPacket& packet) {
    if (auto id = packet.icmpEchoId()) {
        return NatTuple{ipproto::kIcmp, *id, packet.destination(), 0};
    }

    auto sport = packet.sourcePort();
    auto dport = packet.destinationPort();
    if (!sport || !dport) return std::nullopt;
    return NatTuple{packet.protocol(), *sport, packet.destination(), *dport};
}

std::optional<ProxyNat::NatTuple> ProxyNat::inboundTuple(const IpPacket& packet) {
    if (auto id = packet.icmpEchoId()) {
        return NatTuple{ipproto::kIcmp, *id, packet.source(), 0};
    }

    auto sport = packet.sourcePort();
    auto dport = packet.destinationPort();
    if (!sport || !dport) return std::nullopt;
    return NatTuple{packet.protocol(), *dport, packet.source(), *sport};
}

bool ProxyNat::rewritePort(IpPacket& packet, bool source, uint16_t port) {
    if (packet.icmpEchoId()) {
        return packet.setIcmpEchoId(port);
    }
    return source ? packet.setSourcePort(port) : packet.setDestinationPort(port);
}

std::optional<uint16_t> ProxyNat::allocatePort(const NatTuple& inside, const IpAddr& real) const {
    NatTuple outside{inside.protocol, inside.port, real, inside.remotePort};
    for (uint32_t i = 0; i < 0xFFFF; ++i) {
        if (by_outside_.find(outside) == by_outside_.end()) {
            return outside.port;
        }
        outside.port = outside.port == 0xFFFF ? 1 : static_cast<uint16_t>(outside.port + 1);
    }
    return std::nullopt;
}

void ProxyNat::dropSession(const NatTuple& inside) {
    if (auto old = sessions_.remove(inside)) {
        by_outside_.erase(old->outside);
    }
}

std::optional<p2p::AssignedIps> ProxyNat::readAssignedIps(const IpPacket& packet) {
    if (!p2p::isControlPacket(packet)) {
        return std::nullopt;
    }

    try {
        if (p2p::peekEventType(packet.payload(), packet.payloadLength()) != p2p::EventType::AssignedIps) {
            return std::nullopt;
        }
        return p2p::decodeAssignedIps(packet.payload(), packet.payloadLength());
    } catch (const p2p::DecodeError& e) {
        TUN_LOG_DEBUG("proxy nat: malformed control message: %s", e.what());
    }
    return std::nullopt;
}

std::optional<IpPacket> ProxyNat::answerAssignedIps(const p2p::AssignedIps& msg, const std::vector<IpAddr>& resolved) {
    p2p::DomainStatus status = handleAssignedIps(msg, resolved);
    return p2p::makeControlPacket(p2p::encodeDomainStatus(status));
}

std::optional<IpPacket> ProxyNat::translateOutbound(IpPacket packet, Instant now) {
    IpAddr proxy = packet.destination();

    auto it = mappings_.find(proxy);
    if (it == mappings_.end()) {
        return packet;
    }
    const IpAddr real = it->second.real;

    auto inside = outboundTuple(packet);
    if (!inside) {
        TUN_LOG_DEBUG("proxy nat: dropping untranslatable packet (protocol %u) to %s",
                      static_cast<unsigned>(packet.protocol()), proxy.toString().c_str());
        return std::nullopt;
    }

    // 映射换了真实地址后旧会话作废
    const auto* entry = sessions_.get(*inside);
    if (entry && entry->value.outside.remote != real) {
        dropSession(*inside);
        entry = nullptr;
    }

    Session session;
    if (entry) {
        session = entry->value;
    } else {
        auto port = allocatePort(*inside, real);
        if (!port) {
            TUN_LOG_WARN("proxy nat: no free port towards %s", real.toString().c_str());
            return std::nullopt;
        }
        session = Session{NatTuple{inside->protocol, *port, real, inside->remotePort}, packet.source()};
        by_outside_[session.outside] = *inside;

        TUN_LOG_TRACE("proxy nat: new session %s -> %s, port %u -> %u", proxy.toString().c_str(),
                      real.toString().c_str(), static_cast<unsigned>(inside->port), static_cast<unsigned>(*port));
    }
    sessions_.insert(*inside, session, now, kSessionTtl);

    if (session.outside.port != inside->port) {
        rewritePort(packet, true, session.outside.port);
    }

    if (real.family == proxy.family) {
        packet.setDestination(real);
        packet.updateChecksum();
        return packet;
    }

    const IpAddr& src = clientAddress(real.family);
    auto translated = real.isV4() ? consumeToIpv4(std::move(packet), src, real)
                                  : consumeToIpv6(std::move(packet), src, real);
    if (!translated) {
        return std::nullopt;
    }
    translated->updateChecksum();
    return translated;
}

std::optional<IpPacket> ProxyNat::translateInbound(IpPacket packet, Instant now) {
    auto outside = inboundTuple(packet);
    if (!outside) {
        return packet;
    }

    auto it = by_outside_.find(*outside);
    if (it == by_outside_.end()) {
        return packet;
    }
    const NatTuple inside = it->second;

    const auto* entry = sessions_.get(inside);
    if (!entry) {
        by_outside_.erase(it);
        return packet;
    }
    Session session = entry->value;

    // 回包也刷新会话
    sessions_.insert(inside, session, now, kSessionTtl);

    if (inside.port != outside->port) {
        rewritePort(packet, false, inside.port);
    }

    const IpAddr& proxy = inside.remote;
    if (proxy.family == packet.family()) {
        packet.setSource(proxy);
        packet.setDestination(session.client);
        packet.updateChecksum();
        return packet;
    }

    auto translated = proxy.isV4() ? consumeToIpv4(std::move(packet), proxy, session.client)
                                   : consumeToIpv6(std::move(packet), proxy, session.client);
    if (!translated) {
        return std::nullopt;
    }
    translated->updateChecksum();
    return translated;
}

std::optional<IpAddr> ProxyNat::realAddress(const IpAddr& proxyIp) const {
    auto it = mappings_.find(proxyIp);
    if (it == mappings_.end()) return std::nullopt;
    return it->second.real;
}

void ProxyNat::removeDomain(const std::string& domain) {
    for (auto it = mappings_.begin(); it != mappings_.end();) {
        if (it->second.domain == domain) {
            it = mappings_.erase(it);
        } else {
            ++it;
        }
    }
}

void ProxyNat::clear() {
    mappings_.clear();
    sessions_.clear();
    by_outside_.clear();
}

void ProxyNat::handleTimeout(Instant now) {
    sessions_.handleTimeout(now);
    while (auto ev = sessions_.pollEvent()) {
        by_outside_.erase(ev->value.outside);
        TUN_LOG_TRACE("proxy nat: session %s:%u via %s expired", ev->value.outside.remote.toString().c_str(),
                      static_cast<unsigned>(ev->value.outside.remotePort), ev->key.remote.toString().c_str());
    }
}

} // namespace tunnel
