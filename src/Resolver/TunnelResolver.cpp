#include "TunnelResolver.hpp"
#include "../Common/logging.hpp"
#include "../DNS/dns_message.hpp"
#include "../Filter/domain_pattern.h"
#include "../Net/system_resolvers.hpp"

#include <algorithm>

using namespace tunnel;

static dns::NameserverSetOptions nameserverOptions(const TunnelConfig& config) {
    dns::NameserverSetOptions options;
    options.evaluationDomain = config.evaluationDomain;
    options.evaluationTimeout = config.evaluationTimeout;
    options.maxInFlight = config.maxConcurrentEvaluations;
    return options;
}

static DnsResourceNatOptions natOptions(const TunnelConfig& config) {
    DnsResourceNatOptions options;
    options.resendInterval = config.assignedIpsResendInterval;
    options.bufferCapacity = config.natBufferCapacity;
    return options;
}

TunnelResolver::TunnelResolver(const TunnelConfig& config, SocketFactory& socketFactory, Instant now)
    : mCache(config.dnsCacheMinTtlSecs)
    , mNameservers(socketFactory, nameserverOptions(config))
    , mNat(natOptions(config))
    , mResolvConfPath(config.resolvConfPath)
    , mEvaluationInterval(config.nameserverEvaluationInterval)
    , mNextEvaluation(now + config.nameserverEvaluationInterval)
{
    for (const auto& resource : config.resources) {
        addResource(resource);
    }

    mDnsConfig.updateFallbackResolvers(config.fallbackDns);
    mDnsConfig.updateUpstreamDo53(config.upstreamDns);
    processConfigEvents(now);
}

void TunnelResolver::addResource(Resource resource) {
    const ResourceId id = resourceId(resource);

    mStub.removeResource(id);
    if (const auto* dnsResource = std::get_if<DnsResource>(&resource)) {
        mStub.addResource(id, dnsResource->address, dnsResource->ipStack);
    }

    mResources.insert(std::move(resource));
}

bool TunnelResolver::removeResource(const ResourceId& id) {
    mStub.removeResource(id);
    return mResources.remove(id);
}

ResolverResult TunnelResolver::onDnsQuery(const IpAddr& sentinel, const uint8_t* data, size_t length, Instant now) {
    ResolverResult result;

    auto sentinelUpstream = mDnsConfig.mapping().upstreamBySentinel(sentinel);
    if (!sentinelUpstream) {
        TUN_LOG_DEBUG("tunnel resolver: %s is not a DNS sentinel, dropping query", sentinel.toString().c_str());
        return result;
    }

    dns::DNSParser parser;
    dns::DNSMessage query;
    if (!parser.parse(data, length, query) || query.header.isResponse() || query.questions.empty()) {
        TUN_LOG_DEBUG("tunnel resolver: dropping malformed DNS query (%zu bytes)", length);
        return result;
    }

    // 1. 命中资源的查询由桩解析器处理
    dns::ResolveStrategy strategy = mStub.handle(query);

    while (auto ev = mStub.pollEvent()) {
        mEvents.push_back(std::move(*ev));
    }

    switch (strategy.kind) {
        case dns::ResolveStrategy::Kind::LocalResponse:
            // 客户端重新查询，让网关重新解析该域名
            mNat.recreate(DomainPattern::normalize(query.domain()));

            if (!dns::DNSBuilder::serialize(strategy.response, result.responseData)) {
                TUN_LOG_WARN("tunnel resolver: cannot encode local response for %s", query.domain().c_str());
                result.responseData.clear();
                return result;
            }
            result.action = ResolverAction::InjectResponse;
            return result;

        case dns::ResolveStrategy::Kind::RecurseSite:
            result.action = ResolverAction::ForwardSite;
            result.resource = strategy.resource;
            return result;

        case dns::ResolveStrategy::Kind::RecurseLocal:
            break;
    }

    // 2. 查询 DNS response cache
    if (mCache.tryAnswer(query, now, result.responseData)) {
        result.action = ResolverAction::InjectResponse;
        return result;
    }

    // 3. 转发上游
    return forwardUpstream(query, *sentinelUpstream);
}

ResolverResult TunnelResolver::forwardUpstream(const dns::DNSMessage& query, const SocketAddr& sentinelUpstream) {
    ResolverResult result;
    result.action = ResolverAction::ForwardUpstream;
    result.upstream = sentinelUpstream;

    // 测速最快的服务器优先（端口沿用生效列表里的配置）
    if (auto fastest = mNameservers.fastest()) {
        for (const auto& server : mDnsConfig.effectiveServers()) {
            if (server.ip == *fastest) {
                result.upstream = server;
                break;
            }
        }
    }

    TUN_LOG_TRACE("tunnel resolver: forwarding %s to %s", query.domain().c_str(),
                  result.upstream.toString().c_str());
    return result;
}

bool TunnelResolver::onUpstreamResponse(const uint8_t* data, size_t length, Instant now) {
    dns::DNSParser parser;
    dns::DNSMessage msg;
    if (!parser.parse(data, length, msg) || msg.questions.empty()) {
        TUN_LOG_DEBUG("tunnel resolver: ignoring malformed upstream response (%zu bytes)", length);
        return false;
    }

    return mCache.insert(msg.domain(), data, length, now);
}

void TunnelResolver::setSystemResolvers(const std::vector<IpAddr>& servers, Instant now) {
    mDnsConfig.updateSystemResolvers(servers);
    processConfigEvents(now);
}

void TunnelResolver::setUpstreamDns(const std::vector<SocketAddr>& servers, Instant now) {
    mDnsConfig.updateUpstreamDo53(servers);
    processConfigEvents(now);
}

void TunnelResolver::setFallbackDns(const std::vector<IpAddr>& servers, Instant now) {
    mDnsConfig.updateFallbackResolvers(servers);
    processConfigEvents(now);
}

void TunnelResolver::refreshSystemResolvers(Instant now) {
    setSystemResolvers(readSystemResolvers(mResolvConfPath), now);
}

void TunnelResolver::resetNetwork(Instant now) {
    TUN_LOG_INFO("tunnel resolver: network changed, resetting DNS state");

    mCache.flush("network reset");
    mNameservers.reset();
    mNat.clear();

    mDnsConfig.recompute();
    processConfigEvents(now);
}

void TunnelResolver::processConfigEvents(Instant now) {
    bool changed = false;
    while (auto ev = mDnsConfig.pollEvent()) {
        changed = true;
        mEvents.push_back(std::move(*ev));
    }
    if (!changed) {
        return;
    }

    // 上游变了，旧服务器的应答不能再用
    mCache.flush("effective DNS servers changed");
    evaluateNameservers(now);
}

void TunnelResolver::evaluateNameservers(Instant now) {
    std::vector<IpAddr> candidates;
    for (const auto& server : mDnsConfig.effectiveServers()) {
        if (std::find(candidates.begin(), candidates.end(), server.ip) == candidates.end()) {
            candidates.push_back(server.ip);
        }
    }

    mNameservers.setNameservers(std::move(candidates));
    mNameservers.evaluate(now);
    mNextEvaluation = now + mEvaluationInterval;
}

void TunnelResolver::handleTimeout(Instant now) {
    mCache.handleTimeout(now);

    if (now >= mNextEvaluation) {
        evaluateNameservers(now);
    }

    mNameservers.poll(now);
}

std::optional<Instant> TunnelResolver::pollTimeout() const {
    std::optional<Instant> earliest = mNextEvaluation;

    for (auto t : {mCache.pollTimeout(), mNameservers.pollTimeout()}) {
        if (t && *t < *earliest) {
            earliest = t;
        }
    }
    return earliest;
}

std::optional<ResolverEvent> TunnelResolver::pollEvent() {
    while (auto ev = mStub.pollEvent()) {
        mEvents.push_back(std::move(*ev));
    }

    if (mEvents.empty()) {
        return std::nullopt;
    }
    ResolverEvent ev = std::move(mEvents.front());
    mEvents.pop_front();
    return ev;
}

const Resource* TunnelResolver::resolveResource(const IpAddr& dst) const {
    if (const auto* assigned = mStub.resolveResourceByIp(dst)) {
        if (const auto* resource = mResources.getById(assigned->second)) {
            return resource;
        }
    }

    if (const auto* resource = mResources.getByIp(dst)) {
        return resource;
    }

    if (const auto* internet = mResources.internetResource()) {
        return mResources.getById(internet->id);
    }
    return nullptr;
}

std::optional<IpPacket> TunnelResolver::onOutboundPacket(IpPacket packet, const GatewayId& gateway, Instant now) {
    const auto* assigned = mStub.resolveResourceByIp(packet.destination());
    if (!assigned) {
        return packet;
    }

    const std::string& domain = assigned->first;
    const auto* proxyIps = mStub.assignedIps(domain, assigned->second);
    if (!proxyIps) {
        return packet;
    }

    try {
        mNat.update(domain, gateway, assigned->second, *proxyIps, {}, now);
    } catch (const p2p::InvalidProxyIpCount& e) {
        TUN_LOG_WARN("tunnel resolver: cannot set up NAT for %s: %s", domain.c_str(), e.what());
        return std::nullopt;
    } catch (const p2p::EncodeError& e) {
        TUN_LOG_WARN("tunnel resolver: cannot set up NAT for %s: %s", domain.c_str(), e.what());
        return std::nullopt;
    }

    return mNat.handleOutgoing(gateway, domain, std::move(packet), now);
}

std::vector<IpPacket> TunnelResolver::onControlPacket(const GatewayId& gateway, const IpPacket& packet) {
    if (!p2p::isControlPacket(packet)) {
        return {};
    }

    try {
        switch (p2p::peekEventType(packet.payload(), packet.payloadLength())) {
            case p2p::EventType::DomainStatus:
                return mNat.onDomainStatus(gateway, p2p::decodeDomainStatus(packet.payload(), packet.payloadLength()));
            case p2p::EventType::Goodbye:
                TUN_LOG_DEBUG("tunnel resolver: gateway %s said goodbye", gateway.toString().c_str());
                mNat.clearByGateway(gateway);
                return {};
            case p2p::EventType::AssignedIps:
                TUN_LOG_DEBUG("tunnel resolver: ignoring AssignedIps from gateway %s", gateway.toString().c_str());
                return {};
        }
    } catch (const p2p::DecodeError& e) {
        TUN_LOG_DEBUG("tunnel resolver: malformed control message from %s: %s", gateway.toString().c_str(), e.what());
    }
    return {};
}
