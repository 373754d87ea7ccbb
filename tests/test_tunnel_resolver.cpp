#include "../src/Gateway/proxy_nat.hpp"
#include "../src/Resolver/TunnelResolver.hpp"
#include "fake_socket_factory.h"
#include "test_common.h"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <vector>

using namespace tunnel;
using test::TestStats;
using test::check;
using test::ip;
using test::FakeNetwork;
using test::FakeSocketFactory;

static const ResourceId kDnsRes = Uuid::fromU128(0xD, 1);
static const ResourceId kCidrRes = Uuid::fromU128(0xD, 2);
static const ResourceId kInternetRes = Uuid::fromU128(0xD, 3);

static TunnelConfig makeConfig() {
    TunnelConfig config;
    config.upstreamDns = {*SocketAddr::parse("1.1.1.1:53"), *SocketAddr::parse("8.8.8.8:53")};

    DnsResource dnsRes;
    dnsRes.id = kDnsRes;
    dnsRes.name = "corp";
    dnsRes.address = "*.corp.example";
    config.resources.push_back(dnsRes);

    CidrResource cidrRes;
    cidrRes.id = kCidrRes;
    cidrRes.name = "lan";
    cidrRes.address = *IpNetwork::parse("10.0.0.0/8");
    config.resources.push_back(cidrRes);

    InternetResource internet;
    internet.id = kInternetRes;
    config.resources.push_back(internet);

    return config;
}

static std::vector<uint8_t> queryWire(uint16_t id, const std::string& name, dns::RecordType type) {
    std::vector<uint8_t> wire;
    dns::DNSBuilder::serialize(dns::DNSBuilder::query(id, name, type), wire);
    return wire;
}

static ResolverResult ask(TunnelResolver& resolver, const IpAddr& sentinel, const std::string& name,
                          dns::RecordType type, Instant now, uint16_t id = 0x5151) {
    auto wire = queryWire(id, name, type);
    return resolver.onDnsQuery(sentinel, wire.data(), wire.size(), now);
}

static dns::DNSMessage parse(const std::vector<uint8_t>& wire) {
    dns::DNSParser parser;
    dns::DNSMessage msg;
    parser.parse(wire.data(), wire.size(), msg);
    return msg;
}

static IpAddr sentinelFor(const TunnelResolver& resolver, const char* upstream) {
    return *resolver.dnsMapping().sentinelByUpstream(*SocketAddr::parse(upstream));
}

// =================== A. Query Routing Tests ===================
void testQueryRouting(TestStats& stats) {
    std::cout << "\n[A. Query Routing Tests]\n";

    FakeNetwork net;
    FakeSocketFactory factory(net);
    auto t0 = test::epoch();
    TunnelResolver resolver(makeConfig(), factory, t0);

    check(stats, resolver.dnsMapping().size() == 2, "Each upstream gets a sentinel");
    auto first = resolver.pollEvent();
    check(stats, first && std::holds_alternative<dns::DnsServersUpdated>(*first), "DnsServersUpdated is emitted at start");

    IpAddr sentinel = sentinelFor(resolver, "1.1.1.1:53");

    auto dropped = ask(resolver, ip("9.9.9.9"), "app.corp.example", dns::RecordType::A, t0);
    check(stats, dropped.action == ResolverAction::Drop, "Query to a non-sentinel address is dropped");

    std::vector<uint8_t> junk = {1, 2, 3};
    check(stats, resolver.onDnsQuery(sentinel, junk.data(), junk.size(), t0).action == ResolverAction::Drop,
          "Malformed query is dropped");

    auto local = ask(resolver, sentinel, "app.corp.example", dns::RecordType::A, t0);
    check(stats, local.action == ResolverAction::InjectResponse, "Resource query is answered locally");
    auto answer = parse(local.responseData);
    check(stats, answer.header.id == 0x5151 && answer.answers.size() == 4, "Local answer has four A records");

    auto records = resolver.pollEvent();
    check(stats, records && std::holds_alternative<dns::RecordsChanged>(*records), "RecordsChanged is emitted");

    auto proxy = answer.answers.empty() ? IpAddr() : *answer.answers[0].address();
    const Resource* viaProxy = resolver.resolveResource(proxy);
    check(stats, viaProxy && resourceId(*viaProxy) == kDnsRes, "Proxy IP resolves to the DNS resource");
    const Resource* viaCidr = resolver.resolveResource(ip("10.20.30.40"));
    check(stats, viaCidr && resourceId(*viaCidr) == kCidrRes, "CIDR address resolves to the CIDR resource");
    const Resource* viaInternet = resolver.resolveResource(ip("203.0.113.7"));
    check(stats, viaInternet && resourceId(*viaInternet) == kInternetRes, "Other addresses fall to the internet resource");

    auto site = ask(resolver, sentinel, "app.corp.example", dns::RecordType::TXT, t0);
    check(stats, site.action == ResolverAction::ForwardSite && site.resource == kDnsRes, "TXT query goes to the site");

    auto upstream = ask(resolver, sentinel, "www.example.org", dns::RecordType::A, t0);
    check(stats, upstream.action == ResolverAction::ForwardUpstream, "Non-resource query goes upstream");
    check(stats, upstream.upstream == *SocketAddr::parse("1.1.1.1:53"), "Without measurements the sentinel's upstream is used");

    auto other = ask(resolver, sentinelFor(resolver, "8.8.8.8:53"), "www.example.org", dns::RecordType::A, t0);
    check(stats, other.upstream == *SocketAddr::parse("8.8.8.8:53"), "Each sentinel forwards to its own upstream");
}

// =================== B. Cache Tests ===================
void testCache(TestStats& stats) {
    std::cout << "\n[B. Cache Tests]\n";

    FakeNetwork net;
    FakeSocketFactory factory(net);
    auto t0 = test::epoch();
    TunnelResolver resolver(makeConfig(), factory, t0);
    IpAddr sentinel = sentinelFor(resolver, "1.1.1.1:53");

    auto query = dns::DNSBuilder::query(1, "www.example.org", dns::RecordType::A);
    auto response = dns::DNSBuilder::responseFor(query, dns::ResponseCode::NoError);
    response.answers.push_back(dns::DNSBuilder::addressRecord("www.example.org", 300, ip("93.184.216.34")));
    std::vector<uint8_t> wire;
    dns::DNSBuilder::serialize(response, wire);

    check(stats, resolver.onUpstreamResponse(wire.data(), wire.size(), t0), "Upstream response is cached");

    auto hit = ask(resolver, sentinel, "WWW.example.org", dns::RecordType::A, t0 + std::chrono::seconds(10), 0x7777);
    check(stats, hit.action == ResolverAction::InjectResponse, "Cached query is answered locally");
    auto msg = parse(hit.responseData);
    check(stats, msg.header.id == 0x7777 && !msg.answers.empty() && msg.answers[0].ttl == 290,
          "Cached answer carries the query id and remaining TTL");

    std::vector<uint8_t> junk = {0xFF};
    check(stats, !resolver.onUpstreamResponse(junk.data(), junk.size(), t0), "Malformed upstream response is ignored");

    resolver.setUpstreamDns({*SocketAddr::parse("9.9.9.9:53")}, t0 + std::chrono::seconds(20));
    check(stats, resolver.cache().size() == 0, "Changing upstream servers flushes the cache");

    resolver.onUpstreamResponse(wire.data(), wire.size(), t0 + std::chrono::seconds(30));
    resolver.resetNetwork(t0 + std::chrono::seconds(31));
    check(stats, resolver.cache().size() == 0, "Network reset flushes the cache");
}

// =================== C. Nameserver Selection Tests ===================
void testNameserverSelection(TestStats& stats) {
    std::cout << "\n[C. Nameserver Selection Tests]\n";

    FakeNetwork net;
    net.servers[ip("1.1.1.1")].latency = std::chrono::milliseconds(900);
    net.servers[ip("8.8.8.8")].latency = std::chrono::milliseconds(10);
    FakeSocketFactory factory(net);

    auto t0 = test::epoch();
    net.now = t0;
    TunnelResolver resolver(makeConfig(), factory, t0);

    auto deadline = resolver.pollTimeout();
    check(stats, deadline && *deadline == t0 + std::chrono::milliseconds(10), "Queries are polled shortly after sending");

    // 只在 pollTimeout() 给出的时刻唤醒
    int wakeups = 0;
    while (!resolver.fastestNameserver() && wakeups < 1000) {
        auto t = resolver.pollTimeout();
        if (!t) break;
        net.now = *t;
        resolver.handleTimeout(*t);
        ++wakeups;
    }
    check(stats, resolver.fastestNameserver() == ip("8.8.8.8"), "Fastest nameserver is measured");
    check(stats, net.now < t0 + std::chrono::seconds(2), "Measurement completes before the query timeout");

    auto forwarded = ask(resolver, sentinelFor(resolver, "1.1.1.1:53"), "www.example.org", dns::RecordType::A,
                         t0 + std::chrono::seconds(1));
    check(stats, forwarded.upstream == *SocketAddr::parse("8.8.8.8:53"), "Queries prefer the fastest nameserver");

    auto next = resolver.pollTimeout();
    check(stats, next && *next == t0 + std::chrono::seconds(60), "Next evaluation is scheduled");

    net.now = t0 + std::chrono::seconds(60);
    resolver.handleTimeout(net.now);
    check(stats, resolver.pollTimeout() == net.now + std::chrono::milliseconds(10), "Re-evaluation starts on schedule");
}

// =================== D. Configuration Change Tests ===================
void testConfigurationChanges(TestStats& stats) {
    std::cout << "\n[D. Configuration Change Tests]\n";

    FakeNetwork net;
    FakeSocketFactory factory(net);
    auto t0 = test::epoch();

    const char* path = "test_tunnel_resolver_resolv.conf";
    {
        std::ofstream out(path);
        out << "# generated\nnameserver 192.168.1.1\nnameserver 100.100.111.1\n";
    }

    TunnelConfig config;
    config.resolvConfPath = path;
    config.fallbackDns = {ip("9.9.9.9")};
    TunnelResolver resolver(config, factory, t0);

    auto upstreams = resolver.dnsMapping().upstreamServers();
    check(stats, upstreams.size() == 1 && upstreams[0] == *SocketAddr::parse("9.9.9.9:53"), "Fallback resolver is used at start");

    resolver.refreshSystemResolvers(t0);
    upstreams = resolver.dnsMapping().upstreamServers();
    check(stats, upstreams.size() == 1 && upstreams[0] == *SocketAddr::parse("192.168.1.1:53"),
          "System resolvers from resolv.conf replace the fallback");

    int updates = 0;
    while (auto ev = resolver.pollEvent()) {
        if (std::holds_alternative<dns::DnsServersUpdated>(*ev)) ++updates;
    }
    check(stats, updates == 2, "One DnsServersUpdated per effective change");

    auto before = resolver.dnsMapping().sentinelServers();
    resolver.resetNetwork(t0);
    auto after = resolver.dnsMapping().sentinelServers();
    check(stats, after.size() == 1 && before.size() == 1 && after[0] != before[0], "Network reset assigns fresh sentinels");

    std::remove(path);
    resolver.refreshSystemResolvers(t0);
    upstreams = resolver.dnsMapping().upstreamServers();
    check(stats, upstreams.size() == 1 && upstreams[0] == *SocketAddr::parse("9.9.9.9:53"),
          "Missing resolv.conf falls back again");

    DnsResource moved;
    moved.id = Uuid::fromU128(0xE, 1);
    moved.name = "moved";
    moved.address = "moved.example";
    resolver.addResource(moved);
    IpAddr sentinel = resolver.dnsMapping().sentinelServers()[0];
    check(stats, ask(resolver, sentinel, "moved.example", dns::RecordType::A, t0).action == ResolverAction::InjectResponse,
          "Added resource is answered locally");

    check(stats, resolver.removeResource(moved.id), "Resource is removed");
    check(stats, ask(resolver, sentinel, "moved.example", dns::RecordType::A, t0).action == ResolverAction::ForwardUpstream,
          "Removed resource is forwarded upstream");
}

// =================== E. DNS Resource NAT Tests ===================
void testDnsResourceNat(TestStats& stats) {
    std::cout << "\n[E. DNS Resource NAT Tests]\n";

    FakeNetwork net;
    FakeSocketFactory factory(net);
    auto t0 = test::epoch();

    TunnelConfig config = makeConfig();
    config.assignedIpsResendInterval = std::chrono::milliseconds(500);
    config.natBufferCapacity = 2;
    TunnelResolver resolver(config, factory, t0);

    const GatewayId gateway = Uuid::fromU128(0x6A7E, 1);
    const std::string domain = "app.corp.example";
    IpAddr sentinel = sentinelFor(resolver, "1.1.1.1:53");

    auto answer = parse(ask(resolver, sentinel, domain, dns::RecordType::A, t0).responseData);
    check(stats, !answer.answers.empty(), "Resource domain gets proxy IPs");
    if (answer.answers.empty()) return;
    IpAddr proxy = *answer.answers[0].address();

    auto direct = *IpPacket::makeUdp(ip("100.64.0.1"), ip("203.0.113.7"), 5000, 443, {0});
    auto passed = resolver.onOutboundPacket(direct, gateway, t0);
    check(stats, passed && *passed == direct, "Packet to a non-proxy address passes unchanged");
    check(stats, !resolver.pollControlPacket(), "Non-proxy traffic sends no control message");

    auto first = *IpPacket::makeUdp(ip("100.64.0.1"), proxy, 5000, 443, {1});
    auto second = *IpPacket::makeUdp(ip("100.64.0.1"), proxy, 5000, 443, {2});
    auto third = *IpPacket::makeUdp(ip("100.64.0.1"), proxy, 5000, 443, {3});

    check(stats, !resolver.onOutboundPacket(first, gateway, t0), "First packet to a proxy IP is held back");
    check(stats, resolver.dnsResourceNat().state(gateway, domain) == DnsResourceNat::StateKind::Pending,
          "NAT setup is pending");

    auto control = resolver.pollControlPacket();
    check(stats, control && control->gateway == gateway && control->domain == domain, "AssignedIps is queued for the gateway");
    check(stats, !resolver.pollControlPacket(), "AssignedIps is queued once");

    resolver.onOutboundPacket(second, gateway, t0 + std::chrono::milliseconds(100));
    check(stats, !resolver.pollControlPacket(), "No resend before the configured interval");

    resolver.onOutboundPacket(third, gateway, t0 + std::chrono::milliseconds(600));
    check(stats, resolver.pollControlPacket().has_value(), "AssignedIps is resent after the configured interval");
    check(stats, resolver.dnsResourceNat().bufferedPackets(gateway, domain) == 2, "Buffer honours the configured capacity");
    if (!control) return;

    // 网关侧
    ProxyNat gatewayNat(ip("100.64.0.1"), ip("fd00:2021:1111::1"));
    check(stats, !ProxyNat::readAssignedIps(direct), "Ordinary packet carries no AssignedIps");

    auto assigned = ProxyNat::readAssignedIps(control->packet);
    check(stats, assigned && assigned->domain() == domain && assigned->resource() == kDnsRes &&
                     assigned->proxyIps().size() == 8,
          "Gateway reads the assigned proxy IPs");
    if (!assigned) return;

    auto reply = gatewayNat.answerAssignedIps(*assigned, {ip("192.0.2.10")});
    check(stats, reply && p2p::isControlPacket(*reply), "Gateway answers with a control packet");
    if (!reply) return;

    auto released = resolver.onControlPacket(gateway, *reply);
    check(stats, released.size() == 2 && released[0] == second && released[1] == third,
          "Active status releases the buffered packets in order");
    check(stats, resolver.dnsResourceNat().state(gateway, domain) == DnsResourceNat::StateKind::Confirmed,
          "NAT is confirmed");

    std::optional<IpPacket> atGateway;
    if (!released.empty()) atGateway = gatewayNat.translateOutbound(released[0], t0);
    check(stats, atGateway && atGateway->destination() == ip("192.0.2.10"), "Gateway forwards to the real address");

    auto later = resolver.onOutboundPacket(first, gateway, t0 + std::chrono::seconds(1));
    check(stats, later && *later == first, "Packets flow once the NAT is confirmed");

    // 重新查询后重建 NAT，但已确认的 NAT 继续转发
    ask(resolver, sentinel, domain, dns::RecordType::A, t0 + std::chrono::seconds(2));
    check(stats, resolver.dnsResourceNat().state(gateway, domain) == DnsResourceNat::StateKind::Recreating,
          "Re-query marks the NAT for re-creation");
    auto during = resolver.onOutboundPacket(first, gateway, t0 + std::chrono::seconds(2));
    check(stats, during && *during == first, "Traffic keeps flowing while re-creating");
    check(stats, resolver.pollControlPacket().has_value(), "Re-creation sends AssignedIps again");

    auto malformed = p2p::makeControlPacket({9, 0, 0, 0, 0, 0, 0, 0});
    check(stats, malformed && resolver.onControlPacket(gateway, *malformed).empty(), "Malformed control message is ignored");

    auto goodbye = p2p::makeControlPacket(p2p::encodeGoodbye());
    if (goodbye) resolver.onControlPacket(gateway, *goodbye);
    check(stats, !resolver.dnsResourceNat().state(gateway, domain), "Goodbye clears the gateway's NAT state");

    const GatewayId other = Uuid::fromU128(0x6A7E, 2);
    resolver.onOutboundPacket(first, other, t0 + std::chrono::seconds(3));
    resolver.resetNetwork(t0 + std::chrono::seconds(3));
    check(stats, !resolver.dnsResourceNat().state(other, domain), "Network reset clears NAT state");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Tunnel Resolver Unit Tests\n";
    std::cout << "========================================\n";

    TestStats stats;

    try {
        testQueryRouting(stats);
        testCache(stats);
        testNameserverSelection(stats);
        testConfigurationChanges(stats);
        testDnsResourceNat(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return test::finish(stats);
}
