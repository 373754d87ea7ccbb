#include "../src/Gateway/proxy_nat.hpp"
#include "test_common.h"
#include <iostream>
#include <vector>

using namespace tunnel;
using test::TestStats;
using test::check;
using test::ip;

static const ResourceId kResource = Uuid::fromU128(0xCCCC, 1);

static const char* kClientV4 = "100.64.0.1";
static const char* kClientV6 = "fd00:2021:1111::1";

static std::vector<IpAddr> proxyV4() {
    return {ip("100.96.0.1"), ip("100.96.0.2"), ip("100.96.0.3"), ip("100.96.0.4")};
}

static std::vector<IpAddr> proxyDual() {
    auto ips = proxyV4();
    for (uint64_t i = 1; i <= 4; ++i) {
        ips.push_back(IpAddr::fromV6(0xfd00202111118000ULL, i));
    }
    return ips;
}

// =================== A. Mapping Tests ===================
void testMappings(TestStats& stats) {
    std::cout << "\n[A. Mapping Tests]\n";

    bool threw = false;
    try {
        ProxyNat bad(ip(kClientV6), ip(kClientV4));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(stats, threw, "Swapped client addresses are rejected");

    ProxyNat nat(ip(kClientV4), ip(kClientV6));
    p2p::AssignedIps msg(kResource, "app.example.com", proxyDual());

    auto status = nat.handleAssignedIps(msg, {ip("192.0.2.10"), ip("192.0.2.11"), ip("2001:db8::10")});
    check(stats, status.status == p2p::NatStatus::Active && status.domain == "app.example.com",
          "Resolved domain is reported active");
    check(stats, nat.mappingCount() == 8, "Every proxy IP is mapped");
    check(stats, nat.realAddress(ip("100.96.0.1")) == ip("192.0.2.10") &&
                     nat.realAddress(ip("100.96.0.2")) == ip("192.0.2.11") &&
                     nat.realAddress(ip("100.96.0.3")) == ip("192.0.2.10"),
          "IPv4 proxies cycle through IPv4 addresses");
    check(stats, nat.realAddress(IpAddr::fromV6(0xfd00202111118000ULL, 2)) == ip("2001:db8::10"),
          "IPv6 proxies use IPv6 addresses");

    auto v4only = nat.handleAssignedIps(msg, {ip("192.0.2.20")});
    check(stats, v4only.status == p2p::NatStatus::Active, "Single-family resolution is still active");
    check(stats, nat.realAddress(IpAddr::fromV6(0xfd00202111118000ULL, 1)) == ip("192.0.2.20"),
          "IPv6 proxy falls back to an IPv4 address");
    check(stats, nat.mappingCount() == 8, "Re-assignment replaces previous mappings");

    auto inactive = nat.handleAssignedIps(msg, {});
    check(stats, inactive.status == p2p::NatStatus::Inactive, "Unresolvable domain is reported inactive");
    check(stats, nat.mappingCount() == 0, "Inactive domain has no mappings");

    nat.handleAssignedIps(msg, {ip("192.0.2.30")});
    nat.removeDomain("app.example.com");
    check(stats, nat.mappingCount() == 0 && !nat.realAddress(ip("100.96.0.1")), "removeDomain drops mappings");
}

// =================== B. Same-family Translation Tests ===================
void testSameFamily(TestStats& stats) {
    std::cout << "\n[B. Same-family Translation Tests]\n";

    ProxyNat nat(ip(kClientV4), ip(kClientV6));
    nat.handleAssignedIps(p2p::AssignedIps(kResource, "app.example.com", proxyV4()), {ip("192.0.2.10")});
    auto t0 = test::epoch();

    auto out = IpPacket::makeUdp(ip(kClientV4), ip("100.96.0.1"), 5000, 443, {1, 2, 3});
    auto translated = nat.translateOutbound(*out, t0);
    check(stats, translated && translated->destination() == ip("192.0.2.10"), "Destination is rewritten to the real address");
    check(stats, translated && translated->source() == ip(kClientV4), "Source is kept");
    check(stats, nat.sessionCount() == 1, "Session is recorded");

    auto expected = IpPacket::makeUdp(ip(kClientV4), ip("192.0.2.10"), 5000, 443, {1, 2, 3});
    check(stats, translated && *translated == *expected, "Checksums are updated");

    // 两个代理 IP 指向同一个真实地址
    auto out3 = IpPacket::makeUdp(ip(kClientV4), ip("100.96.0.3"), 5001, 443, {4});
    nat.translateOutbound(*out3, t0);

    auto reply = IpPacket::makeUdp(ip("192.0.2.10"), ip(kClientV4), 443, 5000, {9});
    auto back = nat.translateInbound(*reply, t0 + std::chrono::seconds(1));
    check(stats, back && back->source() == ip("100.96.0.1") && back->destination() == ip(kClientV4),
          "Reply appears to come from the proxy IP");

    auto reply3 = IpPacket::makeUdp(ip("192.0.2.10"), ip(kClientV4), 443, 5001, {9});
    auto back3 = nat.translateInbound(*reply3, t0 + std::chrono::seconds(1));
    check(stats, back3 && back3->source() == ip("100.96.0.3"), "Replies keep their own proxy IP");

    // 同一个客户端端口发往两个指向同一真实地址的代理 IP
    auto clash = IpPacket::makeUdp(ip(kClientV4), ip("100.96.0.3"), 5000, 443, {5});
    auto clashOut = nat.translateOutbound(*clash, t0);
    check(stats, clashOut && clashOut->destination() == ip("192.0.2.10") && clashOut->sourcePort() == uint16_t(5002),
          "Colliding client port is moved to the next free gateway port");
    check(stats, nat.sessionCount() == 3, "Colliding flows get separate sessions");

    auto clashReply = IpPacket::makeUdp(ip("192.0.2.10"), ip(kClientV4), 443, 5002, {6});
    auto clashBack = nat.translateInbound(*clashReply, t0 + std::chrono::seconds(1));
    check(stats, clashBack && clashBack->source() == ip("100.96.0.3") && clashBack->destinationPort() == uint16_t(5000),
          "Reply on the moved port returns to its own proxy IP and client port");
    auto clashExpected = IpPacket::makeUdp(ip("100.96.0.3"), ip(kClientV4), 443, 5000, {6});
    check(stats, clashBack && *clashBack == *clashExpected, "Checksums are updated after port rewrite");

    auto again = nat.translateInbound(*reply, t0 + std::chrono::seconds(1));
    check(stats, again && again->source() == ip("100.96.0.1") && again->destinationPort() == uint16_t(5000),
          "First flow still maps to its proxy IP");

    auto unrelated = IpPacket::makeUdp(ip("198.51.100.1"), ip(kClientV4), 53, 6000, {});
    auto passed = nat.translateInbound(*unrelated, t0);
    check(stats, passed && *passed == *unrelated, "Traffic without a session passes unchanged");

    auto direct = IpPacket::makeUdp(ip(kClientV4), ip("198.51.100.1"), 6000, 53, {});
    auto passedOut = nat.translateOutbound(*direct, t0);
    check(stats, passedOut && *passedOut == *direct, "Traffic to non-proxy addresses passes unchanged");

    check(stats, nat.pollTimeout() == t0 + std::chrono::seconds(1) + ProxyNat::kSessionTtl,
          "Session deadline is refreshed by replies");
    nat.handleTimeout(t0 + std::chrono::minutes(3));
    check(stats, nat.sessionCount() == 0, "Idle sessions expire");

    auto late = nat.translateInbound(*reply, t0 + std::chrono::minutes(3));
    check(stats, late && late->source() == ip("192.0.2.10"), "Expired session no longer translates replies");
}

// =================== C. Cross-family Translation Tests ===================
void testCrossFamily(TestStats& stats) {
    std::cout << "\n[C. Cross-family Translation Tests]\n";

    ProxyNat nat(ip(kClientV4), ip(kClientV6));
    nat.handleAssignedIps(p2p::AssignedIps(kResource, "v4only.example.com", proxyDual()), {ip("192.0.2.50")});
    auto t0 = test::epoch();

    IpAddr proxy6 = IpAddr::fromV6(0xfd00202111118000ULL, 1);

    auto out = IpPacket::makeTcp(ip(kClientV6), proxy6, 40000, 80, {'G', 'E', 'T'});
    auto nat64 = nat.translateOutbound(*out, t0);
    check(stats, nat64 && nat64->isV4(), "IPv6 packet to an IPv4 resource is translated to IPv4");
    check(stats, nat64 && nat64->source() == ip(kClientV4) && nat64->destination() == ip("192.0.2.50"),
          "Translated packet uses the client IPv4 tunnel address");
    check(stats, nat64 && nat64->destinationPort() == uint16_t(80), "Ports survive translation");

    auto reply = IpPacket::makeTcp(ip("192.0.2.50"), ip(kClientV4), 80, 40000, {'O', 'K'});
    auto nat46 = nat.translateInbound(*reply, t0);
    check(stats, nat46 && nat46->isV6(), "Reply is translated back to IPv6");
    check(stats, nat46 && nat46->source() == proxy6 && nat46->destination() == ip(kClientV6),
          "Reply comes from the IPv6 proxy address to the client");

    auto ping = IpPacket::makeIcmpEcho(ip(kClientV6), proxy6, true, 99, 1, {1});
    auto ping4 = nat.translateOutbound(*ping, t0);
    check(stats, ping4 && ping4->protocol() == ipproto::kIcmp && ping4->icmpEchoId() == uint16_t(99),
          "ICMPv6 echo is translated to ICMP echo");

    auto pong = IpPacket::makeIcmpEcho(ip("192.0.2.50"), ip(kClientV4), false, 99, 1, {1});
    auto pong6 = nat.translateInbound(*pong, t0);
    check(stats, pong6 && pong6->protocol() == ipproto::kIcmpv6 && pong6->source() == proxy6,
          "ICMP echo reply is translated back to ICMPv6");

    auto ra = IpPacket::make(ip(kClientV6), proxy6, ipproto::kIcmpv6, {134, 0, 0, 0, 0, 0, 0, 0});
    check(stats, !nat.translateOutbound(*ra, t0), "Untranslatable packet to a proxy IP is dropped");

    nat.clear();
    check(stats, nat.mappingCount() == 0 && nat.sessionCount() == 0, "clear() drops everything");
}

// =================== D. Control Message Tests ===================
void testControlMessages(TestStats& stats) {
    std::cout << "\n[D. Control Message Tests]\n";

    ProxyNat nat(ip(kClientV4), ip(kClientV6));
    p2p::AssignedIps msg(kResource, "app.example.com", proxyV4());

    auto request = p2p::makeControlPacket(p2p::encodeAssignedIps(msg));
    auto read = request ? ProxyNat::readAssignedIps(*request) : std::nullopt;
    check(stats, read && *read == msg, "AssignedIps is read from the control packet");

    auto status = p2p::makeControlPacket(p2p::encodeDomainStatus({kResource, "app.example.com", p2p::NatStatus::Active}));
    check(stats, status && !ProxyNat::readAssignedIps(*status), "Other control messages are skipped");

    auto broken = p2p::makeControlPacket({0, 0, 0, 0, 0, 0, 0, 0, '{'});
    check(stats, broken && !ProxyNat::readAssignedIps(*broken), "Malformed AssignedIps is skipped");

    auto answer = nat.answerAssignedIps(msg, {});
    auto decoded = answer ? p2p::decodeDomainStatus(answer->payload(), answer->payloadLength()) : p2p::DomainStatus{};
    check(stats, answer && decoded.domain == "app.example.com" && decoded.status == p2p::NatStatus::Inactive,
          "Unresolved domain is answered inactive");

    answer = nat.answerAssignedIps(msg, {ip("192.0.2.10")});
    decoded = answer ? p2p::decodeDomainStatus(answer->payload(), answer->payloadLength()) : p2p::DomainStatus{};
    check(stats, answer && decoded.resource == kResource && decoded.status == p2p::NatStatus::Active,
          "Resolved domain is answered active");
    check(stats, nat.realAddress(ip("100.96.0.4")) == ip("192.0.2.10"), "Answering also installs the mappings");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Proxy NAT Unit Tests\n";
    std::cout << "========================================\n";

    TestStats stats;

    try {
        testMappings(stats);
        testSameFamily(stats);
        testCrossFamily(stats);
        testControlMessages(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return test::finish(stats);
}
