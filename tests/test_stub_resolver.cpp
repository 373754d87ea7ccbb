#include "../src/DNS/stub_resolver.hpp"
#include "../src/Common/ip_provider.hpp"
#include "test_common.h"
#include <iostream>
#include <string>
#include <vector>

using namespace dns;
using tunnel::IpStack;
using tunnel::Uuid;
using test::TestStats;
using test::check;
using test::ip;

static const ResourceId kRes1 = Uuid::fromU128(0, 1);
static const ResourceId kRes2 = Uuid::fromU128(0, 2);

static ResolveStrategy ask(StubResolver& stub, const std::string& name, RecordType type) {
    return stub.handle(DNSBuilder::query(0x4242, name, type));
}

static std::vector<IpAddr> addresses(const ResolveStrategy& s) {
    std::vector<IpAddr> out;
    for (const auto& rr : s.response.answers) {
        if (auto a = rr.address()) out.push_back(*a);
    }
    return out;
}

// =================== A. Address Query Tests ===================
void testAddressQueries(TestStats& stats) {
    std::cout << "\n[A. Address Query Tests]\n";

    StubResolver stub;
    check(stats, stub.addResource(kRes1, "*.example.com", IpStack::Dual), "Wildcard resource is added");

    auto a = ask(stub, "App.Example.com.", RecordType::A);
    auto v4 = addresses(a);
    check(stats, a.kind == ResolveStrategy::Kind::LocalResponse, "A query for a resource is answered locally");
    check(stats, a.response.header.id == 0x4242, "Answer keeps the query id");
    check(stats, v4.size() == 4, "Four IPv4 proxy addresses");
    bool inPool = true;
    for (const auto& i : v4) {
        inPool = inPool && i.isV4() && tunnel::ranges::ipv4Resources().contains(i);
    }
    check(stats, inPool, "IPv4 proxy addresses come from the resource pool");
    check(stats, !a.response.answers.empty() && a.response.answers[0].ttl == kStubRecordTtl, "Local answers use a 1s TTL");

    auto aaaa = ask(stub, "app.example.com", RecordType::AAAA);
    auto v6 = addresses(aaaa);
    check(stats, v6.size() == 4 && v6[0].isV6() && tunnel::ranges::ipv6Resources().contains(v6[0]),
          "Four IPv6 proxy addresses from the resource pool");

    auto again = ask(stub, "app.example.com", RecordType::A);
    check(stats, addresses(again) == v4, "Repeated query returns the same addresses");

    auto other = ask(stub, "db.example.com", RecordType::A);
    auto otherV4 = addresses(other);
    bool distinct = true;
    for (const auto& i : otherV4) {
        for (const auto& j : v4) distinct = distinct && i != j;
    }
    check(stats, otherV4.size() == 4 && distinct, "Another domain gets its own addresses");

    auto miss = ask(stub, "example.org", RecordType::A);
    check(stats, miss.kind == ResolveStrategy::Kind::RecurseLocal, "Unmatched domain recurses locally");

    auto owner = stub.resolveResourceByIp(v4[2]);
    check(stats, owner && owner->first == "app.example.com" && owner->second == kRes1, "Proxy IP resolves to (domain, resource)");
    check(stats, stub.resolveResourceByIp(ip("8.8.8.8")) == nullptr, "Foreign IP resolves to nothing");

    int events = 0;
    while (stub.pollEvent()) ++events;
    check(stats, events == 2, "One RecordsChanged per new assignment");
    check(stats, stub.records().size() == 2, "Two records are kept");
}

// =================== B. Special Query Tests ===================
void testSpecialQueries(TestStats& stats) {
    std::cout << "\n[B. Special Query Tests]\n";

    StubResolver stub;
    stub.addResource(kRes1, "app.example.com", IpStack::Ipv4Only);

    auto v6 = ask(stub, "app.example.com", RecordType::AAAA);
    check(stats, v6.kind == ResolveStrategy::Kind::LocalResponse && v6.response.answers.empty(),
          "IPv4-only resource answers AAAA with no records");

    auto srv = ask(stub, "_ldap._tcp.app.example.com", RecordType::SRV);
    check(stats, srv.kind == ResolveStrategy::Kind::RecurseLocal, "SRV for a non-matching name recurses locally");

    stub.addResource(kRes2, "**.app.example.com", IpStack::Dual);
    srv = ask(stub, "_ldap._tcp.app.example.com", RecordType::SRV);
    check(stats, srv.kind == ResolveStrategy::Kind::RecurseSite && srv.resource == kRes2, "SRV for a resource goes to its site");

    auto txt = ask(stub, "app.example.com", RecordType::TXT);
    check(stats, txt.kind == ResolveStrategy::Kind::RecurseSite && txt.resource == kRes1, "TXT for a resource goes to its site");

    auto https = ask(stub, "app.example.com", RecordType::HTTPS);
    check(stats, https.kind == ResolveStrategy::Kind::LocalResponse && https.response.answers.empty() &&
                     https.response.rcode() == ResponseCode::NoError,
          "HTTPS for a resource gets an empty NOERROR");

    auto canary = ask(stub, "use-application-dns.net", RecordType::A);
    check(stats, canary.kind == ResolveStrategy::Kind::LocalResponse && canary.response.rcode() == ResponseCode::NxDomain,
          "DoH canary domain gets NXDOMAIN");

    auto mx = ask(stub, "app.example.com", RecordType::MX);
    check(stats, mx.kind == ResolveStrategy::Kind::RecurseLocal, "Other record types recurse locally");

    auto a = addresses(ask(stub, "app.example.com", RecordType::A));
    uint32_t v = a[0].v4;
    std::string reverse = std::to_string(v & 0xFF) + "." + std::to_string((v >> 8) & 0xFF) + "." +
                          std::to_string((v >> 16) & 0xFF) + "." + std::to_string(v >> 24) + ".in-addr.arpa";
    auto ptr = ask(stub, reverse, RecordType::PTR);
    check(stats, ptr.kind == ResolveStrategy::Kind::LocalResponse && ptr.response.answers.size() == 1 &&
                     ptr.response.answers[0].domain == std::string("app.example.com"),
          "PTR for a proxy IP names its domain");

    auto foreignPtr = ask(stub, "8.8.8.8.in-addr.arpa", RecordType::PTR);
    check(stats, foreignPtr.kind == ResolveStrategy::Kind::RecurseLocal, "PTR for a foreign IP recurses locally");
}

// =================== C. Resource Lifecycle Tests ===================
void testLifecycle(TestStats& stats) {
    std::cout << "\n[C. Resource Lifecycle Tests]\n";

    StubResolver stub;
    check(stats, !stub.addResource(kRes1, "bad..pattern", IpStack::Dual), "Invalid pattern is rejected");
    check(stats, stub.resourceCount() == 0, "Rejected pattern is not stored");

    check(stats, stub.addResource(kRes1, "*.corp.example", IpStack::Dual), "Resource 1 added");
    check(stats, !stub.addResource(kRes2, "*.corp.example", IpStack::Dual), "Same pattern replaces the owner");
    auto s = ask(stub, "x.corp.example", RecordType::TXT);
    check(stats, s.resource == kRes2, "Latest owner handles the pattern");

    stub.addResource(kRes1, "exact.corp.example", IpStack::Dual);
    s = ask(stub, "exact.corp.example", RecordType::TXT);
    check(stats, s.resource == kRes1, "Exact pattern wins over the wildcard");

    stub.removeResource(kRes1);
    s = ask(stub, "exact.corp.example", RecordType::TXT);
    check(stats, s.resource == kRes2, "Removing the exact resource falls back to the wildcard");

    stub.removeResource(kRes2);
    check(stats, stub.resourceCount() == 0, "All resources removed");
    check(stats, ask(stub, "x.corp.example", RecordType::A).kind == ResolveStrategy::Kind::RecurseLocal,
          "Removed resource no longer answers");
}

// =================== D. Re-seeding Tests ===================
void testReseed(TestStats& stats) {
    std::cout << "\n[D. Re-seeding Tests]\n";

    StubResolver first;
    first.addResource(kRes1, "**.example.com", IpStack::Dual);
    ask(first, "a.example.com", RecordType::A);
    auto saved = first.records();

    StubResolver second(saved);
    second.addResource(kRes1, "**.example.com", IpStack::Dual);

    auto again = addresses(ask(second, "a.example.com", RecordType::A));
    check(stats, again.size() == 4 && again[0] == saved[0].ips[0], "Restored record keeps its addresses");
    check(stats, !second.pollEvent(), "Restored record emits no change");

    auto fresh = addresses(ask(second, "b.example.com", RecordType::A));
    bool overlap = false;
    for (const auto& i : fresh) {
        for (const auto& j : saved[0].ips) overlap = overlap || i == j;
    }
    check(stats, fresh.size() == 4 && !overlap, "New assignments skip restored addresses");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Stub Resolver Unit Tests\n";
    std::cout << "========================================\n";

    TestStats stats;

    try {
        testAddressQueries(stats);
        testSpecialQueries(stats);
        testLifecycle(stats);
        testReseed(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return test::finish(stats);
}
