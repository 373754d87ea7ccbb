#include "ip_provider.hpp"
#include "logging.hpp"

#include <limits>
#include <stdexcept>

namespace tunnel {

namespace ranges {

IpNetwork ipv4Resources()
{
    return IpNetwork(IpAddr::fromV4(0x64600000), 11);
}

IpNetwork ipv6Resources()
{
    return IpNetwork(IpAddr::fromV6(0xfd00202111118000ULL, 0), 107);
}

IpNetwork dnsSentinelsV4()
{
    return IpNetwork(IpAddr::fromV4(0x64646f00), 24);
}

IpNetwork dnsSentinelsV6()
{
    return IpNetwork(IpAddr::fromV6(0xfd00202111118000ULL, 0x0100010001110000ULL), 120);
}

bool isSentinel(const IpAddr& ip)
{
    return dnsSentinelsV4().contains(ip) || dnsSentinelsV6().contains(ip);
}

} // namespace ranges

static uint64_t hostCount(const IpNetwork& net)
{
    int hostBits = net.address.bitWidth() - net.prefix;
    if (hostBits >= 64) {
        return std::numeric_limits<uint64_t>::max();
    }
    return 1ULL << hostBits;
}

IpProvider::IpProvider(const IpNetwork& v4, const IpNetwork& v6, std::vector<IpNetwork> exclusions)
    : exclusions_(std::move(exclusions))
{
    if (!v4.address.isV4() || !v6.address.isV6()) {
        throw std::invalid_argument("IpProvider needs one IPv4 and one IPv6 network");
    }

    uint64_t n4 = hostCount(v4);
    if (v4.prefix < 31) {
        v4_ = Cursor{v4, 1, n4 - 1};
    } else {
        v4_ = Cursor{v4, 0, n4};
    }
    v6_ = Cursor{v6, 0, hostCount(v6)};
}

IpProvider IpProvider::forResources()
{
    return IpProvider(ranges::ipv4Resources(), ranges::ipv6Resources(),
                      {ranges::dnsSentinelsV4(), ranges::dnsSentinelsV6()});
}

IpProvider IpProvider::forStubDnsServers(const std::vector<IpAddr>& oldSentinels)
{
    std::vector<IpNetwork> exclusions;
    exclusions.reserve(oldSentinels.size());
    for (const auto& ip : oldSentinels) {
        exclusions.emplace_back(ip, static_cast<uint8_t>(ip.bitWidth()));
    }
    return IpProvider(ranges::dnsSentinelsV4(), ranges::dnsSentinelsV6(), std::move(exclusions));
}

bool IpProvider::excluded(const IpAddr& ip) const
{
    for (const auto& e : exclusions_) {
        if (e.contains(ip)) {
            return true;
        }
    }
    return false;
}

std::optional<IpAddr> IpProvider::advance(Cursor& c)
{
    while (c.next < c.end) {
        IpAddr ip = c.network.address.offset(c.next++);
        if (!excluded(ip)) {
            return ip;
        }
    }

    TUN_LOG_WARN("address pool %s exhausted", c.network.toString().c_str());
    return std::nullopt;
}

std::optional<IpAddr> IpProvider::nextIpv4()
{
    return advance(v4_);
}

std::optional<IpAddr> IpProvider::nextIpv6()
{
    return advance(v6_);
}

std::optional<IpAddr> IpProvider::nextFor(IpFamily family)
{
    return family == IpFamily::V4 ? nextIpv4() : nextIpv6();
}

std::vector<IpAddr> IpProvider::getNIpv4(size_t n)
{
    std::vector<IpAddr> out;
    for (size_t i = 0; i < n; ++i) {
        auto ip = nextIpv4();
        if (!ip) {
            break;
        }
        out.push_back(*ip);
    }
    return out;
}

std::vector<IpAddr> IpProvider::getNIpv6(size_t n)
{
    std::vector<IpAddr> out;
    for (size_t i = 0; i < n; ++i) {
        auto ip = nextIpv6();
        if (!ip) {
            break;
        }
        out.push_back(*ip);
    }
    return out;
}

} // namespace tunnel
