#ifndef resource_hpp
#define resource_hpp

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../Common/ip_addr.hpp"
#include "../Common/uuid.hpp"

namespace tunnel {

enum class IpStack : uint8_t {
    Ipv4Only,
    Ipv6Only,
    Dual
};

inline bool supportsIpv4(IpStack s) { return s != IpStack::Ipv6Only; }
inline bool supportsIpv6(IpStack s) { return s != IpStack::Ipv4Only; }

enum class FilterProtocol : uint8_t {
    Tcp,
    Udp,
    Icmp
};

struct Filter {
    FilterProtocol protocol;
    uint16_t portStart = 0;
    uint16_t portEnd = 65535;

    bool operator==(const Filter& o) const {
        return protocol == o.protocol && portStart == o.portStart && portEnd == o.portEnd;
    }
};

struct Site {
    SiteId id;
    std::string name;

    bool operator==(const Site& o) const { return id == o.id && name == o.name; }
};

// address 是域名模式（可含 *. / ?. / ** 通配）
struct DnsResource {
    ResourceId id;
    std::string address;
    std::string name;
    std::optional<std::string> addressDescription;
    std::vector<Site> sites;
    IpStack ipStack = IpStack::Dual;
    std::vector<Filter> filters;
};

struct CidrResource {
    ResourceId id;
    IpNetwork address;
    std::string name;
    std::optional<std::string> addressDescription;
    std::vector<Site> sites;
    std::vector<Filter> filters;
};

struct InternetResource {
    ResourceId id;
    std::string name = "Internet Resource";
    std::vector<Site> sites;
};

using Resource = std::variant<DnsResource, CidrResource, InternetResource>;

inline const ResourceId& resourceId(const Resource& r)
{
    return std::visit([](const auto& v) -> const ResourceId& { return v.id; }, r);
}

inline const std::string& resourceName(const Resource& r)
{
    return std::visit([](const auto& v) -> const std::string& { return v.name; }, r);
}

inline const std::vector<Site>& resourceSites(const Resource& r)
{
    return std::visit([](const auto& v) -> const std::vector<Site>& { return v.sites; }, r);
}

} // namespace tunnel

#endif /* resource_hpp */
