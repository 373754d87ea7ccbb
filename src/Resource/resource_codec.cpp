#include "resource_codec.hpp"
#include "../Common/config.hpp"
#include "../Common/logging.hpp"

using json = nlohmann::json;

namespace tunnel {

std::optional<IpStack> parseIpStack(std::string_view text)
{
    if (text == "ipv4_only") return IpStack::Ipv4Only;
    if (text == "ipv6_only") return IpStack::Ipv6Only;
    if (text == "dual")      return IpStack::Dual;
    return std::nullopt;
}

static ResourceId parseId(const json& j, const char* key)
{
    if (!j.contains(key)) {
        throw ConfigError(std::string("resource is missing '") + key + "'");
    }
    auto text = j.at(key).get<std::string>();
    auto id = Uuid::parse(text);
    if (!id) {
        throw ConfigError("invalid id: " + text);
    }
    return *id;
}

static std::vector<Site> parseSites(const json& j)
{
    std::vector<Site> sites;

    const char* key = j.contains("gateway_groups") ? "gateway_groups" : "sites";
    if (!j.contains(key)) {
        return sites;
    }

    for (const auto& s : j.at(key)) {
        Site site;
        site.id = parseId(s, "id");
        site.name = s.value("name", std::string());
        sites.push_back(std::move(site));
    }
    return sites;
}

static std::vector<Filter> parseFilters(const json& j)
{
    std::vector<Filter> filters;
    if (!j.contains("filters")) {
        return filters;
    }

    for (const auto& f : j.at("filters")) {
        auto proto = f.at("protocol").get<std::string>();

        Filter filter;
        if (proto == "tcp") {
            filter.protocol = FilterProtocol::Tcp;
        } else if (proto == "udp") {
            filter.protocol = FilterProtocol::Udp;
        } else if (proto == "icmp") {
            filter.protocol = FilterProtocol::Icmp;
        } else {
            TUN_LOG_DEBUG("ignoring filter with unknown protocol '%s'", proto.c_str());
            continue;
        }

        filter.portStart = f.value("port_range_start", static_cast<uint16_t>(0));
        filter.portEnd = f.value("port_range_end", static_cast<uint16_t>(65535));
        if (filter.portStart > filter.portEnd) {
            throw ConfigError("filter port range is inverted");
        }
        filters.push_back(filter);
    }
    return filters;
}

static std::optional<std::string> optionalString(const json& j, const char* key)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

std::optional<Resource> resourceFromJson(const json& j)
{
    try {
        if (!j.is_object() || !j.contains("type")) {
            throw ConfigError("resource description must be an object with a 'type'");
        }

        auto type = j.at("type").get<std::string>();

        if (type == "dns") {
            DnsResource r;
            r.id = parseId(j, "id");
            r.address = j.at("address").get<std::string>();
            r.name = j.at("name").get<std::string>();
            r.addressDescription = optionalString(j, "address_description");
            r.sites = parseSites(j);
            if (j.contains("ip_stack") && !j.at("ip_stack").is_null()) {
                auto text = j.at("ip_stack").get<std::string>();
                auto stack = parseIpStack(text);
                if (!stack) {
                    throw ConfigError("unknown ip_stack: " + text);
                }
                r.ipStack = *stack;
            }
            r.filters = parseFilters(j);
            return Resource(std::move(r));
        }

        if (type == "cidr") {
            CidrResource r;
            r.id = parseId(j, "id");
            auto address = j.at("address").get<std::string>();
            auto net = IpNetwork::parse(address);
            if (!net) {
                throw ConfigError("invalid CIDR address: " + address);
            }
            r.address = *net;
            r.name = j.at("name").get<std::string>();
            r.addressDescription = optionalString(j, "address_description");
            r.sites = parseSites(j);
            r.filters = parseFilters(j);
            return Resource(std::move(r));
        }

        if (type == "internet") {
            InternetResource r;
            r.id = parseId(j, "id");
            if (j.contains("name")) {
                r.name = j.at("name").get<std::string>();
            }
            r.sites = parseSites(j);
            return Resource(std::move(r));
        }

        TUN_LOG_DEBUG("ignoring resource of unknown type '%s'", type.c_str());
        return std::nullopt;
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed resource description: ") + e.what());
    }
}

} // namespace tunnel
