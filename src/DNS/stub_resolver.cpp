#include "stub_resolver.hpp"
#include "../Common/logging.hpp"

namespace dns {

using tunnel::DomainPattern;

StubResolver::StubResolver(std::vector<DnsResourceRecord> records)
    : ip_provider_(tunnel::IpProvider::forResources()) {
    if (records.empty()) return;

    TUN_LOG_INFO("stub resolver: re-seeding %zu records for DNS resources", records.size());

    size_t num4 = 0;
    size_t num6 = 0;
    for (auto& r : records) {
        for (const auto& ip : r.ips) {
            if (ip.isV4()) ++num4; else ++num6;
            ips_to_fqdn_[ip] = std::make_pair(r.domain, r.resource);
        }
        fqdn_to_ips_[std::make_pair(r.domain, r.resource)] = std::move(r.ips);
    }

    // 跳过已用地址，保证之后分配的地址不重复
    ip_provider_.getNIpv4(num4);
    ip_provider_.getNIpv6(num6);
}

bool StubResolver::addResource(const ResourceId& id, const std::string& pattern, tunnel::IpStack stack) {
    auto parsed = DomainPattern::parse(pattern);
    if (!parsed) {
        TUN_LOG_WARN("stub resolver: domain pattern '%s' is not valid", pattern.c_str());
        return false;
    }

    return resources_.insert_or_assign(std::move(*parsed), StubResource{id, stack}).second;
}

void StubResolver::removeResource(const ResourceId& id) {
    for (auto it = resources_.begin(); it != resources_.end();) {
        if (it->second.id == id) {
            it = resources_.erase(it);
        } else {
            ++it;
        }
    }
}

const StubResolver::StubResource* StubResolver::matchResource(const std::string& domain) const {
    // O(N)，只在处理 DNS 查询时调用
    for (const auto& [pattern, resource] : resources_) {
        if (pattern.matches(domain)) {
            TUN_LOG_TRACE("stub resolver: %s matched %s (%s)", domain.c_str(), pattern.str().c_str(),
                          resource.id.toString().c_str());
            return &resource;
        }
    }

    TUN_LOG_TRACE("stub resolver: no resource matched %s", domain.c_str());
    return nullptr;
}

const std::vector<IpAddr>& StubResolver::getOrAssignIps(const std::string& domain, const StubResource& resource) {
    auto key = std::make_pair(domain, resource.id);

    auto it = fqdn_to_ips_.find(key);
    if (it == fqdn_to_ips_.end()) {
        std::vector<IpAddr> ips;
        ips.reserve(8);

        if (tunnel::supportsIpv4(resource.ipStack)) {
            auto v4 = ip_provider_.getNIpv4(4);
            ips.insert(ips.end(), v4.begin(), v4.end());
        }
        if (tunnel::supportsIpv6(resource.ipStack)) {
            auto v6 = ip_provider_.getNIpv6(4);
            ips.insert(ips.end(), v6.begin(), v6.end());
        }

        TUN_LOG_DEBUG("stub resolver: assigning %zu proxy IPs to %s", ips.size(), domain.c_str());

        for (const auto& ip : ips) {
            ips_to_fqdn_[ip] = key;
        }
        it = fqdn_to_ips_.emplace(key, std::move(ips)).first;

        events_.push_back(RecordsChanged{records()});
    }

    return it->second;
}

std::optional<std::string> StubResolver::nameByReverseDns(const std::string& name) const {
    auto addr = reverseDnsAddr(name);
    if (!addr) return std::nullopt;

    auto it = ips_to_fqdn_.find(*addr);
    if (it == ips_to_fqdn_.end()) return std::nullopt;
    return it->second.first;
}

ResolveStrategy StubResolver::handle(const DNSMessage& query) {
    if (query.questions.empty()) {
        return ResolveStrategy::recurseLocal();
    }

    const std::string& qname = query.questions[0].name;
    std::string domain = DomainPattern::normalize(qname);
    auto qtype = static_cast<RecordType>(query.qtype());

    TUN_LOG_TRACE("stub resolver: query %u %s", static_cast<unsigned>(query.qtype()), domain.c_str());

    if (domain == kDohCanaryDomain) {
        return ResolveStrategy::local(DNSBuilder::responseFor(query, ResponseCode::NxDomain));
    }

    const StubResource* resource = matchResource(domain);

    DNSMessage response = DNSBuilder::responseFor(query, ResponseCode::NoError);

    switch (qtype) {
        case RecordType::A:
        case RecordType::AAAA: {
            if (!resource) return ResolveStrategy::recurseLocal();

            bool wantV4 = qtype == RecordType::A;
            for (const auto& ip : getOrAssignIps(domain, *resource)) {
                if (ip.isV4() == wantV4) {
                    response.answers.push_back(DNSBuilder::addressRecord(qname, kStubRecordTtl, ip));
                }
            }
            break;
        }
        case RecordType::SRV:
        case RecordType::TXT:
            if (!resource) return ResolveStrategy::recurseLocal();
            TUN_LOG_DEBUG("stub resolver: forwarding %s query for %s to its site",
                          qtype == RecordType::SRV ? "SRV" : "TXT", domain.c_str());
            return ResolveStrategy::recurseSite(resource->id);
        case RecordType::PTR: {
            auto fqdn = nameByReverseDns(domain);
            if (!fqdn) return ResolveStrategy::recurseLocal();
            response.answers.push_back(DNSBuilder::ptrRecord(qname, kStubRecordTtl, *fqdn));
            break;
        }
        case RecordType::HTTPS:
            // 必须拦截，否则客户端不会再发 A/AAAA 查询，拿不到代理 IP
            if (!resource) return ResolveStrategy::recurseLocal();
            break;
        default:
            return ResolveStrategy::recurseLocal();
    }

    response.header.ancount = static_cast<uint16_t>(response.answers.size());
    return ResolveStrategy::local(std::move(response));
}

const std::pair<std::string, ResourceId>* StubResolver::resolveResourceByIp(const IpAddr& ip) const {
    auto it = ips_to_fqdn_.find(ip);
    if (it == ips_to_fqdn_.end()) return nullptr;
    return &it->second;
}

const std::vector<IpAddr>* StubResolver::assignedIps(const std::string& domain, const ResourceId& resource) const {
    auto it = fqdn_to_ips_.find(std::make_pair(domain, resource));
    if (it == fqdn_to_ips_.end()) return nullptr;
    return &it->second;
}

std::vector<DnsResourceRecord> StubResolver::records() const {
    std::vector<DnsResourceRecord> out;
    out.reserve(fqdn_to_ips_.size());
    for (const auto& [key, ips] : fqdn_to_ips_) {
        out.push_back(DnsResourceRecord{key.first, key.second, ips});
    }
    return out;
}

std::optional<RecordsChanged> StubResolver::pollEvent() {
    if (events_.empty()) return std::nullopt;
    RecordsChanged ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

} // namespace dns
