#include "resource_index.hpp"
#include "../Common/logging.hpp"
#include "../Filter/domain_pattern.h"

#include <algorithm>

namespace tunnel {

void ResourceIndex::insert(Resource resource)
{
    const ResourceId id = resourceId(resource);

    // 清除所有与新资源冲突的旧条目
    purge(id);

    if (auto* cidr = std::get_if<CidrResource>(&resource)) {
        if (const ResourceId* stale = byIp_.exactMatch(cidr->address)) {
            purge(*stale);
        }
    } else if (auto* dns = std::get_if<DnsResource>(&resource)) {
        auto it = byName_.find(DomainPattern::normalize(dns->address));
        if (it != byName_.end()) {
            purge(it->second);
        }
    } else if (internet_) {
        purge(*internet_);
    }

    if (auto* cidr = std::get_if<CidrResource>(&resource)) {
        byIp_.insert(cidr->address, id);
    } else if (auto* dns = std::get_if<DnsResource>(&resource)) {
        byName_[DomainPattern::normalize(dns->address)] = id;
    } else {
        internet_ = id;
    }

    TUN_LOG_TRACE("resource index: inserted %s (%s)", id.toString().c_str(), resourceName(resource).c_str());
    byId_.insert_or_assign(id, std::move(resource));
}

bool ResourceIndex::remove(const ResourceId& id)
{
    if (byId_.find(id) == byId_.end()) {
        return false;
    }
    purge(id);
    return true;
}

void ResourceIndex::purge(const ResourceId& id)
{
    auto it = byId_.find(id);
    if (it == byId_.end()) {
        return;
    }

    const Resource& stale = it->second;
    if (auto* cidr = std::get_if<CidrResource>(&stale)) {
        const ResourceId* owner = byIp_.exactMatch(cidr->address);
        if (owner && *owner == id) {
            byIp_.remove(cidr->address);
        }
    } else if (auto* dns = std::get_if<DnsResource>(&stale)) {
        auto nameIt = byName_.find(DomainPattern::normalize(dns->address));
        if (nameIt != byName_.end() && nameIt->second == id) {
            byName_.erase(nameIt);
        }
    } else if (internet_ && *internet_ == id) {
        internet_.reset();
    }

    TUN_LOG_TRACE("resource index: purged %s", id.toString().c_str());
    byId_.erase(it);
}

void ResourceIndex::clear()
{
    byId_.clear();
    byIp_.clear();
    byName_.clear();
    internet_.reset();
}

const Resource* ResourceIndex::getById(const ResourceId& id) const
{
    auto it = byId_.find(id);
    return it == byId_.end() ? nullptr : &it->second;
}

const Resource* ResourceIndex::getByIp(const IpAddr& ip) const
{
    auto hit = byIp_.longestMatch(ip);
    if (!hit) {
        return nullptr;
    }
    return getById(*hit->second);
}

const Resource* ResourceIndex::getByName(std::string_view domain) const
{
    auto it = byName_.find(DomainPattern::normalize(domain));
    if (it == byName_.end()) {
        return nullptr;
    }
    return getById(it->second);
}

const InternetResource* ResourceIndex::internetResource() const
{
    if (!internet_) {
        return nullptr;
    }
    const Resource* r = getById(*internet_);
    return r ? std::get_if<InternetResource>(r) : nullptr;
}

std::vector<const Resource*> ResourceIndex::all() const
{
    std::vector<const Resource*> out;
    out.reserve(byId_.size());
    for (const auto& [id, r] : byId_) {
        out.push_back(&r);
    }
    std::sort(out.begin(), out.end(), [](const Resource* a, const Resource* b) {
        return resourceId(*a) < resourceId(*b);
    });
    return out;
}

} // namespace tunnel
