#include "dns_cache.hpp"
#include "../Common/logging.hpp"

#include <algorithm>
#include <climits>

namespace dns {

/**
 * normalizeName
 * 前提条件：
 *  - DNSParser 已经正确解压 compression pointer
 *  - 不处理 IDN（假定上游已 punycode）
 */
std::string DNSResponseCache::normalizeName(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    if (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    return s;
}

DNSResponseCache::DNSResponseCache(uint32_t min_ttl_secs)
: min_ttl_secs_(min_ttl_secs) {}

bool DNSResponseCache::validateResponseSemantics(
    const DNSMessage& msg,
    uint32_t& out_min_ttl
) {
    // RCODE=NOERROR
    if (msg.header.dns_rcode() != 0) {
        TUN_LOG_TRACE("dns cache: refusing response with rcode %u", msg.header.dns_rcode());
        return false;
    }
    // TC=0
    if (msg.header.isTruncated()) {
        TUN_LOG_TRACE("dns cache: refusing truncated response");
        return false;
    }

    if (msg.recordCount() == 0) {
        TUN_LOG_TRACE("dns cache: refusing response without records");
        return false;
    }

    bool found_rr = false;
    uint32_t min_ttl = UINT32_MAX;

    auto scan = [&](const std::vector<DNSRecord>& v) {
        for (const auto& rr : v) {
            if (rr.isOPT()) continue;
            found_rr = true;
            min_ttl = std::min(min_ttl, rr.ttl);
        }
    };

    scan(msg.answers);
    scan(msg.authorities);
    scan(msg.additionals);

    if (!found_rr) {
        TUN_LOG_TRACE("dns cache: refusing response without a TTL");
        return false;
    }
    if (min_ttl < min_ttl_secs_) {
        TUN_LOG_TRACE("dns cache: refusing response with TTL %u < %u", min_ttl, min_ttl_secs_);
        return false;
    }

    out_min_ttl = min_ttl;
    return true;
}

bool DNSResponseCache::insert(const std::string& domain, const uint8_t* data, size_t len, tunnel::Instant now) {
    DNSParser parser;
    DNSMessage msg;
    if (!parser.parse(data, len, msg)) {
        TUN_LOG_TRACE("dns cache: refusing unparsable response");
        stats_.refused++;
        return false;
    }

    uint32_t min_ttl = 0;
    if (!validateResponseSemantics(msg, min_ttl)) {
        stats_.refused++;
        return false;
    }

    CacheKey key{normalizeName(domain), msg.qtype()};

    CachedDNSResponse entry;
    entry.wire.assign(data, data + len);
    entry.message = std::move(msg);
    entry.ttl = min_ttl;

    TUN_LOG_TRACE("dns cache: caching %s (type %u) for %us", key.qname.c_str(), key.qtype, min_ttl);

    // 覆盖同 key 的旧条目
    cache_.insert(std::move(key), std::move(entry), now, std::chrono::seconds(min_ttl));
    return true;
}

bool DNSResponseCache::tryAnswer(
    const DNSMessage& query,
    tunnel::Instant now,
    std::vector<uint8_t>& out_response
) {
    if (query.questions.empty()) {
        stats_.misses++;
        return false;
    }

    CacheKey key{normalizeName(query.domain()), query.qtype()};

    const auto* entry = cache_.get(key);
    if (!entry) {
        stats_.misses++;
        return false;
    }

    uint32_t elapsed = tunnel::wholeSeconds(now - entry->insertedAt);
    if (now >= entry->expiresAt || elapsed >= entry->value.ttl) {
        cache_.remove(key);
        stats_.evictions++;
        stats_.misses++;
        return false;
    }

    out_response = entry->value.wire;
    if (!DNSTTLWirePatcher::decrementTTL(out_response.data(), out_response.size(), entry->value.message, elapsed)) {
        // 入缓存前已解析过，不应出现
        cache_.remove(key);
        stats_.misses++;
        return false;
    }

    DNSTTLWirePatcher::writeId(out_response.data(), out_response.size(), query.header.id);
    // RCODE=NOERROR
    out_response[3] &= 0xF0;

    stats_.hits++;
    return true;
}

void DNSResponseCache::handleTimeout(tunnel::Instant now) {
    cache_.handleTimeout(now);
    while (auto ev = cache_.pollEvent()) {
        TUN_LOG_TRACE("dns cache: entry expired %s (type %u)", ev->key.qname.c_str(), ev->key.qtype);
        stats_.evictions++;
    }
}

std::optional<tunnel::Instant> DNSResponseCache::pollTimeout() const {
    return cache_.pollTimeout();
}

void DNSResponseCache::flush(const char* reason) {
    if (!cache_.empty()) {
        TUN_LOG_DEBUG("dns cache: flushing %zu entries (%s)", cache_.size(), reason);
    }
    cache_.clear();
}

} // namespace dns
