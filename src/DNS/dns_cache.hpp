#ifndef DNS_RESPONSE_CACHE_HPP
#define DNS_RESPONSE_CACHE_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <optional>

#include "dns_message.hpp"
#include "../Common/clock.hpp"
#include "../Common/expiring_map.hpp"

namespace dns {

/**
 * CacheKey:
 *  - qname 已经是 lowercase、无 trailing dot
 *  - 不包含 ECS，不支持 negative caching
 */
struct CacheKey {
    std::string qname;
    uint16_t    qtype;

    bool operator==(const CacheKey& o) const noexcept {
        return qname == o.qname &&
               qtype == o.qtype;
    }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& k) const noexcept {
        size_t seed = std::hash<std::string>{}(k.qname);
        size_t h2   = static_cast<size_t>(k.qtype);
        seed ^= h2 + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

struct CachedDNSResponse {
    std::vector<uint8_t> wire;   // 原始 response wire
    DNSMessage message;          // 解析结果，用于定位 TTL 字段
    uint32_t ttl;                // min TTL，仅用于过期判断
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t refused = 0;
};

/**
 * 按 (domain, qtype) 缓存上游应答
 *
 * 读取时每条记录的 TTL 按已过去的秒数递减；过期由调用方驱动
 * （handleTimeout / pollTimeout），缓存自身不设定时器。
 */
class DNSResponseCache {
public:
    explicit DNSResponseCache(uint32_t min_ttl_secs = 5);

    // 命中时写出带原查询 id、NOERROR 的应答
    bool tryAnswer(const DNSMessage& query, tunnel::Instant now, std::vector<uint8_t>& out_response);

    // 不满足缓存条件时返回 false（不是错误）
    bool insert(const std::string& domain, const uint8_t* data, size_t len, tunnel::Instant now);

    void handleTimeout(tunnel::Instant now);
    std::optional<tunnel::Instant> pollTimeout() const;

    void flush(const char* reason);

    size_t size() const { return cache_.size(); }
    const CacheStats& stats() const { return stats_; }

    static std::string normalizeName(std::string s);

private:
    bool validateResponseSemantics(const DNSMessage& msg, uint32_t& out_min_ttl);

private:
    tunnel::ExpiringMap<CacheKey, CachedDNSResponse, CacheKeyHash> cache_;
    uint32_t min_ttl_secs_;
    CacheStats stats_;
};

} // namespace dns

#endif // DNS_RESPONSE_CACHE_HPP
