#ifndef expiring_map_hpp
#define expiring_map_hpp

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

#include "clock.hpp"

namespace tunnel {

/**
 * 带 TTL 的键值表
 *
 * 不自己调度定时器：调用方在 pollTimeout() 给出的时刻调用 handleTimeout(now)，
 * 过期条目以 EntryExpired 事件的形式由 pollEvent() 取出。
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class ExpiringMap {
public:
    struct Entry {
        V value;
        Instant insertedAt;
        Instant expiresAt;
    };

    struct EntryExpired {
        K key;
        V value;
        Instant insertedAt;
        Instant expiredAt;
    };

    // 覆盖已有条目，返回旧值
    std::optional<V> insert(K key, V value, Instant now, Duration ttl) {
        std::optional<V> old = remove(key);

        Instant expiresAt = now + ttl;
        expiry_.emplace(expiresAt, key);
        entries_.emplace(std::move(key), Entry{std::move(value), now, expiresAt});
        return old;
    }

    const Entry* get(const K& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    std::optional<V> remove(const K& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }

        unlinkExpiry(it->second.expiresAt, key);
        std::optional<V> old(std::move(it->second.value));
        entries_.erase(it);
        return old;
    }

    void handleTimeout(Instant now) {
        while (!expiry_.empty() && expiry_.begin()->first <= now) {
            auto first = expiry_.begin();
            K key = std::move(first->second);
            expiry_.erase(first);

            auto it = entries_.find(key);
            if (it == entries_.end()) {
                continue;
            }

            events_.push_back(EntryExpired{std::move(key), std::move(it->second.value),
                                           it->second.insertedAt, it->second.expiresAt});
            entries_.erase(it);
        }
    }

    std::optional<EntryExpired> pollEvent() {
        if (events_.empty()) {
            return std::nullopt;
        }
        EntryExpired ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    std::optional<Instant> pollTimeout() const {
        if (expiry_.empty()) {
            return std::nullopt;
        }
        return expiry_.begin()->first;
    }

    void clear() {
        entries_.clear();
        expiry_.clear();
        events_.clear();
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    void unlinkExpiry(Instant at, const K& key) {
        auto range = expiry_.equal_range(at);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == key) {
                expiry_.erase(it);
                return;
            }
        }
    }

private:
    std::unordered_map<K, Entry, Hash> entries_;
    std::multimap<Instant, K> expiry_;
    std::deque<EntryExpired> events_;
};

} // namespace tunnel

#endif // expiring_map_hpp
