#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tunnel {

/// 128 位标识（资源、站点、网关），文本形式为标准 UUID
struct Uuid
{
    uint64_t hi = 0;
    uint64_t lo = 0;

    static constexpr Uuid fromU128(uint64_t h, uint64_t l) { return Uuid{h, l}; }

    static std::optional<Uuid> parse(std::string_view text);

    std::string toString() const;

    bool operator==(const Uuid& o) const noexcept { return hi == o.hi && lo == o.lo; }
    bool operator!=(const Uuid& o) const noexcept { return !(*this == o); }
    bool operator<(const Uuid& o) const noexcept
    {
        return hi < o.hi || (hi == o.hi && lo < o.lo);
    }
};

using ResourceId = Uuid;
using SiteId = Uuid;
using GatewayId = Uuid;

} // namespace tunnel

namespace std {

template <>
struct hash<tunnel::Uuid> {
    size_t operator()(const tunnel::Uuid& id) const noexcept
    {
        size_t h1 = std::hash<uint64_t>{}(id.hi);
        size_t h2 = std::hash<uint64_t>{}(id.lo);
        return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
    }
};

}
