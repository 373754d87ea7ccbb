#ifndef ip_addr_hpp
#define ip_addr_hpp

#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tunnel
{

    /**
     * IP 地址族
     */
    enum class IpFamily : uint8_t
    {
        V4,
        V6
    };

    /**
     * IP 地址（IPv4 / IPv6，主机字节序）
     *
     * IPv6 按高低 64 位存储，便于前缀运算。
     */
    struct IpAddr
    {
        IpFamily family;

        union
        {
            uint32_t v4;
            struct
            {
                uint64_t hi, lo;
            } v6;
        };

        IpAddr() : family(IpFamily::V4)
        {
            v6.hi = 0;
            v6.lo = 0;
            v4 = 0;
        }

        static IpAddr fromV4(uint32_t ip)
        {
            IpAddr a;
            a.family = IpFamily::V4;
            a.v4 = ip;
            return a;
        }

        static IpAddr fromV6(uint64_t hi, uint64_t lo)
        {
            IpAddr a;
            a.family = IpFamily::V6;
            a.v6.hi = hi;
            a.v6.lo = lo;
            return a;
        }

        // 网络字节序的 4 / 16 字节
        static IpAddr fromV4Bytes(const uint8_t *b);
        static IpAddr fromV6Bytes(const uint8_t *b);

        static std::optional<IpAddr> parse(std::string_view text);

        bool isV4() const noexcept { return family == IpFamily::V4; }
        bool isV6() const noexcept { return family == IpFamily::V6; }

        int bitWidth() const noexcept { return isV4() ? 32 : 128; }

        // 第 i 位（0 为最高位）
        int bit(int i) const noexcept
        {
            if (isV4())
                return (v4 >> (31 - i)) & 1;
            if (i < 64)
                return (v6.hi >> (63 - i)) & 1;
            return (v6.lo >> (127 - i)) & 1;
        }

        // 写出网络字节序，返回写入的字节数
        size_t toBytes(uint8_t *out) const;

        // 地址加上偏移（IPv4 按 32 位回绕）
        IpAddr offset(uint64_t n) const;

        std::string toString() const;

        bool operator==(const IpAddr &other) const
        {
            if (family != other.family)
                return false;
            if (isV4())
                return v4 == other.v4;
            return v6.hi == other.v6.hi && v6.lo == other.v6.lo;
        }

        bool operator!=(const IpAddr &other) const
        {
            return !(*this == other);
        }

        // IPv4 排在 IPv6 之前
        bool operator<(const IpAddr &other) const
        {
            if (family != other.family)
                return isV4();
            if (isV4())
                return v4 < other.v4;
            return v6.hi < other.v6.hi || (v6.hi == other.v6.hi && v6.lo < other.v6.lo);
        }
    };

    /**
     * CIDR 网段，构造时规范化网络地址
     */
    struct IpNetwork
    {
        IpAddr address;
        uint8_t prefix;

        IpNetwork() : prefix(0) {}

        // prefix 超出地址位宽时抛出 std::invalid_argument
        IpNetwork(const IpAddr &addr, uint8_t pre);

        static std::optional<IpNetwork> parse(std::string_view text);

        IpFamily family() const noexcept { return address.family; }

        bool contains(const IpAddr &ip) const;
        bool contains(const IpNetwork &other) const;

        std::string toString() const;

        bool operator==(const IpNetwork &other) const
        {
            return prefix == other.prefix && address == other.address;
        }

        bool operator!=(const IpNetwork &other) const
        {
            return !(*this == other);
        }

        bool operator<(const IpNetwork &other) const
        {
            if (address != other.address)
                return address < other.address;
            return prefix < other.prefix;
        }
    };

    struct SocketAddr
    {
        IpAddr ip;
        uint16_t port = 0;

        SocketAddr() = default;
        SocketAddr(const IpAddr &addr, uint16_t p) : ip(addr), port(p) {}

        // "1.2.3.4:53" / "[::1]:53"
        static std::optional<SocketAddr> parse(std::string_view text);

        std::string toString() const;

        bool operator==(const SocketAddr &other) const
        {
            return ip == other.ip && port == other.port;
        }

        bool operator!=(const SocketAddr &other) const
        {
            return !(*this == other);
        }

        bool operator<(const SocketAddr &other) const
        {
            if (ip != other.ip)
                return ip < other.ip;
            return port < other.port;
        }
    };

} // namespace tunnel

// Hash 函数特化
namespace std
{

    template <>
    struct hash<tunnel::IpAddr>
    {
        size_t operator()(const tunnel::IpAddr &ip) const
        {
            size_t h = static_cast<size_t>(ip.family);

            if (ip.isV4())
            {
                h ^= std::hash<uint32_t>{}(ip.v4) + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            else
            {
                h ^= std::hash<uint64_t>{}(ip.v6.hi) + 0x9e3779b9 + (h << 6) + (h >> 2);
                h ^= std::hash<uint64_t>{}(ip.v6.lo) + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };

    template <>
    struct hash<tunnel::SocketAddr>
    {
        size_t operator()(const tunnel::SocketAddr &sa) const
        {
            size_t seed = std::hash<tunnel::IpAddr>{}(sa.ip);
            seed ^= std::hash<uint16_t>{}(sa.port) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            return seed;
        }
    };

}

#endif // ip_addr_hpp
