#include "ip_addr.hpp"

#include <arpa/inet.h>
#include <charconv>
#include <stdexcept>

namespace tunnel
{

    IpAddr IpAddr::fromV4Bytes(const uint8_t *b)
    {
        return fromV4((static_cast<uint32_t>(b[0]) << 24) |
                      (static_cast<uint32_t>(b[1]) << 16) |
                      (static_cast<uint32_t>(b[2]) << 8) |
                      b[3]);
    }

    IpAddr IpAddr::fromV6Bytes(const uint8_t *b)
    {
        uint64_t hi = 0, lo = 0;
        for (int i = 0; i < 8; ++i)
            hi = (hi << 8) | b[i];
        for (int i = 8; i < 16; ++i)
            lo = (lo << 8) | b[i];
        return fromV6(hi, lo);
    }

    std::optional<IpAddr> IpAddr::parse(std::string_view text)
    {
        std::string s(text);

        // 去掉 IPv6 zone（fe80::1%eth0）
        auto pct = s.find('%');
        if (pct != std::string::npos)
            s.resize(pct);

        if (s.find(':') != std::string::npos)
        {
            struct in6_addr addr6{};
            if (inet_pton(AF_INET6, s.c_str(), &addr6) != 1)
                return std::nullopt;
            return fromV6Bytes(addr6.s6_addr);
        }

        struct in_addr addr{};
        if (inet_pton(AF_INET, s.c_str(), &addr) != 1)
            return std::nullopt;
        return fromV4(ntohl(addr.s_addr));
    }

    size_t IpAddr::toBytes(uint8_t *out) const
    {
        if (isV4())
        {
            out[0] = (v4 >> 24) & 0xFF;
            out[1] = (v4 >> 16) & 0xFF;
            out[2] = (v4 >> 8) & 0xFF;
            out[3] = v4 & 0xFF;
            return 4;
        }

        for (int i = 0; i < 8; ++i)
            out[i] = (v6.hi >> (56 - 8 * i)) & 0xFF;
        for (int i = 0; i < 8; ++i)
            out[8 + i] = (v6.lo >> (56 - 8 * i)) & 0xFF;
        return 16;
    }

    IpAddr IpAddr::offset(uint64_t n) const
    {
        if (isV4())
            return fromV4(static_cast<uint32_t>(v4 + n));

        uint64_t lo = v6.lo + n;
        uint64_t hi = v6.hi + (lo < v6.lo ? 1 : 0);
        return fromV6(hi, lo);
    }

    std::string IpAddr::toString() const
    {
        uint8_t raw[16];
        toBytes(raw);

        char buf[INET6_ADDRSTRLEN] = {};
        if (isV4())
            inet_ntop(AF_INET, raw, buf, sizeof(buf));
        else
            inet_ntop(AF_INET6, raw, buf, sizeof(buf));
        return buf;
    }

    IpNetwork::IpNetwork(const IpAddr &addr, uint8_t pre) : prefix(pre)
    {
        if (pre > addr.bitWidth())
        {
            throw std::invalid_argument("prefix length exceeds address width");
        }

        // 规范化网络地址
        if (addr.isV4())
        {
            uint32_t mask = pre == 0 ? 0 : ~((pre == 32) ? 0u : ((1u << (32 - pre)) - 1));
            address = IpAddr::fromV4(addr.v4 & mask);
        }
        else if (pre == 0)
        {
            address = IpAddr::fromV6(0, 0);
        }
        else if (pre < 64)
        {
            // 1ULL << 64 是未定义行为
            uint64_t mask = ~((1ULL << (64 - pre)) - 1);
            address = IpAddr::fromV6(addr.v6.hi & mask, 0);
        }
        else if (pre == 64)
        {
            address = IpAddr::fromV6(addr.v6.hi, 0);
        }
        else if (pre < 128)
        {
            uint64_t mask = ~((1ULL << (128 - pre)) - 1);
            address = IpAddr::fromV6(addr.v6.hi, addr.v6.lo & mask);
        }
        else
        {
            address = addr;
        }
    }

    std::optional<IpNetwork> IpNetwork::parse(std::string_view text)
    {
        auto pos = text.find('/');
        if (pos == std::string_view::npos)
        {
            auto ip = IpAddr::parse(text);
            if (!ip)
                return std::nullopt;
            return IpNetwork(*ip, static_cast<uint8_t>(ip->bitWidth()));
        }

        auto ip = IpAddr::parse(text.substr(0, pos));
        if (!ip)
            return std::nullopt;

        int prefix{};
        auto rest = text.substr(pos + 1);
        auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), prefix);
        if (ec != std::errc() || ptr != rest.data() + rest.size())
            return std::nullopt;
        if (prefix < 0 || prefix > ip->bitWidth())
            return std::nullopt;

        return IpNetwork(*ip, static_cast<uint8_t>(prefix));
    }

    bool IpNetwork::contains(const IpAddr &ip) const
    {
        if (ip.family != address.family)
            return false;
        return IpNetwork(ip, prefix).address == address;
    }

    bool IpNetwork::contains(const IpNetwork &other) const
    {
        return other.prefix >= prefix && contains(other.address);
    }

    std::string IpNetwork::toString() const
    {
        return address.toString() + "/" + std::to_string(prefix);
    }

    std::optional<SocketAddr> SocketAddr::parse(std::string_view text)
    {
        std::string_view host;
        std::string_view portText;

        if (!text.empty() && text.front() == '[')
        {
            auto close = text.find(']');
            if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':')
                return std::nullopt;
            host = text.substr(1, close - 1);
            portText = text.substr(close + 2);
        }
        else
        {
            auto colon = text.rfind(':');
            if (colon == std::string_view::npos || text.find(':') != colon)
                return std::nullopt;
            host = text.substr(0, colon);
            portText = text.substr(colon + 1);
        }

        auto ip = IpAddr::parse(host);
        if (!ip)
            return std::nullopt;

        uint16_t port{};
        auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc() || ptr != portText.data() + portText.size())
            return std::nullopt;

        return SocketAddr(*ip, port);
    }

    std::string SocketAddr::toString() const
    {
        if (ip.isV6())
            return "[" + ip.toString() + "]:" + std::to_string(port);
        return ip.toString() + ":" + std::to_string(port);
    }

} // namespace tunnel
