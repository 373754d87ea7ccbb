#ifndef ip_provider_hpp
#define ip_provider_hpp

#include <cstdint>
#include <optional>
#include <vector>

#include "ip_addr.hpp"

namespace tunnel {

// 客户端保留地址段
namespace ranges {

// DNS 资源的代理 IP
IpNetwork ipv4Resources();   // 100.96.0.0/11
IpNetwork ipv6Resources();   // fd00:2021:1111:8000::/107

// 暴露给操作系统的哨兵 DNS 服务器
IpNetwork dnsSentinelsV4();  // 100.100.111.0/24
IpNetwork dnsSentinelsV6();  // fd00:2021:1111:8000:100:100:111:0/120

bool isSentinel(const IpAddr& ip);

} // namespace ranges

/**
 * 按顺序从一个 IPv4 网段与一个 IPv6 网段中分配地址，跳过排除列表
 *
 * IPv4 跳过网络地址与广播地址（前缀 < 31 时）；IPv6 从网络地址开始。
 * 地址耗尽后返回 std::nullopt。
 */
class IpProvider {
public:
    IpProvider(const IpNetwork& v4, const IpNetwork& v6, std::vector<IpNetwork> exclusions);

    // 代理 IP 分配器，排除哨兵网段
    static IpProvider forResources();

    // 哨兵 IP 分配器，排除之前用过的哨兵
    static IpProvider forStubDnsServers(const std::vector<IpAddr>& oldSentinels);

    std::optional<IpAddr> nextIpv4();
    std::optional<IpAddr> nextIpv6();
    std::optional<IpAddr> nextFor(IpFamily family);

    std::vector<IpAddr> getNIpv4(size_t n);
    std::vector<IpAddr> getNIpv6(size_t n);

private:
    struct Cursor {
        IpNetwork network;
        uint64_t next;
        uint64_t end;   // 不含
    };

    std::optional<IpAddr> advance(Cursor& c);
    bool excluded(const IpAddr& ip) const;

private:
    Cursor v4_;
    Cursor v6_;
    std::vector<IpNetwork> exclusions_;
};

} // namespace tunnel

#endif // ip_provider_hpp
