#ifndef ip_packet_hpp
#define ip_packet_hpp

#include <cstdint>
#include <optional>
#include <vector>

#include "../Common/ip_addr.hpp"

namespace tunnel {

namespace ipproto {
static constexpr uint8_t kHopByHop = 0;
static constexpr uint8_t kIcmp = 1;
static constexpr uint8_t kTcp = 6;
static constexpr uint8_t kUdp = 17;
static constexpr uint8_t kRouting = 43;
static constexpr uint8_t kFragment = 44;
static constexpr uint8_t kIcmpv6 = 58;
static constexpr uint8_t kDestOptions = 60;
// RFC 3692 实验用协议号，承载隧道内控制报文
static constexpr uint8_t kExperimental = 253;
}

static constexpr size_t kIpv4MinHeaderLen = 20;
static constexpr size_t kIpv6HeaderLen = 40;

/**
 * IP 报文（IPv4 或 IPv6），独占底层缓冲区
 *
 * parse() 之后头部已校验过，访问函数不会越界。
 * 修改地址或协议转换后不会自动更新校验和，需要显式调用 updateChecksum()。
 */
class IpPacket {
public:
    // 头部长度不合法或缓冲区被截断时返回 nullopt；多余的尾部字节会被裁掉
    static std::optional<IpPacket> parse(std::vector<uint8_t> buf);

    // 构造一个完整的报文（地址族由 src 决定），并计算校验和
    static std::optional<IpPacket> make(const IpAddr& src, const IpAddr& dst, uint8_t protocol,
                                        const std::vector<uint8_t>& l4);
    static std::optional<IpPacket> makeUdp(const IpAddr& src, const IpAddr& dst, uint16_t srcPort,
                                           uint16_t dstPort, const std::vector<uint8_t>& payload);
    static std::optional<IpPacket> makeTcp(const IpAddr& src, const IpAddr& dst, uint16_t srcPort,
                                           uint16_t dstPort, const std::vector<uint8_t>& payload);
    static std::optional<IpPacket> makeIcmpEcho(const IpAddr& src, const IpAddr& dst, bool request,
                                                uint16_t identifier, uint16_t sequence,
                                                const std::vector<uint8_t>& payload);

    IpFamily family() const { return family_; }
    bool isV4() const { return family_ == IpFamily::V4; }
    bool isV6() const { return family_ == IpFamily::V6; }

    IpAddr source() const;
    IpAddr destination() const;

    // 地址族必须与报文一致，否则返回 false
    bool setSource(const IpAddr& ip);
    bool setDestination(const IpAddr& ip);

    // IPv4 的 protocol / IPv6 的 next header
    uint8_t protocol() const;

    uint8_t ttl() const;
    uint8_t tos() const;

    size_t headerLength() const { return header_len_; }

    const uint8_t* payload() const { return buf_.data() + header_len_; }
    uint8_t* payload() { return buf_.data() + header_len_; }
    size_t payloadLength() const { return buf_.size() - header_len_; }

    // TCP / UDP 端口，其他协议为 nullopt
    std::optional<uint16_t> sourcePort() const;
    std::optional<uint16_t> destinationPort() const;
    bool setSourcePort(uint16_t port);
    bool setDestinationPort(uint16_t port);

    // ICMP / ICMPv6 echo 的 identifier
    std::optional<uint16_t> icmpEchoId() const;
    bool setIcmpEchoId(uint16_t id);

    bool isFragment() const;

    // 重新计算 IPv4 头校验和，以及 TCP / UDP / ICMP / ICMPv6 的校验和
    void updateChecksum();

    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> release() { return std::move(buf_); }

    bool operator==(const IpPacket& o) const { return buf_ == o.buf_; }
    bool operator!=(const IpPacket& o) const { return buf_ != o.buf_; }

private:
    IpPacket(std::vector<uint8_t> buf, IpFamily family, size_t headerLen)
        : buf_(std::move(buf)), family_(family), header_len_(headerLen) {}

    bool isIcmp() const;
    size_t portOffset() const;

private:
    std::vector<uint8_t> buf_;
    IpFamily family_;
    size_t header_len_;

    friend std::optional<IpPacket> consumeToIpv4(IpPacket packet, const IpAddr& src, const IpAddr& dst);
    friend std::optional<IpPacket> consumeToIpv6(IpPacket packet, const IpAddr& src, const IpAddr& dst);
};

/**
 * IPv6 -> IPv4（NAT64）
 *
 * 报文被消耗；扩展头（逐跳 / 路由 / 分片 / 目的选项）和无法映射的 ICMPv6 类型返回 nullopt。
 * 生成的 IPv4 头：无选项，DF=1，identification=0，TTL=hop limit，TOS=traffic class。
 */
std::optional<IpPacket> consumeToIpv4(IpPacket packet, const IpAddr& src, const IpAddr& dst);

/**
 * IPv4 -> IPv6（NAT46）
 *
 * IPv4 选项被丢弃；分片报文和无法映射的 ICMP 类型返回 nullopt。
 * flow label 为 0，traffic class=TOS，hop limit=TTL。
 */
std::optional<IpPacket> consumeToIpv6(IpPacket packet, const IpAddr& src, const IpAddr& dst);

} // namespace tunnel

#endif // ip_packet_hpp
