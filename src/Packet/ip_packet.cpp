#include "ip_packet.hpp"
#include "../Common/logging.hpp"

#include <algorithm>
#include <array>

namespace tunnel {

namespace {

uint16_t read16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

void write16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

void write32(uint8_t* p, uint32_t v) {
    write16(p, static_cast<uint16_t>(v >> 16));
    write16(p + 2, static_cast<uint16_t>(v & 0xFFFF));
}

// 反码求和（未取反）
uint32_t sumWords(const uint8_t* data, size_t len, uint32_t sum = 0) {
    for (size_t i = 0; i + 1 < len; i += 2) {
        sum += read16(data + i);
    }
    if (len & 1) {
        sum += static_cast<uint32_t>(data[len - 1]) << 8;
    }
    return sum;
}

uint16_t fold(uint32_t sum) {
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum & 0xFFFF);
}

// ICMP 类型常量
namespace icmp4 {
constexpr uint8_t kEchoReply = 0;
constexpr uint8_t kDestUnreachable = 3;
constexpr uint8_t kEchoRequest = 8;
constexpr uint8_t kTimeExceeded = 11;
}

namespace icmp6 {
constexpr uint8_t kDestUnreachable = 1;
constexpr uint8_t kPacketTooBig = 2;
constexpr uint8_t kTimeExceeded = 3;
constexpr uint8_t kParameterProblem = 4;
constexpr uint8_t kEchoRequest = 128;
constexpr uint8_t kEchoReply = 129;
}

constexpr size_t kIcmpHeaderLen = 8;

/*
 * ICMPv4 头 -> ICMPv6 头（原地改写 8 字节头，校验和留给 updateChecksum）
 * 参考 RFC 7915 4.2
 */
bool translateIcmpv4Header(uint8_t* h, uint16_t totalLength) {
    uint8_t type = h[0];
    uint8_t code = h[1];

    auto setUnreachable = [h](uint8_t v6code) {
        h[0] = icmp6::kDestUnreachable;
        h[1] = v6code;
        write32(h + 4, 0);
    };

    switch (type) {
        case icmp4::kEchoRequest:
            h[0] = icmp6::kEchoRequest;
            return true;
        case icmp4::kEchoReply:
            h[0] = icmp6::kEchoReply;
            return true;
        case icmp4::kTimeExceeded:
            if (code > 1) return false;
            h[0] = icmp6::kTimeExceeded;
            write32(h + 4, 0);
            return true;
        case icmp4::kDestUnreachable:
            switch (code) {
                case 0: case 1: case 5: case 6: case 7: case 8: case 11: case 12:
                    setUnreachable(0);  // no route
                    return true;
                case 2:
                    // protocol unreachable -> parameter problem，指向 next header 字段
                    h[0] = icmp6::kParameterProblem;
                    h[1] = 1;
                    write32(h + 4, 6);
                    return true;
                case 3:
                    setUnreachable(4);  // port
                    return true;
                case 4: {
                    if (read16(h + 6) != 0) return false;

                    // next-hop MTU 为 0 时按 RFC 1191 的平台值估算
                    static const std::array<uint16_t, 10> kPlateau = {
                        68, 296, 508, 1006, 1492, 2002, 4352, 8166, 32000, 65535};
                    uint16_t mtu = 0;
                    for (uint16_t v : kPlateau) {
                        if (v < totalLength) mtu = v;
                    }
                    if (mtu == 0) return false;

                    h[0] = icmp6::kPacketTooBig;
                    h[1] = 0;
                    write32(h + 4, mtu);
                    return true;
                }
                case 9: case 10: case 13: case 15:
                    setUnreachable(1);  // administratively prohibited
                    return true;
                default:
                    return false;
            }
        default:
            return false;
    }
}

/*
 * ICMPv6 头 -> ICMPv4 头
 * 参考 RFC 7915 5.2
 */
bool translateIcmpv6Header(uint8_t* h) {
    uint8_t type = h[0];
    uint8_t code = h[1];

    auto setUnreachable = [h](uint8_t v4code) {
        h[0] = icmp4::kDestUnreachable;
        h[1] = v4code;
        write32(h + 4, 0);
    };

    switch (type) {
        case icmp6::kEchoRequest:
            h[0] = icmp4::kEchoRequest;
            return true;
        case icmp6::kEchoReply:
            h[0] = icmp4::kEchoReply;
            return true;
        case icmp6::kDestUnreachable:
            switch (code) {
                case 0: case 2: case 3:
                    setUnreachable(1);  // host unreachable
                    return true;
                case 1:
                    setUnreachable(10);  // host prohibited
                    return true;
                case 4:
                    setUnreachable(3);  // port
                    return true;
                default:
                    return false;
            }
        case icmp6::kPacketTooBig: {
            uint32_t mtu = (static_cast<uint32_t>(read16(h + 4)) << 16) | read16(h + 6);
            uint32_t v4mtu = mtu > 20 ? mtu - 20 : 0;
            if (v4mtu > 0xFFFF) v4mtu = 0xFFFF;
            h[0] = icmp4::kDestUnreachable;
            h[1] = 4;
            write16(h + 4, 0);
            write16(h + 6, static_cast<uint16_t>(v4mtu));
            return true;
        }
        case icmp6::kTimeExceeded:
            if (code > 1) return false;
            h[0] = icmp4::kTimeExceeded;
            write32(h + 4, 0);
            return true;
        case icmp6::kParameterProblem:
            if (code != 1) return false;
            setUnreachable(2);  // protocol unreachable
            return true;
        default:
            return false;
    }
}

} // namespace

std::optional<IpPacket> IpPacket::parse(std::vector<uint8_t> buf) {
    if (buf.empty()) return std::nullopt;

    uint8_t version = buf[0] >> 4;

    if (version == 4) {
        if (buf.size() < kIpv4MinHeaderLen) return std::nullopt;

        size_t ihl = static_cast<size_t>(buf[0] & 0x0F) * 4;
        size_t total = read16(buf.data() + 2);
        if (ihl < kIpv4MinHeaderLen || total < ihl || total > buf.size()) return std::nullopt;

        buf.resize(total);
        return IpPacket(std::move(buf), IpFamily::V4, ihl);
    }

    if (version == 6) {
        if (buf.size() < kIpv6HeaderLen) return std::nullopt;

        size_t total = kIpv6HeaderLen + read16(buf.data() + 4);
        if (total > buf.size()) return std::nullopt;

        buf.resize(total);
        return IpPacket(std::move(buf), IpFamily::V6, kIpv6HeaderLen);
    }

    return std::nullopt;
}

std::optional<IpPacket> IpPacket::make(const IpAddr& src, const IpAddr& dst, uint8_t protocol,
                                       const std::vector<uint8_t>& l4) {
    if (src.family != dst.family) return std::nullopt;

    std::vector<uint8_t> buf;

    if (src.isV4()) {
        if (l4.size() + kIpv4MinHeaderLen > 0xFFFF) return std::nullopt;

        buf.resize(kIpv4MinHeaderLen);
        buf[0] = 0x45;
        write16(buf.data() + 2, static_cast<uint16_t>(kIpv4MinHeaderLen + l4.size()));
        write16(buf.data() + 6, 0x4000);  // DF
        buf[8] = 64;
        buf[9] = protocol;
        src.toBytes(buf.data() + 12);
        dst.toBytes(buf.data() + 16);
    } else {
        if (l4.size() > 0xFFFF) return std::nullopt;

        buf.resize(kIpv6HeaderLen);
        buf[0] = 0x60;
        write16(buf.data() + 4, static_cast<uint16_t>(l4.size()));
        buf[6] = protocol;
        buf[7] = 64;
        src.toBytes(buf.data() + 8);
        dst.toBytes(buf.data() + 24);
    }

    buf.insert(buf.end(), l4.begin(), l4.end());

    auto packet = parse(std::move(buf));
    if (packet) packet->updateChecksum();
    return packet;
}

std::optional<IpPacket> IpPacket::makeUdp(const IpAddr& src, const IpAddr& dst, uint16_t srcPort,
                                          uint16_t dstPort, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> l4(8);
    write16(l4.data(), srcPort);
    write16(l4.data() + 2, dstPort);
    write16(l4.data() + 4, static_cast<uint16_t>(8 + payload.size()));
    l4.insert(l4.end(), payload.begin(), payload.end());
    return make(src, dst, ipproto::kUdp, l4);
}

std::optional<IpPacket> IpPacket::makeTcp(const IpAddr& src, const IpAddr& dst, uint16_t srcPort,
                                          uint16_t dstPort, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> l4(20);
    write16(l4.data(), srcPort);
    write16(l4.data() + 2, dstPort);
    l4[12] = 5 << 4;   // data offset
    l4[13] = 0x18;     // PSH | ACK
    write16(l4.data() + 14, 65535);
    l4.insert(l4.end(), payload.begin(), payload.end());
    return make(src, dst, ipproto::kTcp, l4);
}

std::optional<IpPacket> IpPacket::makeIcmpEcho(const IpAddr& src, const IpAddr& dst, bool request,
                                               uint16_t identifier, uint16_t sequence,
                                               const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> l4(kIcmpHeaderLen);
    if (src.isV4()) {
        l4[0] = request ? icmp4::kEchoRequest : icmp4::kEchoReply;
    } else {
        l4[0] = request ? icmp6::kEchoRequest : icmp6::kEchoReply;
    }
    write16(l4.data() + 4, identifier);
    write16(l4.data() + 6, sequence);
    l4.insert(l4.end(), payload.begin(), payload.end());
    return make(src, dst, src.isV4() ? ipproto::kIcmp : ipproto::kIcmpv6, l4);
}

IpAddr IpPacket::source() const {
    return isV4() ? IpAddr::fromV4Bytes(buf_.data() + 12) : IpAddr::fromV6Bytes(buf_.data() + 8);
}

IpAddr IpPacket::destination() const {
    return isV4() ? IpAddr::fromV4Bytes(buf_.data() + 16) : IpAddr::fromV6Bytes(buf_.data() + 24);
}

bool IpPacket::setSource(const IpAddr& ip) {
    if (ip.family != family_) return false;
    ip.toBytes(buf_.data() + (isV4() ? 12 : 8));
    return true;
}

bool IpPacket::setDestination(const IpAddr& ip) {
    if (ip.family != family_) return false;
    ip.toBytes(buf_.data() + (isV4() ? 16 : 24));
    return true;
}

uint8_t IpPacket::protocol() const {
    return isV4() ? buf_[9] : buf_[6];
}

uint8_t IpPacket::ttl() const {
    return isV4() ? buf_[8] : buf_[7];
}

uint8_t IpPacket::tos() const {
    if (isV4()) return buf_[1];
    return static_cast<uint8_t>(((buf_[0] & 0x0F) << 4) | (buf_[1] >> 4));
}

bool IpPacket::isFragment() const {
    if (!isV4()) return protocol() == ipproto::kFragment;
    uint16_t flagsOffset = read16(buf_.data() + 6);
    return (flagsOffset & 0x2000) != 0 || (flagsOffset & 0x1FFF) != 0;
}

bool IpPacket::isIcmp() const {
    return protocol() == (isV4() ? ipproto::kIcmp : ipproto::kIcmpv6);
}

// 端口所在的 L4 偏移；非 TCP/UDP 或长度不足时返回 0
size_t IpPacket::portOffset() const {
    uint8_t proto = protocol();
    if (proto != ipproto::kTcp && proto != ipproto::kUdp) return 0;
    if (isV4() && isFragment()) return 0;
    if (payloadLength() < 4) return 0;
    return header_len_;
}

std::optional<uint16_t> IpPacket::sourcePort() const {
    size_t off = portOffset();
    if (off == 0) return std::nullopt;
    return read16(buf_.data() + off);
}

std::optional<uint16_t> IpPacket::destinationPort() const {
    size_t off = portOffset();
    if (off == 0) return std::nullopt;
    return read16(buf_.data() + off + 2);
}

bool IpPacket::setSourcePort(uint16_t port) {
    size_t off = portOffset();
    if (off == 0) return false;
    write16(buf_.data() + off, port);
    return true;
}

bool IpPacket::setDestinationPort(uint16_t port) {
    size_t off = portOffset();
    if (off == 0) return false;
    write16(buf_.data() + off + 2, port);
    return true;
}

std::optional<uint16_t> IpPacket::icmpEchoId() const {
    if (!isIcmp() || payloadLength() < kIcmpHeaderLen) return std::nullopt;

    uint8_t type = payload()[0];
    bool echo = isV4() ? (type == icmp4::kEchoRequest || type == icmp4::kEchoReply)
                       : (type == icmp6::kEchoRequest || type == icmp6::kEchoReply);
    if (!echo) return std::nullopt;
    return read16(payload() + 4);
}

bool IpPacket::setIcmpEchoId(uint16_t id) {
    if (!icmpEchoId()) return false;
    write16(payload() + 4, id);
    return true;
}

void IpPacket::updateChecksum() {
    if (isV4()) {
        write16(buf_.data() + 10, 0);
        write16(buf_.data() + 10, fold(sumWords(buf_.data(), header_len_)));

        // 非首片不带 L4 头
        if ((read16(buf_.data() + 6) & 0x1FFF) != 0) return;
    }

    uint8_t proto = protocol();
    uint8_t* l4 = payload();
    size_t len = payloadLength();

    size_t csumOffset;
    switch (proto) {
        case ipproto::kTcp:    csumOffset = 16; break;
        case ipproto::kUdp:    csumOffset = 6;  break;
        case ipproto::kIcmp:   csumOffset = 2;  break;
        case ipproto::kIcmpv6: csumOffset = 2;  break;
        default: return;
    }
    if (len < csumOffset + 2) return;

    write16(l4 + csumOffset, 0);

    uint32_t sum = 0;
    if (proto != ipproto::kIcmp) {
        // 伪首部
        if (isV4()) {
            sum = sumWords(buf_.data() + 12, 8);
        } else {
            sum = sumWords(buf_.data() + 8, 32);
            sum += static_cast<uint32_t>(len >> 16);
        }
        sum += proto;
        sum += static_cast<uint32_t>(len & 0xFFFF);
    }
    sum = sumWords(l4, len, sum);

    uint16_t csum = fold(sum);
    if (proto == ipproto::kUdp && csum == 0) {
        csum = 0xFFFF;
    }
    write16(l4 + csumOffset, csum);
}

std::optional<IpPacket> consumeToIpv4(IpPacket packet, const IpAddr& src, const IpAddr& dst) {
    if (!packet.isV6() || !src.isV4() || !dst.isV4()) return std::nullopt;

    uint8_t nextHeader = packet.protocol();
    switch (nextHeader) {
        case ipproto::kHopByHop:
        case ipproto::kRouting:
        case ipproto::kFragment:
        case ipproto::kDestOptions:
            TUN_LOG_DEBUG("nat64: cannot translate IPv6 extension header %u", static_cast<unsigned>(nextHeader));
            return std::nullopt;
        default:
            break;
    }

    size_t l4len = packet.payloadLength();
    if (l4len + kIpv4MinHeaderLen > 0xFFFF) return std::nullopt;

    uint8_t protocol = nextHeader == ipproto::kIcmpv6 ? ipproto::kIcmp : nextHeader;

    std::vector<uint8_t> buf(kIpv4MinHeaderLen + l4len);
    buf[0] = 0x45;
    buf[1] = packet.tos();
    write16(buf.data() + 2, static_cast<uint16_t>(buf.size()));
    write16(buf.data() + 4, 0);
    write16(buf.data() + 6, 0x4000);  // DF
    buf[8] = packet.ttl();
    buf[9] = protocol;
    src.toBytes(buf.data() + 12);
    dst.toBytes(buf.data() + 16);
    std::copy(packet.payload(), packet.payload() + l4len, buf.begin() + kIpv4MinHeaderLen);

    if (nextHeader == ipproto::kIcmpv6) {
        if (l4len < kIcmpHeaderLen || !translateIcmpv6Header(buf.data() + kIpv4MinHeaderLen)) {
            TUN_LOG_DEBUG("nat64: cannot translate ICMPv6 type %u",
                          l4len > 0 ? static_cast<unsigned>(packet.payload()[0]) : 0u);
            return std::nullopt;
        }
    }

    TUN_LOG_TRACE("nat64: %s -> %s translated to %s -> %s", packet.source().toString().c_str(),
                  packet.destination().toString().c_str(), src.toString().c_str(), dst.toString().c_str());

    return IpPacket(std::move(buf), IpFamily::V4, kIpv4MinHeaderLen);
}

std::optional<IpPacket> consumeToIpv6(IpPacket packet, const IpAddr& src, const IpAddr& dst) {
    if (!packet.isV4() || !src.isV6() || !dst.isV6()) return std::nullopt;

    if (packet.isFragment()) {
        TUN_LOG_DEBUG("nat46: cannot translate fragmented IPv4 packet");
        return std::nullopt;
    }

    uint8_t protocol = packet.protocol();
    size_t l4len = packet.payloadLength();
    uint16_t totalLength = static_cast<uint16_t>(packet.bytes().size());

    std::vector<uint8_t> buf(kIpv6HeaderLen + l4len);
    uint8_t tc = packet.tos();
    buf[0] = static_cast<uint8_t>(0x60 | (tc >> 4));
    buf[1] = static_cast<uint8_t>((tc & 0x0F) << 4);
    write16(buf.data() + 4, static_cast<uint16_t>(l4len));
    buf[6] = protocol == ipproto::kIcmp ? ipproto::kIcmpv6 : protocol;
    buf[7] = packet.ttl();
    src.toBytes(buf.data() + 8);
    dst.toBytes(buf.data() + 24);
    std::copy(packet.payload(), packet.payload() + l4len, buf.begin() + kIpv6HeaderLen);

    if (protocol == ipproto::kIcmp) {
        if (l4len < kIcmpHeaderLen || !translateIcmpv4Header(buf.data() + kIpv6HeaderLen, totalLength)) {
            TUN_LOG_DEBUG("nat46: cannot translate ICMP type %u",
                          l4len > 0 ? static_cast<unsigned>(packet.payload()[0]) : 0u);
            return std::nullopt;
        }
    }

    TUN_LOG_TRACE("nat46: %s -> %s translated to %s -> %s", packet.source().toString().c_str(),
                  packet.destination().toString().c_str(), src.toString().c_str(), dst.toString().c_str());

    return IpPacket(std::move(buf), IpFamily::V6, kIpv6HeaderLen);
}

} // namespace tunnel
