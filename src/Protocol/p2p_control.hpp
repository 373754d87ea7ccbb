#ifndef p2p_control_hpp
#define p2p_control_hpp

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../Common/ip_addr.hpp"
#include "../Common/uuid.hpp"
#include "../Packet/ip_packet.hpp"

/*
 * 客户端 <-> 网关 的带内控制协议
 *
 * 消息格式：8 字节头 [event_type, 0, 0, 0, 0, 0, 0, 0] + JSON 负载。
 * 承载在 IPv6 报文里：next header = 253，源 / 目的地址都是 fd00:2021:1111:ffff::fffe。
 */
namespace p2p {

using tunnel::IpAddr;
using tunnel::ResourceId;

enum class EventType : uint8_t {
    AssignedIps = 0,
    DomainStatus = 1,
    Goodbye = 2,
};

static constexpr size_t kHeaderLen = 8;

class InvalidProxyIpCount : public std::invalid_argument {
public:
    explicit InvalidProxyIpCount(size_t count);

    size_t count() const { return count_; }

private:
    size_t count_;
};

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 域名不是合法 UTF-8，无法写进 JSON 负载
class EncodeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * 网关为一个 DNS 资源域名分配的代理 IP
 *
 * 代理 IP 必须是 4 个（单栈）或 8 个（双栈），否则构造时抛出 InvalidProxyIpCount。
 */
class AssignedIps {
public:
    AssignedIps(const ResourceId& resource, std::string domain, std::vector<IpAddr> proxyIps);

    const ResourceId& resource() const { return resource_; }
    const std::string& domain() const { return domain_; }
    const std::vector<IpAddr>& proxyIps() const { return proxy_ips_; }

    bool operator==(const AssignedIps& o) const {
        return resource_ == o.resource_ && domain_ == o.domain_ && proxy_ips_ == o.proxy_ips_;
    }

private:
    ResourceId resource_;
    std::string domain_;
    std::vector<IpAddr> proxy_ips_;
};

enum class NatStatus : uint8_t {
    Active,
    Inactive,
};

const char* natStatusName(NatStatus status);

struct DomainStatus {
    ResourceId resource;
    std::string domain;
    NatStatus status = NatStatus::Inactive;

    bool operator==(const DomainStatus& o) const {
        return resource == o.resource && domain == o.domain && status == o.status;
    }
};

// 失败时抛出 EncodeError
std::vector<uint8_t> encodeAssignedIps(const AssignedIps& msg);
std::vector<uint8_t> encodeDomainStatus(const DomainStatus& msg);
std::vector<uint8_t> encodeGoodbye();

// 以下解码函数失败时抛出 DecodeError
EventType peekEventType(const uint8_t* data, size_t len);
AssignedIps decodeAssignedIps(const uint8_t* data, size_t len);
DomainStatus decodeDomainStatus(const uint8_t* data, size_t len);
void decodeGoodbye(const uint8_t* data, size_t len);

// 控制报文使用的隧道内地址
IpAddr controlAddress();

// 把控制消息封装成 IPv6 报文
std::optional<tunnel::IpPacket> makeControlPacket(const std::vector<uint8_t>& message);

bool isControlPacket(const tunnel::IpPacket& packet);

} // namespace p2p

#endif // p2p_control_hpp
