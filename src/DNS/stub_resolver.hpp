#ifndef stub_resolver_hpp
#define stub_resolver_hpp

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dns_message.hpp"
#include "../Common/ip_addr.hpp"
#include "../Common/ip_provider.hpp"
#include "../Common/uuid.hpp"
#include "../Filter/domain_pattern.h"
#include "../Resource/resource.hpp"

namespace dns {

using tunnel::IpAddr;
using tunnel::ResourceId;

// 本地应答记录的 TTL（秒）
static constexpr uint32_t kStubRecordTtl = 1;

// Firefox 用来探测是否可以默认开启 DoH 的金丝雀域名，回 NXDOMAIN 即可关闭
static constexpr const char* kDohCanaryDomain = "use-application-dns.net";

/**
 * 一个 (域名, 资源) 分配到的代理 IP
 */
struct DnsResourceRecord {
    std::string domain;
    ResourceId resource;
    std::vector<IpAddr> ips;

    bool operator==(const DnsResourceRecord& o) const {
        return domain == o.domain && resource == o.resource && ips == o.ips;
    }
    bool operator<(const DnsResourceRecord& o) const {
        if (domain != o.domain) return domain < o.domain;
        return resource < o.resource;
    }
};

struct RecordsChanged {
    std::vector<DnsResourceRecord> records;
};

/**
 * 对单个 DNS 查询的处理方式
 */
struct ResolveStrategy {
    enum class Kind {
        LocalResponse,  // 本地直接应答（response 有效）
        RecurseLocal,   // 交给上游 / 系统解析器
        RecurseSite,    // 交给托管资源的站点解析（resource 有效）
    };

    Kind kind = Kind::RecurseLocal;
    DNSMessage response;
    ResourceId resource;

    static ResolveStrategy local(DNSMessage msg) {
        ResolveStrategy s;
        s.kind = Kind::LocalResponse;
        s.response = std::move(msg);
        return s;
    }
    static ResolveStrategy recurseLocal() { return ResolveStrategy{}; }
    static ResolveStrategy recurseSite(const ResourceId& id) {
        ResolveStrategy s;
        s.kind = Kind::RecurseSite;
        s.resource = id;
        return s;
    }
};

/**
 * 本地桩解析器
 *
 * 命中 DNS 资源的 A/AAAA 查询由这里分配代理 IP 并直接应答；
 * 每个 (域名, 资源) 只分配一次（4 个 IPv4 + 4 个 IPv6，受资源 IP 栈限制）。
 * 代理 IP -> (域名, 资源) 的反查是 O(1)，用于包转发热路径。
 */
class StubResolver {
public:
    // records 非空时用于恢复之前的分配，地址池会跳过已用的地址
    explicit StubResolver(std::vector<DnsResourceRecord> records = {});

    // pattern 非法时返回 false；模式已存在时覆盖并返回 false
    bool addResource(const ResourceId& id, const std::string& pattern, tunnel::IpStack stack);
    void removeResource(const ResourceId& id);

    ResolveStrategy handle(const DNSMessage& query);

    const std::pair<std::string, ResourceId>* resolveResourceByIp(const IpAddr& ip) const;
    const std::vector<IpAddr>* assignedIps(const std::string& domain, const ResourceId& resource) const;

    std::vector<DnsResourceRecord> records() const;

    std::optional<RecordsChanged> pollEvent();

    size_t resourceCount() const { return resources_.size(); }

private:
    struct StubResource {
        ResourceId id;
        tunnel::IpStack ipStack;
    };

    const StubResource* matchResource(const std::string& domain) const;
    const std::vector<IpAddr>& getOrAssignIps(const std::string& domain, const StubResource& resource);
    std::optional<std::string> nameByReverseDns(const std::string& name) const;

private:
    std::map<std::pair<std::string, ResourceId>, std::vector<IpAddr>> fqdn_to_ips_;
    std::unordered_map<IpAddr, std::pair<std::string, ResourceId>> ips_to_fqdn_;
    tunnel::IpProvider ip_provider_;

    // 按模式优先级排序，线性匹配取第一个
    std::map<tunnel::DomainPattern, StubResource> resources_;

    std::deque<RecordsChanged> events_;
};

} // namespace dns

#endif // stub_resolver_hpp
