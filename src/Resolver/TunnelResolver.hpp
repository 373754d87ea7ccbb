#ifndef TunnelResolver_hpp
#define TunnelResolver_hpp

#include <cstdint>
#include <deque>
#include <optional>
#include <variant>
#include <vector>

#include "../Common/clock.hpp"
#include "../Common/config.hpp"
#include "../Common/ip_addr.hpp"
#include "../DNS/dns_cache.hpp"
#include "../DNS/dns_config.hpp"
#include "../DNS/nameserver_set.hpp"
#include "../DNS/stub_resolver.hpp"
#include "../Net/socket_factory.hpp"
#include "../Packet/ip_packet.hpp"
#include "../Protocol/dns_resource_nat.hpp"
#include "../Resource/resource_index.hpp"

namespace tunnel {

    enum class ResolverAction {
        InjectResponse,   // 本地构造 response（responseData 有效）
        ForwardUpstream,  // 转发给上游 DNS 服务器（upstream 有效）
        ForwardSite,      // 转发给托管资源的站点（resource 有效）
        Drop              // 丢弃
    };

    struct ResolverResult {
        ResolverAction action = ResolverAction::Drop;

        std::vector<uint8_t> responseData;
        SocketAddr upstream;
        ResourceId resource;
    };

    using ResolverEvent = std::variant<dns::DnsServersUpdated, dns::RecordsChanged>;

    /**
     * 客户端 DNS 处理入口
     *
     * 组合资源索引、桩解析器、应答缓存、哨兵映射和上游测速。
     * 发往代理 IP 的报文经过 DNS 资源 NAT：网关确认之前先缓冲，
     * 待发的 AssignedIps 控制报文用 pollControlPacket() 取出。
     * 全部由调用方驱动：收到报文时调用 onDnsQuery / onUpstreamResponse，
     * 在 pollTimeout() 给出的时刻调用 handleTimeout(now)，并用 pollEvent() 取出事件。
     */
    class TunnelResolver {
    public:
        TunnelResolver(const TunnelConfig& config, SocketFactory& socketFactory, Instant now);
        ~TunnelResolver() = default;

        // 发往哨兵 IP 的 DNS 查询
        ResolverResult onDnsQuery(const IpAddr& sentinel, const uint8_t* data, size_t length, Instant now);

        // 上游返回的应答，返回是否被缓存
        bool onUpstreamResponse(const uint8_t* data, size_t length, Instant now);

        void addResource(Resource resource);
        bool removeResource(const ResourceId& id);

        void setSystemResolvers(const std::vector<IpAddr>& servers, Instant now);
        void setUpstreamDns(const std::vector<SocketAddr>& servers, Instant now);
        void setFallbackDns(const std::vector<IpAddr>& servers, Instant now);

        // 重新读取 resolv.conf
        void refreshSystemResolvers(Instant now);

        // 网络切换：清空缓存，丢弃在途探测，重新分配哨兵
        void resetNetwork(Instant now);

        void handleTimeout(Instant now);
        std::optional<Instant> pollTimeout() const;

        std::optional<ResolverEvent> pollEvent();

        // 发往 gateway 的隧道报文。目标不是代理 IP 时原样返回；
        // 需要等网关建立 NAT 时返回 nullopt，报文在确认后由 onControlPacket 交回
        std::optional<IpPacket> onOutboundPacket(IpPacket packet, const GatewayId& gateway, Instant now);

        // gateway 发来的控制报文，返回可以放行的缓冲报文
        std::vector<IpPacket> onControlPacket(const GatewayId& gateway, const IpPacket& packet);

        std::optional<AssignedIpsPacket> pollControlPacket() { return mNat.pollPacket(); }

        // 报文目标 -> 资源：代理 IP，CIDR 最长前缀，最后是 Internet 资源
        const Resource* resolveResource(const IpAddr& dst) const;

        std::optional<IpAddr> fastestNameserver() const { return mNameservers.fastest(); }
        const dns::DnsMapping& dnsMapping() const { return mDnsConfig.mapping(); }
        const dns::DNSResponseCache& cache() const { return mCache; }
        const ResourceIndex& resources() const { return mResources; }
        const DnsResourceNat& dnsResourceNat() const { return mNat; }

    private:
        ResolverResult forwardUpstream(const dns::DNSMessage& query, const SocketAddr& sentinelUpstream);
        void processConfigEvents(Instant now);
        void evaluateNameservers(Instant now);

    private:
        ResourceIndex mResources;
        dns::StubResolver mStub;
        dns::DNSResponseCache mCache;
        dns::DnsConfig mDnsConfig;
        dns::NameserverSet mNameservers;
        DnsResourceNat mNat;

        std::string mResolvConfPath;
        Duration mEvaluationInterval;
        Instant mNextEvaluation;

        std::deque<ResolverEvent> mEvents;
    };

}

#endif /* TunnelResolver_hpp */
