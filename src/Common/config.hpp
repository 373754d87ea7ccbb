#ifndef tunnel_config_hpp
#define tunnel_config_hpp

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "clock.hpp"
#include "ip_addr.hpp"
#include "logging.hpp"
#include "../Resource/resource.hpp"

namespace tunnel {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * 隧道 DNS 子系统的全部可调参数
 *
 * JSON 中缺失的字段保持默认值，类型错误抛出 ConfigError。
 */
struct TunnelConfig {
    log::Level logLevel = log::Level::Info;

    // 门户下发的上游 Do53 服务器（优先级最高）
    std::vector<SocketAddr> upstreamDns;

    // 没有上游也没有系统解析器时使用
    std::vector<IpAddr> fallbackDns;

    std::string resolvConfPath = "/etc/resolv.conf";

    uint32_t dnsCacheMinTtlSecs = 5;

    Duration evaluationTimeout = std::chrono::seconds(2);
    size_t maxConcurrentEvaluations = 20;
    Duration nameserverEvaluationInterval = std::chrono::seconds(60);
    std::string evaluationDomain = "one.one.one.one";

    Duration assignedIpsResendInterval = std::chrono::seconds(2);
    size_t natBufferCapacity = 32;

    std::vector<Resource> resources;

    static TunnelConfig fromJson(std::string_view text);
    static TunnelConfig load(const std::string& path);

    // 把日志级别应用到全局 logger
    void apply() const;
};

} // namespace tunnel

#endif // tunnel_config_hpp
