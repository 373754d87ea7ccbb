#include "config.hpp"
#include "../Resource/resource_codec.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tunnel {

static constexpr uint16_t kDnsPort = 53;

static SocketAddr parseUpstream(const std::string& text)
{
    if (auto sa = SocketAddr::parse(text)) {
        return *sa;
    }
    if (auto ip = IpAddr::parse(text)) {
        return SocketAddr(*ip, kDnsPort);
    }
    throw ConfigError("invalid upstream DNS server: " + text);
}

static IpAddr parseIp(const std::string& text)
{
    auto ip = IpAddr::parse(text);
    if (!ip) {
        throw ConfigError("invalid IP address: " + text);
    }
    return *ip;
}

TunnelConfig TunnelConfig::fromJson(std::string_view text)
{
    TunnelConfig cfg;

    try {
        json j = json::parse(text.begin(), text.end());
        if (!j.is_object()) {
            throw ConfigError("configuration root must be an object");
        }

        if (j.contains("log_level")) {
            auto name = j["log_level"].get<std::string>();
            auto lvl = log::parseLevel(name);
            if (!lvl) {
                throw ConfigError("unknown log level: " + name);
            }
            cfg.logLevel = *lvl;
        }

        if (j.contains("upstream_dns")) {
            for (const auto& s : j["upstream_dns"]) {
                cfg.upstreamDns.push_back(parseUpstream(s.get<std::string>()));
            }
        }

        if (j.contains("fallback_dns")) {
            for (const auto& s : j["fallback_dns"]) {
                cfg.fallbackDns.push_back(parseIp(s.get<std::string>()));
            }
        }

        if (j.contains("resolv_conf")) {
            cfg.resolvConfPath = j["resolv_conf"].get<std::string>();
        }
        if (j.contains("dns_cache_min_ttl_secs")) {
            cfg.dnsCacheMinTtlSecs = j["dns_cache_min_ttl_secs"].get<uint32_t>();
        }
        if (j.contains("evaluation_timeout_ms")) {
            cfg.evaluationTimeout = std::chrono::milliseconds(j["evaluation_timeout_ms"].get<uint32_t>());
        }
        if (j.contains("max_concurrent_evaluations")) {
            cfg.maxConcurrentEvaluations = j["max_concurrent_evaluations"].get<size_t>();
        }
        if (j.contains("nameserver_evaluation_interval_secs")) {
            cfg.nameserverEvaluationInterval =
                std::chrono::seconds(j["nameserver_evaluation_interval_secs"].get<uint32_t>());
        }
        if (j.contains("evaluation_domain")) {
            cfg.evaluationDomain = j["evaluation_domain"].get<std::string>();
        }
        if (j.contains("assigned_ips_resend_interval_ms")) {
            cfg.assignedIpsResendInterval =
                std::chrono::milliseconds(j["assigned_ips_resend_interval_ms"].get<uint32_t>());
        }
        if (j.contains("nat_buffer_capacity")) {
            cfg.natBufferCapacity = j["nat_buffer_capacity"].get<size_t>();
        }

        if (j.contains("resources")) {
            if (!j["resources"].is_array()) {
                throw ConfigError("'resources' must be an array");
            }
            for (const auto& r : j["resources"]) {
                // 未知类型忽略
                if (auto res = resourceFromJson(r)) {
                    cfg.resources.push_back(std::move(*res));
                }
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed configuration: ") + e.what());
    }

    if (cfg.maxConcurrentEvaluations == 0) {
        throw ConfigError("max_concurrent_evaluations must be positive");
    }
    if (cfg.natBufferCapacity == 0) {
        throw ConfigError("nat_buffer_capacity must be positive");
    }

    return cfg;
}

TunnelConfig TunnelConfig::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("could not open configuration file " + path);
    }

    std::stringstream buf;
    buf << file.rdbuf();
    return fromJson(buf.str());
}

void TunnelConfig::apply() const
{
    log::setLevel(logLevel);
}

} // namespace tunnel
