#ifndef nameserver_set_hpp
#define nameserver_set_hpp

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../Common/clock.hpp"
#include "../Common/ip_addr.hpp"
#include "../Net/socket_factory.hpp"

namespace dns {

using tunnel::Duration;
using tunnel::Instant;
using tunnel::IpAddr;

struct NameserverSetOptions {
    std::string evaluationDomain = "one.one.one.one";
    Duration evaluationTimeout = std::chrono::seconds(2);
    size_t maxInFlight = 20;
    uint16_t port = 53;
    // 有探测在途时的轮询间隔，也是 RTT 的测量精度
    Duration pollInterval = std::chrono::milliseconds(10);
};

/**
 * 上游 DNS 服务器测速
 *
 * evaluate() 为每个候选服务器同时发起一个 UDP 和一个 TCP 的 A 查询；
 * 同时在途的探测数有上限，超出的直接丢弃不排队。查询在 evaluate() 里就发出。
 * 调用方驱动：在 pollTimeout() 给出的时刻调用 poll(now) 推进所有探测，
 * 全部结束时本轮结果整体替换上一轮。
 */
class NameserverSet {
public:
    NameserverSet(tunnel::SocketFactory& factory, NameserverSetOptions options = {});

    void setNameservers(std::vector<IpAddr> servers);
    const std::vector<IpAddr>& nameservers() const { return servers_; }

    // 开始新一轮测速，丢弃上一轮仍在途的探测
    void evaluate(Instant now);

    // 推进在途探测；没有在途探测时返回 true
    bool poll(Instant now);

    // 上一轮完成的测速中 RTT 最小的服务器
    std::optional<IpAddr> fastest() const;

    // 有探测在途时：下一次轮询时刻与最早的探测超时时刻中较早者
    std::optional<Instant> pollTimeout() const;

    // 丢弃所有在途探测（网络切换）
    void reset();

    size_t inFlight() const { return samples_.size(); }

private:
    enum class Transport { Udp, Tcp };

    enum class SampleState { Pending, Succeeded, Failed };

    struct Sample {
        IpAddr server;
        Transport transport = Transport::Udp;
        Instant startedAt;
        uint16_t id = 0;
        std::vector<uint8_t> query;

        std::unique_ptr<tunnel::UdpSocket> udp;
        std::unique_ptr<tunnel::TcpStream> tcp;

        bool querySent = false;
        size_t written = 0;
        std::vector<uint8_t> rx;
    };

    bool startSample(const IpAddr& server, Transport transport, Instant now);
    void finishSample(const Sample& sample, SampleState state, Duration elapsed);
    SampleState advance(Sample& sample);
    SampleState advanceUdp(Sample& sample);
    SampleState advanceTcp(Sample& sample);
    SampleState checkResponse(const Sample& sample, const uint8_t* data, size_t len);

    static const char* transportName(Transport t) { return t == Transport::Udp ? "UDP" : "TCP"; }

private:
    tunnel::SocketFactory& factory_;
    NameserverSetOptions options_;

    std::vector<IpAddr> servers_;
    std::vector<std::unique_ptr<Sample>> samples_;

    // RTT -> 服务器；相同 RTT 后写入者覆盖
    std::map<Duration, IpAddr> pending_;
    std::map<Duration, IpAddr> by_rtt_;

    bool round_active_ = false;
    Instant last_poll_;
    uint16_t next_id_;
};

} // namespace dns

#endif // nameserver_set_hpp
