#pragma once

#include <map>
#include <memory>
#include <vector>

#include "../src/Common/clock.hpp"
#include "../src/DNS/dns_message.hpp"
#include "../src/Net/socket_factory.hpp"

namespace test {

/**
 * 脚本化的网络：每个服务器有固定的应答延迟，可以整体不可达。
 * 时间由测试推进（now 字段），不读真实时钟。
 */
struct FakeNetwork {
    struct Server {
        tunnel::Duration latency = std::chrono::milliseconds(10);
        bool reachable = true;
        dns::ResponseCode rcode = dns::ResponseCode::NoError;
    };

    tunnel::Instant now;
    std::map<tunnel::IpAddr, Server> servers;

    size_t udpBound = 0;
    size_t tcpConnected = 0;

    const Server* find(const tunnel::IpAddr& ip) const {
        auto it = servers.find(ip);
        return it == servers.end() ? nullptr : &it->second;
    }

    // 对查询构造应答；查询无法解析时返回空
    std::vector<uint8_t> answer(const uint8_t* data, size_t len, const Server& server) const {
        dns::DNSParser parser;
        dns::DNSMessage query;
        std::vector<uint8_t> wire;
        if (!parser.parse(data, len, query)) return wire;

        auto resp = dns::DNSBuilder::responseFor(query, server.rcode);
        if (server.rcode == dns::ResponseCode::NoError) {
            resp.answers.push_back(dns::DNSBuilder::addressRecord(query.domain(), 60,
                                                                  tunnel::IpAddr::fromV4(0x01010101)));
        }
        dns::DNSBuilder::serialize(resp, wire);
        return wire;
    }
};

class FakeUdpSocket : public tunnel::UdpSocket {
public:
    explicit FakeUdpSocket(FakeNetwork& net) : net_(net) {}

    tunnel::IoStatus sendTo(const tunnel::SocketAddr& dst, const uint8_t* data, size_t len) override {
        const auto* server = net_.find(dst.ip);
        if (!server || !server->reachable) {
            return tunnel::IoStatus::Ok;
        }
        pending_.push_back(Datagram{dst, net_.now + server->latency, net_.answer(data, len, *server)});
        return tunnel::IoStatus::Ok;
    }

    tunnel::IoStatus recvFrom(std::vector<uint8_t>& out, tunnel::SocketAddr& from) override {
        for (auto it = pending_.begin(); it != pending_.end(); ++it) {
            if (it->readyAt <= net_.now) {
                out = std::move(it->payload);
                from = it->from;
                pending_.erase(it);
                return tunnel::IoStatus::Ok;
            }
        }
        return tunnel::IoStatus::WouldBlock;
    }

private:
    struct Datagram {
        tunnel::SocketAddr from;
        tunnel::Instant readyAt;
        std::vector<uint8_t> payload;
    };

    FakeNetwork& net_;
    std::vector<Datagram> pending_;
};

class FakeTcpStream : public tunnel::TcpStream {
public:
    FakeTcpStream(FakeNetwork& net, const tunnel::SocketAddr& remote) : net_(net), remote_(remote) {}

    tunnel::IoStatus pollConnected() override {
        const auto* server = net_.find(remote_.ip);
        if (!server || !server->reachable) {
            return tunnel::IoStatus::WouldBlock;
        }
        return tunnel::IoStatus::Ok;
    }

    tunnel::IoStatus send(const uint8_t* data, size_t len, size_t& written) override {
        const auto* server = net_.find(remote_.ip);
        tx_.insert(tx_.end(), data, data + len);
        written = len;

        if (server && tx_.size() >= 2) {
            size_t msgLen = (static_cast<size_t>(tx_[0]) << 8) | tx_[1];
            if (tx_.size() >= msgLen + 2) {
                auto wire = net_.answer(tx_.data() + 2, msgLen, *server);
                response_.push_back(static_cast<uint8_t>(wire.size() >> 8));
                response_.push_back(static_cast<uint8_t>(wire.size() & 0xFF));
                response_.insert(response_.end(), wire.begin(), wire.end());
                readyAt_ = net_.now + server->latency;
            }
        }
        return tunnel::IoStatus::Ok;
    }

    tunnel::IoStatus recv(std::vector<uint8_t>& out) override {
        if (response_.empty() || net_.now < readyAt_) {
            return tunnel::IoStatus::WouldBlock;
        }
        out.insert(out.end(), response_.begin(), response_.end());
        response_.clear();
        return tunnel::IoStatus::Ok;
    }

private:
    FakeNetwork& net_;
    tunnel::SocketAddr remote_;
    std::vector<uint8_t> tx_;
    std::vector<uint8_t> response_;
    tunnel::Instant readyAt_;
};

class FakeSocketFactory : public tunnel::SocketFactory {
public:
    explicit FakeSocketFactory(FakeNetwork& net) : net_(net) {}

    std::unique_ptr<tunnel::UdpSocket> bindUdp(tunnel::IpFamily) override {
        net_.udpBound++;
        return std::make_unique<FakeUdpSocket>(net_);
    }

    std::unique_ptr<tunnel::TcpStream> connectTcp(const tunnel::SocketAddr& remote) override {
        net_.tcpConnected++;
        return std::make_unique<FakeTcpStream>(net_, remote);
    }

private:
    FakeNetwork& net_;
};

} // namespace test
