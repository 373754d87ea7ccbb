#include "nameserver_set.hpp"
#include "dns_message.hpp"
#include "../Common/logging.hpp"

#include <algorithm>
#include <random>

namespace dns {

using tunnel::IoStatus;
using tunnel::SocketAddr;

NameserverSet::NameserverSet(tunnel::SocketFactory& factory, NameserverSetOptions options)
    : factory_(factory), options_(std::move(options)) {
    std::random_device rd;
    next_id_ = static_cast<uint16_t>(rd());
}

void NameserverSet::setNameservers(std::vector<IpAddr> servers) {
    servers_ = std::move(servers);
}

void NameserverSet::evaluate(Instant now) {
    samples_.clear();
    pending_.clear();
    round_active_ = true;
    last_poll_ = now;

    TUN_LOG_DEBUG("nameserver set: evaluating %zu nameservers", servers_.size());

    for (const auto& server : servers_) {
        startSample(server, Transport::Udp, now);
        startSample(server, Transport::Tcp, now);
    }

    if (samples_.empty()) {
        poll(now);
    }
}

bool NameserverSet::startSample(const IpAddr& server, Transport transport, Instant now) {
    if (samples_.size() >= options_.maxInFlight) {
        TUN_LOG_DEBUG("nameserver set: too many samples in flight, dropping %s sample for %s",
                      transportName(transport), server.toString().c_str());
        return false;
    }

    auto sample = std::make_unique<Sample>();
    sample->server = server;
    sample->transport = transport;
    sample->startedAt = now;
    sample->id = next_id_++;

    std::vector<uint8_t> wire;
    if (!DNSBuilder::serialize(DNSBuilder::query(sample->id, options_.evaluationDomain, RecordType::A), wire)) {
        TUN_LOG_WARN("nameserver set: cannot encode sample query for '%s'", options_.evaluationDomain.c_str());
        return false;
    }

    SocketAddr remote(server, options_.port);

    if (transport == Transport::Udp) {
        sample->udp = factory_.bindUdp(server.family);
        if (!sample->udp) {
            TUN_LOG_DEBUG("nameserver set: cannot bind UDP socket for %s", server.toString().c_str());
            return false;
        }
        sample->query = std::move(wire);
    } else {
        sample->tcp = factory_.connectTcp(remote);
        if (!sample->tcp) {
            TUN_LOG_DEBUG("nameserver set: cannot connect to %s", remote.toString().c_str());
            return false;
        }
        // DNS over TCP：2 字节长度前缀
        sample->query.reserve(wire.size() + 2);
        sample->query.push_back(static_cast<uint8_t>(wire.size() >> 8));
        sample->query.push_back(static_cast<uint8_t>(wire.size() & 0xFF));
        sample->query.insert(sample->query.end(), wire.begin(), wire.end());
    }

    // 立即发出查询，RTT 从这里开始计
    SampleState state = advance(*sample);
    if (state != SampleState::Pending) {
        finishSample(*sample, state, Duration::zero());
        return state == SampleState::Succeeded;
    }

    samples_.push_back(std::move(sample));
    return true;
}

void NameserverSet::finishSample(const Sample& sample, SampleState state, Duration elapsed) {
    if (state != SampleState::Succeeded) return;

    TUN_LOG_TRACE("nameserver set: %s sample to %s took %lld ms", transportName(sample.transport),
                  sample.server.toString().c_str(),
                  static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()));
    pending_.insert_or_assign(elapsed, sample.server);
}

bool NameserverSet::poll(Instant now) {
    last_poll_ = now;

    for (auto it = samples_.begin(); it != samples_.end();) {
        Sample& sample = **it;

        SampleState state = advance(sample);
        Duration elapsed = now - sample.startedAt;

        if (state == SampleState::Pending && elapsed >= options_.evaluationTimeout) {
            TUN_LOG_DEBUG("nameserver set: %s sample to %s timed out",
                          transportName(sample.transport), sample.server.toString().c_str());
            state = SampleState::Failed;
        }

        if (state == SampleState::Pending) {
            ++it;
            continue;
        }

        finishSample(sample, state, elapsed);
        it = samples_.erase(it);
    }

    if (!samples_.empty()) {
        return false;
    }

    if (round_active_) {
        round_active_ = false;
        by_rtt_.swap(pending_);
        pending_.clear();

        if (auto best = fastest()) {
            TUN_LOG_DEBUG("nameserver set: fastest nameserver is %s", best->toString().c_str());
        } else {
            TUN_LOG_DEBUG("nameserver set: no nameserver answered");
        }
    }
    return true;
}

NameserverSet::SampleState NameserverSet::advance(Sample& sample) {
    return sample.transport == Transport::Udp ? advanceUdp(sample) : advanceTcp(sample);
}

NameserverSet::SampleState NameserverSet::advanceUdp(Sample& sample) {
    if (!sample.querySent) {
        IoStatus st = sample.udp->sendTo(SocketAddr(sample.server, options_.port), sample.query.data(), sample.query.size());
        if (st == IoStatus::WouldBlock) return SampleState::Pending;
        if (st == IoStatus::Error) {
            TUN_LOG_DEBUG("nameserver set: UDP send to %s failed", sample.server.toString().c_str());
            return SampleState::Failed;
        }
        sample.querySent = true;
    }

    while (true) {
        std::vector<uint8_t> datagram;
        SocketAddr from;
        IoStatus st = sample.udp->recvFrom(datagram, from);
        if (st == IoStatus::WouldBlock) return SampleState::Pending;
        if (st == IoStatus::Error) {
            TUN_LOG_DEBUG("nameserver set: UDP receive from %s failed", sample.server.toString().c_str());
            return SampleState::Failed;
        }

        // 不是目标服务器发来的数据报，忽略
        if (from.ip != sample.server) continue;

        return checkResponse(sample, datagram.data(), datagram.size());
    }
}

NameserverSet::SampleState NameserverSet::advanceTcp(Sample& sample) {
    IoStatus st = sample.tcp->pollConnected();
    if (st == IoStatus::WouldBlock) return SampleState::Pending;
    if (st == IoStatus::Error) {
        TUN_LOG_DEBUG("nameserver set: TCP connect to %s failed", sample.server.toString().c_str());
        return SampleState::Failed;
    }

    while (sample.written < sample.query.size()) {
        size_t n = 0;
        st = sample.tcp->send(sample.query.data() + sample.written, sample.query.size() - sample.written, n);
        if (st == IoStatus::WouldBlock) return SampleState::Pending;
        if (st == IoStatus::Error) {
            TUN_LOG_DEBUG("nameserver set: TCP send to %s failed", sample.server.toString().c_str());
            return SampleState::Failed;
        }
        sample.written += n;
    }

    while (true) {
        if (sample.rx.size() >= 2) {
            size_t msgLen = (static_cast<size_t>(sample.rx[0]) << 8) | sample.rx[1];
            if (sample.rx.size() >= msgLen + 2) {
                return checkResponse(sample, sample.rx.data() + 2, msgLen);
            }
        }

        st = sample.tcp->recv(sample.rx);
        if (st == IoStatus::WouldBlock) return SampleState::Pending;
        if (st == IoStatus::Error) {
            TUN_LOG_DEBUG("nameserver set: TCP receive from %s failed", sample.server.toString().c_str());
            return SampleState::Failed;
        }
    }
}

NameserverSet::SampleState NameserverSet::checkResponse(const Sample& sample, const uint8_t* data, size_t len) {
    DNSParser parser;
    DNSMessage msg;
    if (!parser.parse(data, len, msg)) {
        TUN_LOG_DEBUG("nameserver set: malformed %s response from %s",
                      transportName(sample.transport), sample.server.toString().c_str());
        return SampleState::Failed;
    }

    if (!msg.header.isResponse() || msg.header.id != sample.id) {
        TUN_LOG_DEBUG("nameserver set: unexpected %s message from %s",
                      transportName(sample.transport), sample.server.toString().c_str());
        return SampleState::Failed;
    }

    if (msg.rcode() != ResponseCode::NoError) {
        TUN_LOG_DEBUG("nameserver set: %s sample to %s answered with rcode %u", transportName(sample.transport),
                      sample.server.toString().c_str(), static_cast<unsigned>(msg.header.dns_rcode()));
        return SampleState::Failed;
    }

    return SampleState::Succeeded;
}

std::optional<IpAddr> NameserverSet::fastest() const {
    if (by_rtt_.empty()) return std::nullopt;
    return by_rtt_.begin()->second;
}

std::optional<Instant> NameserverSet::pollTimeout() const {
    if (samples_.empty()) {
        return std::nullopt;
    }

    // SocketFactory 不提供就绪通知，只能定时轮询
    std::optional<Instant> earliest = last_poll_ + options_.pollInterval;
    for (const auto& p : samples_) {
        Instant deadline = p->startedAt + options_.evaluationTimeout;
        if (!earliest || deadline < *earliest) earliest = deadline;
    }
    return earliest;
}

void NameserverSet::reset() {
    if (!samples_.empty()) {
        TUN_LOG_DEBUG("nameserver set: dropping %zu in-flight samples", samples_.size());
    }
    samples_.clear();
    pending_.clear();
    round_active_ = false;
}

} // namespace dns
