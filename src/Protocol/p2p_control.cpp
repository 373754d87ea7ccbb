#include "p2p_control.hpp"
#include "../Common/logging.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace p2p {

InvalidProxyIpCount::InvalidProxyIpCount(size_t count)
    : std::invalid_argument("expected 4 or 8 proxy IPs, got " + std::to_string(count)), count_(count) {}

AssignedIps::AssignedIps(const ResourceId& resource, std::string domain, std::vector<IpAddr> proxyIps)
    : resource_(resource), domain_(std::move(domain)), proxy_ips_(std::move(proxyIps)) {
    if (proxy_ips_.size() != 4 && proxy_ips_.size() != 8) {
        throw InvalidProxyIpCount(proxy_ips_.size());
    }
}

const char* natStatusName(NatStatus status) {
    return status == NatStatus::Active ? "active" : "inactive";
}

static std::vector<uint8_t> encode(EventType type, const std::string& body) {
    std::vector<uint8_t> out(kHeaderLen, 0);
    out[0] = static_cast<uint8_t>(type);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

static std::vector<uint8_t> encodeJson(EventType type, const json& body) {
    std::string text;
    try {
        text = body.dump();
    } catch (const json::type_error& e) {
        throw EncodeError(std::string("cannot encode control message: ") + e.what());
    }
    return encode(type, text);
}

std::vector<uint8_t> encodeAssignedIps(const AssignedIps& msg) {
    json ips = json::array();
    for (const auto& ip : msg.proxyIps()) {
        ips.push_back(ip.toString());
    }

    json j = {
        {"resource", msg.resource().toString()},
        {"domain", msg.domain()},
        {"proxy_ips", std::move(ips)},
    };
    return encodeJson(EventType::AssignedIps, j);
}

std::vector<uint8_t> encodeDomainStatus(const DomainStatus& msg) {
    json j = {
        {"resource", msg.resource.toString()},
        {"domain", msg.domain},
        {"status", natStatusName(msg.status)},
    };
    return encodeJson(EventType::DomainStatus, j);
}

std::vector<uint8_t> encodeGoodbye() {
    return encode(EventType::Goodbye, std::string());
}

EventType peekEventType(const uint8_t* data, size_t len) {
    if (len < kHeaderLen) {
        throw DecodeError("control message shorter than its header (" + std::to_string(len) + " bytes)");
    }

    switch (data[0]) {
        case static_cast<uint8_t>(EventType::AssignedIps):
        case static_cast<uint8_t>(EventType::DomainStatus):
        case static_cast<uint8_t>(EventType::Goodbye):
            return static_cast<EventType>(data[0]);
        default:
            throw DecodeError("unknown control event type " + std::to_string(data[0]));
    }
}

static json decodeBody(EventType expected, const uint8_t* data, size_t len) {
    EventType type = peekEventType(data, len);
    if (type != expected) {
        throw DecodeError("unexpected control event type " + std::to_string(static_cast<unsigned>(type)));
    }

    json j = json::parse(data + kHeaderLen, data + len, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw DecodeError("control message payload is not a JSON object");
    }
    return j;
}

static std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw DecodeError(std::string("missing or invalid field '") + key + "'");
    }
    return it->get<std::string>();
}

static ResourceId resourceField(const json& j) {
    auto id = tunnel::Uuid::parse(stringField(j, "resource"));
    if (!id) {
        throw DecodeError("invalid resource id");
    }
    return *id;
}

AssignedIps decodeAssignedIps(const uint8_t* data, size_t len) {
    json j = decodeBody(EventType::AssignedIps, data, len);

    auto it = j.find("proxy_ips");
    if (it == j.end() || !it->is_array()) {
        throw DecodeError("missing or invalid field 'proxy_ips'");
    }

    std::vector<IpAddr> ips;
    for (const auto& v : *it) {
        if (!v.is_string()) throw DecodeError("proxy IP is not a string");
        auto ip = IpAddr::parse(v.get<std::string>());
        if (!ip) throw DecodeError("invalid proxy IP '" + v.get<std::string>() + "'");
        ips.push_back(*ip);
    }

    try {
        return AssignedIps(resourceField(j), stringField(j, "domain"), std::move(ips));
    } catch (const InvalidProxyIpCount& e) {
        throw DecodeError(e.what());
    }
}

DomainStatus decodeDomainStatus(const uint8_t* data, size_t len) {
    json j = decodeBody(EventType::DomainStatus, data, len);

    DomainStatus msg;
    msg.resource = resourceField(j);
    msg.domain = stringField(j, "domain");

    // 未知状态一律按 inactive 处理
    auto it = j.find("status");
    if (it != j.end() && it->is_string() && it->get<std::string>() == "active") {
        msg.status = NatStatus::Active;
    } else {
        msg.status = NatStatus::Inactive;
    }
    return msg;
}

void decodeGoodbye(const uint8_t* data, size_t len) {
    EventType type = peekEventType(data, len);
    if (type != EventType::Goodbye) {
        throw DecodeError("unexpected control event type " + std::to_string(static_cast<unsigned>(type)));
    }
}

IpAddr controlAddress() {
    return IpAddr::fromV6(0xfd0020211111ffffULL, 0x000000000000fffeULL);
}

std::optional<tunnel::IpPacket> makeControlPacket(const std::vector<uint8_t>& message) {
    auto packet = tunnel::IpPacket::make(controlAddress(), controlAddress(), tunnel::ipproto::kExperimental, message);
    if (!packet) {
        TUN_LOG_WARN("p2p control: cannot frame %zu byte control message", message.size());
    }
    return packet;
}

bool isControlPacket(const tunnel::IpPacket& packet) {
    return packet.isV6() && packet.protocol() == tunnel::ipproto::kExperimental &&
           packet.source() == controlAddress() && packet.destination() == controlAddress();
}

} // namespace p2p
