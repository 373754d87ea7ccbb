#ifndef dns_message_hpp
#define dns_message_hpp

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <arpa/inet.h>
#include <cstring>

#include "../Common/ip_addr.hpp"

namespace dns {

enum class RecordType : uint16_t {
    A     = 1,
    NS    = 2,
    CNAME = 5,
    SOA   = 6,
    PTR   = 12,
    MX    = 15,
    TXT   = 16,
    AAAA  = 28,
    SRV   = 33,
    OPT   = 41,
    HTTPS = 65,
};

enum class ResponseCode : uint8_t {
    NoError  = 0,
    FormErr  = 1,
    ServFail = 2,
    NxDomain = 3,
    NotImp   = 4,
    Refused  = 5,
};

static constexpr uint16_t kClassIN = 1;

// header flags
static constexpr uint16_t kFlagQR = 0x8000;
static constexpr uint16_t kFlagAA = 0x0400;
static constexpr uint16_t kFlagTC = 0x0200;
static constexpr uint16_t kFlagRD = 0x0100;
static constexpr uint16_t kFlagRA = 0x0080;

struct DNSHeader {
    uint16_t id = 0;
    uint16_t flags = 0;
    uint16_t qdcount = 0;
    uint16_t ancount = 0;
    uint16_t nscount = 0;
    uint16_t arcount = 0;

    inline uint8_t dns_rcode() const {
        return flags & 0x0F; // 直接取低4位
    }

    bool isResponse() const { return (flags & kFlagQR) != 0; }
    bool isTruncated() const { return (flags & kFlagTC) != 0; }
};

struct Question {
    std::string name;
    uint16_t type = 0;
    uint16_t qclass = kClassIN;
};

struct MXRecordData {
    uint16_t preference;
    std::string exchange;
};

struct SRVRecordData {
    uint16_t priority;
    uint16_t weight;
    uint16_t port;
    std::string target;
};

struct SOARecordData {
    std::string mname;
    std::string rname;
    uint32_t serial;
    uint32_t refresh;
    uint32_t retry;
    uint32_t expire;
    uint32_t minimum;
};

struct DNSRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t klass = kClassIN;
    uint32_t ttl = 0;
    uint16_t rdlength = 0;
    std::vector<uint8_t> raw_rdata;

    std::optional<std::string> domain;
    std::optional<MXRecordData> mx;
    std::optional<SRVRecordData> srv;
    std::optional<SOARecordData> soa;

    bool isOPT() const { return type == static_cast<uint16_t>(RecordType::OPT); }

    // A / AAAA 记录中的地址
    std::optional<tunnel::IpAddr> address() const {
        if (type == static_cast<uint16_t>(RecordType::A) && raw_rdata.size() == 4)
            return tunnel::IpAddr::fromV4Bytes(raw_rdata.data());
        if (type == static_cast<uint16_t>(RecordType::AAAA) && raw_rdata.size() == 16)
            return tunnel::IpAddr::fromV6Bytes(raw_rdata.data());
        return std::nullopt;
    }

    // ---- IPv4 ----
    inline std::optional<std::string> ipv4() const {
        if (type != static_cast<uint16_t>(RecordType::A)) return std::nullopt;
        if (raw_rdata.size() != 4) return std::nullopt;
        char buf[INET_ADDRSTRLEN] = {};
        if (!inet_ntop(AF_INET, raw_rdata.data(), buf, sizeof(buf))) return std::nullopt;
        return std::string(buf);
    }

    // ---- IPv6 ----
    inline std::optional<std::string> ipv6() const {
        if (type != static_cast<uint16_t>(RecordType::AAAA)) return std::nullopt;
        if (raw_rdata.size() != 16) return std::nullopt;
        char buf[INET6_ADDRSTRLEN] = {};
        if (!inet_ntop(AF_INET6, raw_rdata.data(), buf, sizeof(buf))) return std::nullopt;
        return std::string(buf);
    }
};

struct DNSMessage {
    DNSHeader header;
    std::vector<Question> questions;
    std::vector<DNSRecord> answers;
    std::vector<DNSRecord> authorities;
    std::vector<DNSRecord> additionals;

    // 第一个问题的域名 / 类型（无问题时为空 / 0）
    std::string domain() const { return questions.empty() ? std::string() : questions[0].name; }
    uint16_t qtype() const { return questions.empty() ? 0 : questions[0].type; }

    ResponseCode rcode() const { return static_cast<ResponseCode>(header.dns_rcode()); }

    size_t recordCount() const { return answers.size() + authorities.size() + additionals.size(); }
};

struct NameParseResult {
    bool success;
    std::string name;
    size_t next_offset;
};

class DNSParser {
public:
    bool parse(const uint8_t* data, size_t length, DNSMessage& out);

    static bool matchesStandardPort(uint16_t port);

private:
    NameParseResult parseName(const uint8_t* data, size_t length, size_t offset, int depth);
    bool parseQuestion(const uint8_t* data, size_t length, size_t& offset, Question& q);
    bool parseRecord(const uint8_t* data, size_t length, size_t& offset, DNSRecord& rr);

    uint16_t read16(const uint8_t* p) const;
    uint32_t read32(const uint8_t* p) const;
};

/**
 * 构造 / 序列化 DNS 报文
 *
 * 名字不做压缩；含域名的 rdata（CNAME/NS/PTR/MX/SRV/SOA）按解析出的字段重新编码，
 * 其余类型原样写出 raw_rdata。
 */
class DNSBuilder {
public:
    // RD=1 的标准查询
    static DNSMessage query(uint16_t id, const std::string& name, RecordType type);

    // 复制 id / 问题 / RD，置 QR、RA
    static DNSMessage responseFor(const DNSMessage& query, ResponseCode rcode);

    static DNSRecord addressRecord(const std::string& name, uint32_t ttl, const tunnel::IpAddr& ip);
    static DNSRecord ptrRecord(const std::string& name, uint32_t ttl, const std::string& target);

    // 名字非法（label 超长等）时返回 false
    static bool serialize(const DNSMessage& msg, std::vector<uint8_t>& out);

private:
    static bool writeName(std::vector<uint8_t>& out, const std::string& name);
    static bool writeRecord(std::vector<uint8_t>& out, const DNSRecord& rr);
    static void write16(std::vector<uint8_t>& out, uint16_t v);
    static void write32(std::vector<uint8_t>& out, uint32_t v);
};

class DNSTTLWirePatcher {
public:
    // 每条非 OPT 记录的 TTL 减去 elapsed（不低于 0）
    static bool decrementTTL(uint8_t* data, size_t len, const DNSMessage& msg, uint32_t elapsed);

    static void writeId(uint8_t* data, size_t len, uint16_t id);

private:
    static bool skipName(const uint8_t* data, size_t len, size_t& offset);
    static uint32_t read32(const uint8_t* p);
    static void write32(uint8_t* p, uint32_t host);

    template <typename F>
    static bool forEachTTL(uint8_t* data, size_t len, const DNSMessage& msg, F&& fn);
};

// "a.b.c" 形式的名字 -> 反向解析地址（in-addr.arpa / ip6.arpa）
std::optional<tunnel::IpAddr> reverseDnsAddr(const std::string& name);

} // namespace dns

#endif // dns_message_hpp
