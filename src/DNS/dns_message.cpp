#include "dns_message.hpp"
#include "../Common/logging.hpp"

#include <algorithm>
#include <cctype>

namespace dns {

static constexpr int    kMaxNameDepth  = 16;
static constexpr size_t kMaxNameLength = 255;

uint16_t DNSParser::read16(const uint8_t* p) const {
    return (static_cast<uint16_t>(p[0]) << 8) | p[1];
}

uint32_t DNSParser::read32(const uint8_t* p) const {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) <<  8) |
           p[3];
}

NameParseResult DNSParser::parseName(
    const uint8_t* data,
    size_t length,
    size_t offset,
    int depth
) {
    if (depth > kMaxNameDepth || offset >= length) return {false,"",offset};

    std::string name;
    size_t pos = offset;
    size_t final_next = offset;
    bool jumped = false;

    while (true) {
        if (pos >= length) return {false,"",offset};
        uint8_t len = data[pos];

        // compression pointer
        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= length) return {false,"",offset};
            uint16_t ptr = ((len & 0x3F) << 8) | data[pos + 1];
            if (ptr >= length) return {false,"",offset};
            if (!jumped) { final_next = pos + 2; jumped = true; }
            auto r = parseName(data, length, ptr, depth + 1);
            if (!r.success) return r;
            if (!name.empty() && !r.name.empty()) name.push_back('.');
            name += r.name;
            // compression pointer ends the name
            break;
        }

        // root label
        if (len == 0) {
            if (!jumped) final_next = pos + 1;
            break;
        }

        if (len > 63 || pos + 1 + len > length) return {false,"",offset};
        if (name.size() + len + (name.empty() ? 0 : 1) > kMaxNameLength) return {false,"",offset};

        if (!name.empty()) name.push_back('.');
        name.append(reinterpret_cast<const char*>(data + pos + 1), len);

        pos += 1 + len;
        if (!jumped) final_next = pos;
    }

    return {true, name, final_next};
}


bool DNSParser::parseQuestion(const uint8_t* data, size_t length, size_t& offset, Question& q) {
    auto r = parseName(data,length,offset,0);
    if(!r.success) return false;
    q.name = r.name; offset = r.next_offset;
    if(offset+4>length) return false;
    q.type = read16(data+offset);
    q.qclass = read16(data+offset+2);
    offset+=4;
    return true;
}

bool DNSParser::parseRecord(const uint8_t* data, size_t length, size_t& offset, DNSRecord& rr) {
    auto r = parseName(data, length, offset, 0);
    if (!r.success) return false;
    rr.name = r.name;
    offset = r.next_offset;

    if (offset + 10 > length) return false;

    rr.type     = read16(data + offset);
    rr.klass    = read16(data + offset + 2);
    rr.ttl      = read32(data + offset + 4);
    rr.rdlength = read16(data + offset + 8);
    offset += 10;

    if (offset + rr.rdlength > length) return false;

    const uint8_t* rdata = data + offset;
    size_t rdend = offset + rr.rdlength;
    rr.raw_rdata.assign(rdata, rdata + rr.rdlength);

    size_t rdata_offset = offset;

    switch (static_cast<RecordType>(rr.type)) {
        case RecordType::CNAME:
        case RecordType::NS:
        case RecordType::PTR: {
            auto nr = parseName(data, length, rdata_offset, 0);
            if (!nr.success || nr.next_offset > rdend) return false;
            rr.domain = nr.name;
            break;
        }
        case RecordType::MX: {
            if (rr.rdlength < 2) return false;
            MXRecordData mx;
            mx.preference = read16(rdata);
            auto nr = parseName(data, length, rdata_offset + 2, 0);
            if (!nr.success || nr.next_offset > rdend) return false;
            mx.exchange = nr.name;
            rr.mx = mx;
            break;
        }
        case RecordType::SRV: {
            if (rr.rdlength < 6) return false;
            SRVRecordData srv;
            srv.priority = read16(rdata);
            srv.weight   = read16(rdata + 2);
            srv.port     = read16(rdata + 4);
            auto nr = parseName(data, length, rdata_offset + 6, 0);
            if (!nr.success || nr.next_offset > rdend) return false;
            srv.target = nr.name;
            rr.srv = srv;
            break;
        }
        case RecordType::SOA: {
            size_t pos = rdata_offset;
            auto m = parseName(data, length, pos, 0);
            if (!m.success) return false;
            pos = m.next_offset;
            auto rname = parseName(data, length, pos, 0);
            if (!rname.success) return false;
            pos = rname.next_offset;
            if (pos + 20 > rdend) return false;
            SOARecordData soa;
            soa.mname   = m.name;
            soa.rname   = rname.name;
            soa.serial  = read32(data + pos);
            soa.refresh = read32(data + pos + 4);
            soa.retry   = read32(data + pos + 8);
            soa.expire  = read32(data + pos + 12);
            soa.minimum = read32(data + pos + 16);
            rr.soa = soa;
            break;
        }
        default:
            break;
    }

    offset = rdend;
    return true;
}


bool DNSParser::parse(const uint8_t* data, size_t length, DNSMessage& out){
    if(length<12) return false;
    out.header.id = read16(data);
    out.header.flags = read16(data+2);
    out.header.qdcount = read16(data+4);
    out.header.ancount = read16(data+6);
    out.header.nscount = read16(data+8);
    out.header.arcount = read16(data+10);

    if(out.header.qdcount>100||out.header.ancount>100||out.header.nscount>100||out.header.arcount>100) {
        TUN_LOG_DEBUG("DNS header exceeds limits! id=%u, flags=0x%04x, qdcount=%u, ancount=%u, nscount=%u, arcount=%u",
                      out.header.id,
                      out.header.flags,
                      out.header.qdcount,
                      out.header.ancount,
                      out.header.nscount,
                      out.header.arcount);
        return false;
    }

    size_t offset = 12;
    for(uint16_t i=0;i<out.header.qdcount;++i){Question q; if(!parseQuestion(data,length,offset,q)) return false; out.questions.push_back(q);}
    for(uint16_t i=0;i<out.header.ancount;++i){DNSRecord rr; if(!parseRecord(data,length,offset,rr)) return false; out.answers.push_back(rr);}
    for(uint16_t i=0;i<out.header.nscount;++i){DNSRecord rr; if(!parseRecord(data,length,offset,rr)) return false; out.authorities.push_back(rr);}
    for(uint16_t i=0;i<out.header.arcount;++i){DNSRecord rr; if(!parseRecord(data,length,offset,rr)) return false; out.additionals.push_back(rr);}
    return true;
}

bool DNSParser::matchesStandardPort(uint16_t port) {
    // DNS 标准端口：TCP/UDP 53
    // TCP DNS 用于大于 512 字节的响应，需要 2 字节长度前缀
    // UDP DNS 用于常规查询，响应最大 512 字节
    return port == 53;
}

bool DNSTTLWirePatcher::skipName(const uint8_t* data, size_t len, size_t& offset){
    while(true){
        if(offset>=len) return false;
        uint8_t c = data[offset];
        if((c&0xC0)==0xC0){ if(offset+2>len) return false; offset+=2; return true; }
        if(c==0){ offset+=1; return true; }
        if(c>63||offset+1+c>len) return false;
        offset+=1+c;
    }
    return false;
}

uint32_t DNSTTLWirePatcher::read32(const uint8_t* p){
    uint32_t net;
    std::memcpy(&net,p,sizeof(net));
    return ntohl(net);
}

void DNSTTLWirePatcher::write32(uint8_t* p, uint32_t host){
    uint32_t net = htonl(host);
    std::memcpy(p,&net,sizeof(net));
}

template <typename F>
bool DNSTTLWirePatcher::forEachTTL(uint8_t* data, size_t len, const DNSMessage& msg, F&& fn){
    if(len<sizeof(DNSHeader)) return false;
    size_t offset = sizeof(DNSHeader);

    for(size_t i=0;i<msg.questions.size();++i){
        if(!skipName(data,len,offset)) return false;
        if(offset+4>len) return false;
        offset+=4;
    }

    auto patchRRSet = [&](const std::vector<DNSRecord>& recs)->bool{
        for(size_t i=0;i<recs.size();++i){
            if(!skipName(data,len,offset)) return false;
            if(offset+10>len) return false;
            uint16_t type = static_cast<uint16_t>((data[offset]<<8)|data[offset+1]);
            size_t ttl_offset = offset+4;
            if(type!=static_cast<uint16_t>(RecordType::OPT)){
                fn(data+ttl_offset);
            }
            uint16_t rdlength = static_cast<uint16_t>((data[offset+8]<<8)|data[offset+9]);
            offset+=10;
            if(offset+rdlength>len) return false;
            offset+=rdlength;
        }
        return true;
    };

    if(!patchRRSet(msg.answers)) return false;
    if(!patchRRSet(msg.authorities)) return false;
    if(!patchRRSet(msg.additionals)) return false;
    return true;
}

bool DNSTTLWirePatcher::decrementTTL(uint8_t* data, size_t len, const DNSMessage& msg, uint32_t elapsed){
    return forEachTTL(data,len,msg,[&](uint8_t* ttl){
        uint32_t original = read32(ttl);
        write32(ttl, original > elapsed ? original - elapsed : 0);
    });
}

void DNSTTLWirePatcher::writeId(uint8_t* data, size_t len, uint16_t id){
    if(len<2) return;
    data[0] = static_cast<uint8_t>(id >> 8);
    data[1] = static_cast<uint8_t>(id & 0xFF);
}

// ---------------- DNSBuilder ----------------

DNSMessage DNSBuilder::query(uint16_t id, const std::string& name, RecordType type) {
    DNSMessage msg;
    msg.header.id = id;
    msg.header.flags = kFlagRD;
    msg.header.qdcount = 1;
    msg.questions.push_back(Question{name, static_cast<uint16_t>(type), kClassIN});
    return msg;
}

DNSMessage DNSBuilder::responseFor(const DNSMessage& query, ResponseCode rcode) {
    DNSMessage msg;
    msg.header.id = query.header.id;
    msg.header.flags = static_cast<uint16_t>(kFlagQR | kFlagRA | (query.header.flags & kFlagRD) | static_cast<uint16_t>(rcode));
    msg.questions = query.questions;
    msg.header.qdcount = static_cast<uint16_t>(msg.questions.size());
    return msg;
}

DNSRecord DNSBuilder::addressRecord(const std::string& name, uint32_t ttl, const tunnel::IpAddr& ip) {
    DNSRecord rr;
    rr.name = name;
    rr.type = static_cast<uint16_t>(ip.isV4() ? RecordType::A : RecordType::AAAA);
    rr.ttl = ttl;
    uint8_t raw[16];
    size_t n = ip.toBytes(raw);
    rr.raw_rdata.assign(raw, raw + n);
    rr.rdlength = static_cast<uint16_t>(n);
    return rr;
}

DNSRecord DNSBuilder::ptrRecord(const std::string& name, uint32_t ttl, const std::string& target) {
    DNSRecord rr;
    rr.name = name;
    rr.type = static_cast<uint16_t>(RecordType::PTR);
    rr.ttl = ttl;
    rr.domain = target;
    return rr;
}

void DNSBuilder::write16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void DNSBuilder::write32(std::vector<uint8_t>& out, uint32_t v) {
    write16(out, static_cast<uint16_t>(v >> 16));
    write16(out, static_cast<uint16_t>(v & 0xFFFF));
}

bool DNSBuilder::writeName(std::vector<uint8_t>& out, const std::string& name) {
    size_t total = 0;
    size_t start = 0;
    while (start < name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) dot = name.size();
        size_t len = dot - start;
        if (len == 0 || len > 63) return false;
        total += len + 1;
        if (total > kMaxNameLength) return false;
        out.push_back(static_cast<uint8_t>(len));
        out.insert(out.end(), name.begin() + start, name.begin() + dot);
        start = dot + 1;
    }
    out.push_back(0);
    return true;
}

bool DNSBuilder::writeRecord(std::vector<uint8_t>& out, const DNSRecord& rr) {
    if (!writeName(out, rr.name)) return false;
    write16(out, rr.type);
    write16(out, rr.klass);
    write32(out, rr.ttl);

    size_t lenPos = out.size();
    write16(out, 0);
    size_t rdStart = out.size();

    switch (static_cast<RecordType>(rr.type)) {
        case RecordType::CNAME:
        case RecordType::NS:
        case RecordType::PTR:
            if (rr.domain) {
                if (!writeName(out, *rr.domain)) return false;
                break;
            }
            out.insert(out.end(), rr.raw_rdata.begin(), rr.raw_rdata.end());
            break;
        case RecordType::MX:
            if (rr.mx) {
                write16(out, rr.mx->preference);
                if (!writeName(out, rr.mx->exchange)) return false;
                break;
            }
            out.insert(out.end(), rr.raw_rdata.begin(), rr.raw_rdata.end());
            break;
        case RecordType::SRV:
            if (rr.srv) {
                write16(out, rr.srv->priority);
                write16(out, rr.srv->weight);
                write16(out, rr.srv->port);
                if (!writeName(out, rr.srv->target)) return false;
                break;
            }
            out.insert(out.end(), rr.raw_rdata.begin(), rr.raw_rdata.end());
            break;
        case RecordType::SOA:
            if (rr.soa) {
                if (!writeName(out, rr.soa->mname)) return false;
                if (!writeName(out, rr.soa->rname)) return false;
                write32(out, rr.soa->serial);
                write32(out, rr.soa->refresh);
                write32(out, rr.soa->retry);
                write32(out, rr.soa->expire);
                write32(out, rr.soa->minimum);
                break;
            }
            out.insert(out.end(), rr.raw_rdata.begin(), rr.raw_rdata.end());
            break;
        default:
            out.insert(out.end(), rr.raw_rdata.begin(), rr.raw_rdata.end());
            break;
    }

    size_t rdlen = out.size() - rdStart;
    if (rdlen > 0xFFFF) return false;
    out[lenPos] = static_cast<uint8_t>(rdlen >> 8);
    out[lenPos + 1] = static_cast<uint8_t>(rdlen & 0xFF);
    return true;
}

bool DNSBuilder::serialize(const DNSMessage& msg, std::vector<uint8_t>& out) {
    out.clear();
    write16(out, msg.header.id);
    write16(out, msg.header.flags);
    write16(out, static_cast<uint16_t>(msg.questions.size()));
    write16(out, static_cast<uint16_t>(msg.answers.size()));
    write16(out, static_cast<uint16_t>(msg.authorities.size()));
    write16(out, static_cast<uint16_t>(msg.additionals.size()));

    for (const auto& q : msg.questions) {
        if (!writeName(out, q.name)) return false;
        write16(out, q.type);
        write16(out, q.qclass);
    }
    for (const auto& rr : msg.answers)     { if (!writeRecord(out, rr)) return false; }
    for (const auto& rr : msg.authorities) { if (!writeRecord(out, rr)) return false; }
    for (const auto& rr : msg.additionals) { if (!writeRecord(out, rr)) return false; }
    return true;
}

// ---------------- reverse DNS ----------------

std::optional<tunnel::IpAddr> reverseDnsAddr(const std::string& name) {
    std::string lower(name);
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    while (!lower.empty() && lower.back() == '.') lower.pop_back();

    static const std::string kV4Suffix = ".in-addr.arpa";
    static const std::string kV6Suffix = ".ip6.arpa";

    auto endsWith = [&](const std::string& suffix) {
        return lower.size() > suffix.size() &&
               lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    std::vector<std::string> parts;
    bool v4 = endsWith(kV4Suffix);
    bool v6 = !v4 && endsWith(kV6Suffix);
    if (!v4 && !v6) return std::nullopt;

    std::string body = lower.substr(0, lower.size() - (v4 ? kV4Suffix.size() : kV6Suffix.size()));
    size_t start = 0;
    while (true) {
        size_t dot = body.find('.', start);
        parts.push_back(body.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    std::reverse(parts.begin(), parts.end());

    if (v4) {
        if (parts.size() != 4) return std::nullopt;
        std::string text = parts[0] + "." + parts[1] + "." + parts[2] + "." + parts[3];
        auto ip = tunnel::IpAddr::parse(text);
        if (!ip || !ip->isV4()) return std::nullopt;
        return ip;
    }

    if (parts.size() != 32) return std::nullopt;
    std::string text;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].size() != 1 || !std::isxdigit(static_cast<unsigned char>(parts[i][0]))) return std::nullopt;
        if (i > 0 && i % 4 == 0) text.push_back(':');
        text += parts[i];
    }
    auto ip = tunnel::IpAddr::parse(text);
    if (!ip || !ip->isV6()) return std::nullopt;
    return ip;
}

} // namespace dns
