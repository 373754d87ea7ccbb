#include "system_resolvers.hpp"
#include "../Common/logging.hpp"

#include <fstream>
#include <sstream>

namespace tunnel {

static std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

std::vector<IpAddr> parseResolvConf(std::string_view text) {
    std::vector<IpAddr> out;

    while (!text.empty()) {
        size_t eol = text.find('\n');
        std::string_view line = trim(text.substr(0, eol));
        text = eol == std::string_view::npos ? std::string_view() : text.substr(eol + 1);

        if (line.empty() || line.front() == '#' || line.front() == ';') continue;

        static constexpr std::string_view kKeyword = "nameserver";
        if (line.substr(0, kKeyword.size()) != kKeyword) continue;

        std::string_view rest = line.substr(kKeyword.size());
        if (rest.empty() || (rest.front() != ' ' && rest.front() != '\t')) continue;
        rest = trim(rest);

        size_t end = rest.find_first_of(" \t#;");
        std::string_view token = rest.substr(0, end);

        size_t zone = token.find('%');
        if (zone != std::string_view::npos) token = token.substr(0, zone);

        auto ip = IpAddr::parse(token);
        if (!ip) {
            TUN_LOG_DEBUG("resolv.conf: ignoring nameserver '%.*s'",
                          static_cast<int>(token.size()), token.data());
            continue;
        }
        out.push_back(*ip);
    }
    return out;
}

std::vector<IpAddr> readSystemResolvers(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        TUN_LOG_WARN("cannot open %s, no system resolvers", path.c_str());
        return {};
    }

    std::stringstream ss;
    ss << in.rdbuf();
    return parseResolvConf(ss.str());
}

} // namespace tunnel
