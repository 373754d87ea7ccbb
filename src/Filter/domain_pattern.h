#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tunnel {

/* =========================
 * DomainPattern
 *
 * 按 label 匹配的域名通配模式：
 *   *    匹配单个 label 内任意字符
 *   ?    匹配单个字符（不跨 label）
 *   **   匹配零个或多个 label
 *   *.x  同时匹配 x 本身
 * 匹配不区分大小写。
 * ========================= */
class DomainPattern
{
public:
    static std::optional<DomainPattern> parse(std::string_view pattern);

    bool matches(std::string_view domain) const;

    const std::string& str() const { return pattern_; }

    bool isWildcard() const;

    /*
     * 优先级顺序（小者优先）：
     *   从右向左逐字符比较；非通配先于通配，? 先于 *，
     *   只差通配前缀的较短者在前，其余按字符逆序排列。
     */
    bool operator<(const DomainPattern& other) const;
    bool operator==(const DomainPattern& other) const { return pattern_ == other.pattern_; }
    bool operator!=(const DomainPattern& other) const { return pattern_ != other.pattern_; }

    // 小写化并去掉末尾的 '.'
    static std::string normalize(std::string_view domain);

private:
    DomainPattern() = default;

    bool matchLabels(size_t pi, const std::vector<std::string_view>& domain, size_t di) const;

    static bool matchLabel(std::string_view pattern, std::string_view label);
    static bool validateRulePattern(std::string_view pattern);
    static std::vector<std::string_view> splitLabels(std::string_view domain);

private:
    std::string pattern_;
    std::vector<std::string> labels_;
};

} // namespace tunnel
