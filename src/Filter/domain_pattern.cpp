#include "domain_pattern.h"
#include <cctype>

namespace tunnel {

static constexpr size_t kMaxDomainLength = 253;
static constexpr size_t kMaxLabelLength  = 63;

std::optional<DomainPattern> DomainPattern::parse(std::string_view pattern)
{
    std::string normalized = normalize(pattern);

    if (!validateRulePattern(normalized))
        return std::nullopt;

    DomainPattern p;
    p.pattern_ = std::move(normalized);
    for (auto label : splitLabels(p.pattern_))
        p.labels_.emplace_back(label);

    return p;
}

bool DomainPattern::isWildcard() const
{
    return pattern_.find_first_of("*?") != std::string::npos;
}

bool DomainPattern::matches(std::string_view domain) const
{
    std::string normalized = normalize(domain);
    if (normalized.empty() || normalized.size() > kMaxDomainLength)
        return false;

    auto labels = splitLabels(normalized);
    if (labels.empty())
        return false;

    // "*.example.com" 也匹配 "example.com"
    if (labels_.size() > 1 && labels_[0] == "*")
    {
        std::string_view rest(pattern_);
        rest.remove_prefix(2);
        if (rest == normalized)
            return true;
    }

    return matchLabels(0, labels, 0);
}

bool DomainPattern::matchLabels(size_t pi, const std::vector<std::string_view>& domain, size_t di) const
{
    if (pi == labels_.size())
        return di == domain.size();

    if (labels_[pi] == "**")
    {
        for (size_t k = di; k <= domain.size(); ++k)
        {
            if (matchLabels(pi + 1, domain, k))
                return true;
        }
        return false;
    }

    if (di == domain.size())
        return false;

    return matchLabel(labels_[pi], domain[di]) && matchLabels(pi + 1, domain, di + 1);
}

bool DomainPattern::matchLabel(std::string_view pattern, std::string_view label)
{
    size_t p = 0, l = 0;
    size_t star = std::string_view::npos;
    size_t mark = 0;

    while (l < label.size())
    {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == label[l]))
        {
            ++p;
            ++l;
        }
        else if (p < pattern.size() && pattern[p] == '*')
        {
            star = p++;
            mark = l;
        }
        else if (star != std::string_view::npos)
        {
            p = star + 1;
            l = ++mark;
        }
        else
        {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*')
        ++p;

    return p == pattern.size();
}

bool DomainPattern::operator<(const DomainPattern& other) const
{
    auto isWild = [](char c) { return c == '*' || c == '?'; };

    auto a = pattern_.rbegin();
    auto b = other.pattern_.rbegin();

    while (true)
    {
        bool hasA = a != pattern_.rend();
        bool hasB = b != other.pattern_.rend();

        if (!hasA && !hasB)
            return false;

        if (hasA && hasB && *a == *b)
        {
            ++a;
            ++b;
            continue;
        }

        if (hasA && hasB && *a == '*' && *b == '?')
            return false;
        if (hasA && hasB && *a == '?' && *b == '*')
            return true;

        // 只差通配前缀时较短者优先
        if (hasA && isWild(*a) && (!hasB || *b == '.'))
            return false;
        if ((!hasA || *a == '.') && hasB && isWild(*b))
            return true;

        if (hasA && hasB && isWild(*a))
            return false;
        if (hasA && hasB && isWild(*b))
            return true;

        if (hasA && hasB)
            return *a > *b;

        return !hasA;
    }
}

std::string DomainPattern::normalize(std::string_view domain)
{
    std::string s(domain);
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    while (!s.empty() && s.back() == '.')
        s.pop_back();

    return s;
}

bool DomainPattern::validateRulePattern(std::string_view s)
{
    if (s.empty() || s.size() > kMaxDomainLength)
        return false;

    if (s.front() == '.' || s.back() == '.')
        return false;

    if (s.find("..") != std::string_view::npos)
        return false;

    for (auto label : splitLabels(s))
    {
        if (label.size() > kMaxLabelLength)
            return false;

        // "**" 只能独占一个 label
        if (label != "**" && label.find("**") != std::string_view::npos)
            return false;

        for (char c : label)
        {
            unsigned char u = static_cast<unsigned char>(c);
            if (!std::isalnum(u) && c != '-' && c != '_' && c != '*' && c != '?')
                return false;
        }
    }

    return true;
}

std::vector<std::string_view> DomainPattern::splitLabels(std::string_view domain)
{
    std::vector<std::string_view> labels;
    size_t start = 0;

    while (start <= domain.size())
    {
        size_t dot = domain.find('.', start);
        if (dot == std::string_view::npos)
        {
            labels.push_back(domain.substr(start));
            break;
        }
        labels.push_back(domain.substr(start, dot - start));
        start = dot + 1;
    }

    return labels;
}

} // namespace tunnel
