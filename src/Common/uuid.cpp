#include "uuid.hpp"

namespace tunnel {

static inline int hexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Uuid> Uuid::parse(std::string_view text)
{
    // 8-4-4-4-12
    if (text.size() != 36) return std::nullopt;

    Uuid id;
    int nibbles = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') return std::nullopt;
            continue;
        }
        int v = hexValue(text[i]);
        if (v < 0) return std::nullopt;

        if (nibbles < 16) {
            id.hi = (id.hi << 4) | static_cast<uint64_t>(v);
        } else {
            id.lo = (id.lo << 4) | static_cast<uint64_t>(v);
        }
        ++nibbles;
    }
    return id;
}

std::string Uuid::toString() const
{
    static const char* kHex = "0123456789abcdef";

    std::string out;
    out.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) out.push_back('-');
        uint64_t word = i < 16 ? hi : lo;
        int shift = 60 - 4 * (i % 16);
        out.push_back(kHex[(word >> shift) & 0xF]);
    }
    return out;
}

} // namespace tunnel
