#pragma once

#include <chrono>
#include <cstdint>

namespace tunnel {

// 所有状态机都由调用方传入时间，内部不读取时钟
using Clock    = std::chrono::steady_clock;
using Instant  = Clock::time_point;
using Duration = Clock::duration;

inline uint32_t wholeSeconds(Duration d)
{
    auto s = std::chrono::duration_cast<std::chrono::seconds>(d).count();
    return s <= 0 ? 0u : static_cast<uint32_t>(s);
}

} // namespace tunnel
