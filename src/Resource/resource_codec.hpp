#ifndef resource_codec_hpp
#define resource_codec_hpp

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "resource.hpp"

namespace tunnel {

/**
 * 门户下发的资源描述 <-> Resource
 *
 * 按 "type" 分派（dns / cidr / internet）。未知 type 返回 std::nullopt，
 * 字段缺失或取值非法时抛出 ConfigError。
 */
std::optional<Resource> resourceFromJson(const nlohmann::json& j);

std::optional<IpStack> parseIpStack(std::string_view text);

} // namespace tunnel

#endif /* resource_codec_hpp */
