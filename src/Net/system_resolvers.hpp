#ifndef system_resolvers_hpp
#define system_resolvers_hpp

#include <string>
#include <string_view>
#include <vector>

#include "../Common/ip_addr.hpp"

namespace tunnel {

// 解析 resolv.conf 文本中的 nameserver 行；"fe80::1%eth0" 的 zone 部分会被去掉
std::vector<IpAddr> parseResolvConf(std::string_view text);

// 读取文件失败时返回空列表并打印警告
std::vector<IpAddr> readSystemResolvers(const std::string& path);

} // namespace tunnel

#endif // system_resolvers_hpp
