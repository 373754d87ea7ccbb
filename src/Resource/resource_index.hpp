#ifndef resource_index_hpp
#define resource_index_hpp

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "resource.hpp"
#include "../Filter/ip_network_table.h"

namespace tunnel {

/**
 * 资源索引
 *
 * 资源按 id 存放在 byId_ 中；IP 前缀表与域名表只保存 id。
 * 任一视图冲突（id / 网段 / 域名）时，旧资源会先从所有视图中清除再写入新资源。
 */
class ResourceIndex {
public:
    ResourceIndex() = default;

    void insert(Resource resource);

    // 撤销资源，返回是否存在
    bool remove(const ResourceId& id);

    void clear();

    const Resource* getById(const ResourceId& id) const;

    // 最长前缀匹配，仅针对 CIDR 资源
    const Resource* getByIp(const IpAddr& ip) const;

    // 与资源配置的域名模式做精确比较（不区分大小写）
    const Resource* getByName(std::string_view domain) const;

    const InternetResource* internetResource() const;

    size_t size() const { return byId_.size(); }
    bool empty() const { return byId_.empty(); }

    // 按 id 排序，便于稳定输出
    std::vector<const Resource*> all() const;

private:
    void purge(const ResourceId& id);

private:
    std::unordered_map<ResourceId, Resource> byId_;
    IpNetworkTable<ResourceId> byIp_;
    std::unordered_map<std::string, ResourceId> byName_;
    std::optional<ResourceId> internet_;
};

} // namespace tunnel

#endif /* resource_index_hpp */
