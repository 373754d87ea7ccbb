#pragma once

#include "../Common/ip_addr.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace tunnel
{

    /**
     * @brief 按网段存值的二叉前缀树（每个网段至多一个值）
     *
     * 支持：
     * - 精确网段查找 / 替换 / 删除
     * - 最长前缀匹配（LPM）
     *
     * IPv4 与 IPv6 各用一棵树，按 IpAddr::bit() 自高位向低位走。
     */
    template <typename T>
    class IpNetworkTable
    {
    public:
        IpNetworkTable() : rootV4(std::make_unique<Node>()), rootV6(std::make_unique<Node>()) {}

        IpNetworkTable(IpNetworkTable &&) noexcept = default;
        IpNetworkTable &operator=(IpNetworkTable &&) noexcept = default;

        // 写入网段；已存在则替换并返回旧值
        std::optional<T> insert(const IpNetwork &net, T value)
        {
            if (net.prefix > net.address.bitWidth())
            {
                throw std::invalid_argument("Invalid prefix length");
            }

            Node *node = rootFor(net.family());
            for (int i = 0; i < net.prefix; ++i)
            {
                int bit = net.address.bit(i);
                if (!node->children[bit])
                {
                    node->children[bit] = std::make_unique<Node>();
                }
                node = node->children[bit].get();
            }

            std::optional<T> old = std::move(node->entry);
            node->entry.emplace(std::move(value));
            if (!old)
            {
                ++count;
            }
            return old;
        }

        std::optional<T> remove(const IpNetwork &net)
        {
            Node *node = find(net);
            if (!node || !node->entry)
            {
                return std::nullopt;
            }

            std::optional<T> old = std::move(node->entry);
            node->entry.reset();
            --count;
            return old;
        }

        const T *exactMatch(const IpNetwork &net) const
        {
            const Node *node = find(net);
            if (!node || !node->entry)
            {
                return nullptr;
            }
            return &*node->entry;
        }

        // 最长前缀匹配，返回命中的网段前缀长度与值
        std::optional<std::pair<uint8_t, const T *>> longestMatch(const IpAddr &ip) const
        {
            const Node *node = rootFor(ip.family);
            const Node *lastMatch = node->entry ? node : nullptr;
            int lastDepth = 0;

            for (int i = 0; i < ip.bitWidth() && node; ++i)
            {
                node = node->children[ip.bit(i)].get();
                if (node && node->entry)
                {
                    lastMatch = node;
                    lastDepth = i + 1;
                }
            }

            if (!lastMatch)
            {
                return std::nullopt;
            }
            return std::make_pair(static_cast<uint8_t>(lastDepth), &*lastMatch->entry);
        }

        size_t size() const noexcept { return count; }
        bool empty() const noexcept { return count == 0; }

        void clear()
        {
            rootV4 = std::make_unique<Node>();
            rootV6 = std::make_unique<Node>();
            count = 0;
        }

    private:
        struct Node
        {
            std::optional<T> entry;
            std::unique_ptr<Node> children[2];

            Node() : children{nullptr, nullptr} {}
        };

        Node *rootFor(IpFamily family) const
        {
            return family == IpFamily::V4 ? rootV4.get() : rootV6.get();
        }

        Node *find(const IpNetwork &net) const
        {
            Node *node = rootFor(net.family());
            for (int i = 0; i < net.prefix && node; ++i)
            {
                node = node->children[net.address.bit(i)].get();
            }
            return node;
        }

    private:
        std::unique_ptr<Node> rootV4;
        std::unique_ptr<Node> rootV6;
        size_t count = 0;
    };

} // namespace tunnel
