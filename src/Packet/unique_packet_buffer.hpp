#pragma once

#include <cstddef>
#include <deque>
#include <vector>

#include "ip_packet.hpp"
#include "../Common/logging.hpp"

namespace tunnel
{

    /**
     * 有界的报文缓冲区
     *
     * 与已缓冲报文逐字节相同的报文直接丢弃（应用层重传）；
     * 满了以后丢弃最早的报文。
     */
    class UniquePacketBuffer
    {
    public:
        UniquePacketBuffer(size_t capacity, const char *tag)
            : capacity_(capacity), tag_(tag)
        {
        }

        void push(IpPacket packet)
        {
            for (const auto &p : packets_)
            {
                if (p == packet)
                {
                    TUN_LOG_TRACE("%s: dropping duplicate packet", tag_);
                    return;
                }
            }

            if (capacity_ == 0)
            {
                return;
            }

            if (packets_.size() >= capacity_)
            {
                TUN_LOG_DEBUG("%s: buffer full (%zu), evicting oldest packet", tag_, capacity_);
                packets_.pop_front();
            }
            packets_.push_back(std::move(packet));
        }

        void extend(std::vector<IpPacket> packets)
        {
            for (auto &p : packets)
            {
                push(std::move(p));
            }
        }

        std::vector<IpPacket> drain()
        {
            std::vector<IpPacket> out;
            out.reserve(packets_.size());
            for (auto &p : packets_)
            {
                out.push_back(std::move(p));
            }
            packets_.clear();
            return out;
        }

        size_t size() const { return packets_.size(); }
        bool empty() const { return packets_.empty(); }
        size_t capacity() const { return capacity_; }

    private:
        std::deque<IpPacket> packets_;
        size_t capacity_;
        const char *tag_;
    };

} // namespace tunnel
