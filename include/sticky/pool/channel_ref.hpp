#pragma once
/**
 * @file channel_ref.hpp
 * @brief Pool entry: a transport channel plus its load and affinity counters.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "sticky/pool/transport.hpp"

namespace sticky::pool {

/**
 * @class ChannelRef
 * @brief Handle the pool hands out for the duration of a call.
 *
 * Counters are atomics so increments/decrements from concurrent calls need
 * no external locking. The pool decides when they are mutated.
 */
class ChannelRef final {
public:
    ChannelRef(TransportChannelPtr channel, std::size_t id) noexcept
        : channel_(std::move(channel)), id_(id) {}

    ChannelRef(const ChannelRef&)            = delete;
    ChannelRef& operator=(const ChannelRef&) = delete;

    /// Underlying transport used to redirect the call.
    const TransportChannelPtr& channel() const noexcept { return channel_; }

    /// Pool-local index, stable for the channel's lifetime.
    std::size_t id() const noexcept { return id_; }

    /// In-flight calls currently reserved on this channel.
    uint32_t active_streams() const noexcept { return active_streams_.load(std::memory_order_acquire); }

    /// Number of affinity keys bound to this channel.
    uint32_t affinity_count() const noexcept { return affinity_count_.load(std::memory_order_acquire); }

    void active_streams_incr() noexcept { active_streams_.fetch_add(1, std::memory_order_acq_rel); }
    /// Saturates at zero; returns false if there was nothing to release.
    bool active_streams_decr() noexcept { return saturating_decr(active_streams_); }

    void affinity_count_incr() noexcept { affinity_count_.fetch_add(1, std::memory_order_acq_rel); }
    bool affinity_count_decr() noexcept { return saturating_decr(affinity_count_); }

private:
    static bool saturating_decr(std::atomic<uint32_t>& c) noexcept {
        auto cur = c.load(std::memory_order_relaxed);
        while (cur != 0) {
            if (c.compare_exchange_weak(cur, cur - 1, std::memory_order_acq_rel, std::memory_order_relaxed)) {
                return true;
            }
        }
        return false;
    }

    TransportChannelPtr   channel_;
    const std::size_t     id_;
    std::atomic<uint32_t> active_streams_{0};
    std::atomic<uint32_t> affinity_count_{0};
};

using ChannelRefPtr = std::shared_ptr<ChannelRef>;

} // namespace sticky::pool
