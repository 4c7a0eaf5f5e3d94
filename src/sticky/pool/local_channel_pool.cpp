/**
 * @file local_channel_pool.cpp
 * @brief Implementation of LocalChannelPool selection and binding table.
 */
#include "sticky/pool/local_channel_pool.hpp"

namespace sticky::pool {

const char* to_string(PoolError e) noexcept {
    switch (e) {
        case PoolError::ZeroMaxSize:          return "max_size must be at least 1";
        case PoolError::NoTransportFactory:   return "no transport factory";
        case PoolError::TransportUnavailable: return "transport factory returned no channel";
    }
    return "unknown";
}

LocalChannelPool::LocalChannelPool(PoolConfig cfg,
                                   TransportFactory factory,
                                   std::shared_ptr<const policy::PolicyRegistry> policies) noexcept
    : cfg_(std::move(cfg)), factory_(std::move(factory)), policies_(std::move(policies)) {}

sticky_detail::expected<std::shared_ptr<LocalChannelPool>, PoolError>
LocalChannelPool::create(PoolConfig cfg,
                         TransportFactory factory,
                         std::shared_ptr<const policy::PolicyRegistry> policies) {
    if (cfg.max_size == 0) return sticky_detail::unexpected(PoolError::ZeroMaxSize);
    if (!factory) return sticky_detail::unexpected(PoolError::NoTransportFactory);

    std::shared_ptr<LocalChannelPool> pool(
        new LocalChannelPool(std::move(cfg), std::move(factory), std::move(policies)));

    // Open the first slot eagerly so get_channel() always has a fallback.
    std::lock_guard<std::mutex> lk(pool->mu_);
    if (!pool->open_channel_locked()) return sticky_detail::unexpected(PoolError::TransportUnavailable);
    return pool;
}

std::optional<policy::MethodAffinityPolicy>
LocalChannelPool::affinity_policy(std::string_view method_path) const {
    if (!policies_) return std::nullopt;
    return policies_->lookup(method_path);
}

ChannelRefPtr LocalChannelPool::open_channel_locked() {
    const auto index = refs_.size();
    auto transport = factory_(cfg_.target, index);
    if (!transport) return nullptr;
    refs_.push_back(std::make_shared<ChannelRef>(std::move(transport), index));
    return refs_.back();
}

ChannelRefPtr LocalChannelPool::least_loaded_locked() const noexcept {
    ChannelRefPtr best;
    for (const auto& ref : refs_) {
        // Strict '<' keeps the oldest channel on ties.
        if (!best || ref->active_streams() < best->active_streams()) best = ref;
    }
    return best;
}

ChannelRefPtr LocalChannelPool::get_channel(std::optional<std::string_view> bound_key) {
    std::lock_guard<std::mutex> lk(mu_);

    if (bound_key && !bound_key->empty()) {
        auto it = bindings_.find(*bound_key);
        if (it != bindings_.end()) return it->second;
    }

    auto best = least_loaded_locked();
    if (best->active_streams() < cfg_.low_watermark) return best;

    // Every channel is busy: grow while allowed.
    if (refs_.size() < cfg_.max_size) {
        if (auto fresh = open_channel_locked()) return fresh;
    }
    return best;
}

void LocalChannelPool::increment_active(const ChannelRefPtr& channel) {
    if (channel) channel->active_streams_incr();
}

void LocalChannelPool::decrement_active(const ChannelRefPtr& channel) {
    if (channel) (void)channel->active_streams_decr();
}

void LocalChannelPool::bind(const ChannelRefPtr& channel, std::string_view key) {
    if (!channel || key.empty()) return;
    std::lock_guard<std::mutex> lk(mu_);

    auto it = bindings_.find(key);
    if (it == bindings_.end()) {
        bindings_.emplace(std::string(key), channel);
        channel->affinity_count_incr();
        return;
    }
    if (it->second == channel) return;

    // Last writer wins: move the key to the new channel.
    (void)it->second->affinity_count_decr();
    it->second = channel;
    channel->affinity_count_incr();
}

bool LocalChannelPool::unbind(std::string_view key) {
    if (key.empty()) return false;
    std::lock_guard<std::mutex> lk(mu_);

    auto it = bindings_.find(key);
    if (it == bindings_.end()) return false;
    (void)it->second->affinity_count_decr();
    bindings_.erase(it);
    return true;
}

std::size_t LocalChannelPool::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return refs_.size();
}

std::vector<ChannelRefPtr> LocalChannelPool::channels() const {
    std::lock_guard<std::mutex> lk(mu_);
    return refs_;
}

ChannelRefPtr LocalChannelPool::bound_channel(std::string_view key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = bindings_.find(key);
    return it == bindings_.end() ? nullptr : it->second;
}

std::size_t LocalChannelPool::binding_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return bindings_.size();
}

} // namespace sticky::pool
