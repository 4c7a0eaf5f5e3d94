#pragma once
/**
 * @file local_channel_pool.hpp
 * @brief In-process ChannelPool: bound-key routing, least-loaded reuse, lazy growth.
 * @details Defaults are named in constants.hpp to avoid magic numbers.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "sticky/compat/expected.hpp"
#include "sticky/config/constants.hpp"
#include "sticky/policy/policy_registry.hpp"
#include "sticky/pool/channel_pool.hpp"

namespace sticky::pool {

/**
 * @struct PoolConfig
 * @brief Sizing for one logical server.
 */
struct PoolConfig {
    std::string target;                                                    ///< Server address
    uint32_t    max_size{sticky::config::constants::POOL_MAX_SIZE_DEFAULT}; ///< Channel ceiling
    uint32_t    low_watermark{sticky::config::constants::POOL_LOW_WATERMARK_DEFAULT}; ///< Reuse below this load
};

/// Setup-time failures of LocalChannelPool::create().
enum class PoolError : uint8_t {
    ZeroMaxSize = 1,       ///< max_size must be >= 1
    NoTransportFactory,    ///< Factory callback is empty
    TransportUnavailable   ///< Factory returned no channel for the first slot
};

const char* to_string(PoolError e) noexcept;

/**
 * @class LocalChannelPool
 * @brief Reference ChannelPool implementation.
 *
 * Selection for an unbound call:
 *  1. least-loaded channel if its active streams are below low_watermark;
 *  2. otherwise open a new channel while size() < max_size;
 *  3. otherwise the least-loaded channel.
 *
 * Thread-safety: channel selection and binding-table edits are serialized by
 * one mutex; per-channel counters are atomics.
 */
class LocalChannelPool final : public ChannelPool {
public:
    /**
     * @brief Validate @p cfg and open the first channel.
     * @param policies Method policies consulted by affinity_policy(); may be null.
     */
    static sticky_detail::expected<std::shared_ptr<LocalChannelPool>, PoolError>
    create(PoolConfig cfg,
           TransportFactory factory,
           std::shared_ptr<const policy::PolicyRegistry> policies);

    LocalChannelPool(const LocalChannelPool&)            = delete;
    LocalChannelPool& operator=(const LocalChannelPool&) = delete;

    // ChannelPool
    std::optional<policy::MethodAffinityPolicy>
    affinity_policy(std::string_view method_path) const override;
    ChannelRefPtr get_channel(std::optional<std::string_view> bound_key) override;
    void increment_active(const ChannelRefPtr& channel) override;
    void decrement_active(const ChannelRefPtr& channel) override;
    void bind(const ChannelRefPtr& channel, std::string_view key) override;
    bool unbind(std::string_view key) override;

    // Inspection
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<ChannelRefPtr> channels() const;
    [[nodiscard]] ChannelRefPtr bound_channel(std::string_view key) const;
    [[nodiscard]] std::size_t binding_count() const;
    const PoolConfig& config() const noexcept { return cfg_; }

private:
    LocalChannelPool(PoolConfig cfg,
                     TransportFactory factory,
                     std::shared_ptr<const policy::PolicyRegistry> policies) noexcept;

    /// Open one more channel; nullptr if the factory declined.
    ChannelRefPtr open_channel_locked();
    ChannelRefPtr least_loaded_locked() const noexcept;

    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct KeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    const PoolConfig cfg_;
    TransportFactory factory_;
    std::shared_ptr<const policy::PolicyRegistry> policies_;

    mutable std::mutex mu_;
    std::vector<ChannelRefPtr> refs_;                                    ///< Creation order == id
    std::unordered_map<std::string, ChannelRefPtr, KeyHash, KeyEq> bindings_; ///< Affinity key → channel
};

} // namespace sticky::pool
