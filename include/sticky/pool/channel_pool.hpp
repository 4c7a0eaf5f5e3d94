#pragma once
/**
 * @file channel_pool.hpp
 * @brief Pluggable channel pool consumed by the affinity protocol.
 * @details The protocol never creates, destroys or sizes channels itself; it only
 *          asks the pool for a channel, reserves/releases it and edits bindings.
 *          Implementations own all synchronization: each operation below must be
 *          atomic with respect to concurrent calls.
 */

#include <optional>
#include <string>
#include <string_view>

#include "sticky/pool/channel_ref.hpp"
#include "sticky/policy/affinity_policy.hpp"

namespace sticky::pool {

    class ChannelPool {
    public:
        virtual ~ChannelPool() = default;

        /// Affinity policy configured for @p method_path (absent = no participation).
        virtual std::optional<policy::MethodAffinityPolicy>
        affinity_policy(std::string_view method_path) const = 0;

        /**
         * @brief Channel for a call.
         * @param bound_key Channel already bound to this key wins if it exists;
         *        otherwise (or when absent) the pool's own selection applies.
         * @return Never null; valid for at least the duration of the call.
         */
        virtual ChannelRefPtr get_channel(std::optional<std::string_view> bound_key) = 0;

        /// Reserve capacity on @p channel for one call.
        virtual void increment_active(const ChannelRefPtr& channel) = 0;

        /// Release one reservation made by increment_active().
        virtual void decrement_active(const ChannelRefPtr& channel) = 0;

        /// Bind @p key to @p channel (overwrites an existing binding).
        virtual void bind(const ChannelRefPtr& channel, std::string_view key) = 0;

        /// Remove the binding for @p key. Returns false if there was none.
        virtual bool unbind(std::string_view key) = 0;
    };

} // namespace sticky::pool
