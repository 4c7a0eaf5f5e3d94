#pragma once
/**
 * @file transport.hpp
 * @brief Opaque transport channel consumed by the pool.
 * @details Real transports (gRPC channels, in-process loopbacks) implement this;
 *          the affinity protocol only needs identity and the target address.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace sticky::pool {

    /** @class TransportChannel
     *  @brief One connection to the logical server; many calls may share it.
     */
    class TransportChannel {
    public:
        virtual ~TransportChannel() = default;
        /// Server address this channel connects to.
        virtual const std::string& target() const noexcept = 0;
    };

    using TransportChannelPtr = std::shared_ptr<TransportChannel>;

    /// Opens the @p index-th channel to @p target (index is pool-local, 0-based).
    using TransportFactory = std::function<TransportChannelPtr(const std::string& target, std::size_t index)>;

} // namespace sticky::pool
