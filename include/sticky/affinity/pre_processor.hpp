#pragma once
/**
 * @file pre_processor.hpp
 * @brief Channel selection before dispatch: bound key, pool lookup, reservation.
 */

#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/message.h>

#include "sticky/obs/observability.hpp"
#include "sticky/pool/channel_pool.hpp"

namespace sticky::affinity {

/** @struct PreProcessResult
 *  @brief Outcome of pre_process() for one call.
 */
struct PreProcessResult {
    std::optional<std::string> bound_key; ///< Key used to select; Bound/Unbind only
    pool::ChannelRefPtr        channel;   ///< Reserved channel (active streams +1)
};

/**
 * @brief Pick and reserve the channel for one call.
 *
 * For Bound/Unbind methods the key is resolved from @p argument; a resolution
 * failure only drops the key (default selection applies). The returned channel
 * has already been reserved; the caller must release it exactly once.
 *
 * @param pool Channel pool the call targets.
 * @param method_path "/pkg.Service/Method".
 * @param argument Request message; nullptr for client-streaming calls.
 * @param obs Diagnostic sink (nullptr = default observer).
 */
PreProcessResult pre_process(pool::ChannelPool& pool,
                             std::string_view method_path,
                             const google::protobuf::Message* argument,
                             obs::Observer* obs = nullptr);

} // namespace sticky::affinity
