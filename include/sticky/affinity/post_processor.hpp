#pragma once
/**
 * @file post_processor.hpp
 * @brief Binding-table maintenance and reservation release after a call ends.
 */

#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/message.h>

#include "sticky/obs/observability.hpp"
#include "sticky/pool/channel_pool.hpp"

namespace sticky::affinity {

/**
 * @brief Post-processing for a call that ended with a success status.
 *
 * With a captured first response: Bind methods bind the response's key to
 * @p channel (last writer wins); Unbind methods drop @p bound_key. The
 * reservation on @p channel is then released unconditionally.
 * No-op when @p pool or @p channel is null.
 */
void post_process(pool::ChannelPool* pool,
                  const pool::ChannelRefPtr& channel,
                  std::string_view method_path,
                  const std::optional<std::string>& bound_key,
                  const google::protobuf::Message* first_response,
                  obs::Observer* obs = nullptr);

/// Release the reservation only (failed, cancelled or abandoned calls).
void release_channel(pool::ChannelPool* pool, const pool::ChannelRefPtr& channel);

} // namespace sticky::affinity
