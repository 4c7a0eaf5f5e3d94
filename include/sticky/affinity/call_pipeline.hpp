#pragma once
/**
 * @file call_pipeline.hpp
 * @brief Single entry point used by the call-dispatch layer.
 */

#include "sticky/call/call_properties.hpp"
#include "sticky/obs/observability.hpp"

namespace sticky::affinity {

/**
 * @brief Route one outgoing call through the channel pool.
 *
 * If @p props targets a ChannelPool: select and reserve a channel, rewrite the
 * call's channel to that channel's transport and append one lifecycle observer
 * to the call options (existing observers keep their order). Any other target
 * (a concrete transport channel, a null pool) is returned unchanged.
 *
 * @param props Call as issued by the application.
 * @param obs Event sink for this call (nullptr = default observer).
 * @return Call parameters to dispatch.
 */
call::OutputCallProperties intercept_call(call::InputCallProperties props,
                                          obs::Observer* obs = nullptr);

} // namespace sticky::affinity
