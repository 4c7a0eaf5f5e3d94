/**
 * @file post_processor.cpp
 * @brief Implementation of post_process() and release_channel().
 */
#include "sticky/affinity/post_processor.hpp"

namespace sticky::affinity {

using policy::AffinityCommand;

static void update_bindings(pool::ChannelPool& pool,
                            const pool::ChannelRefPtr& channel,
                            std::string_view method_path,
                            const std::optional<std::string>& bound_key,
                            const google::protobuf::Message& first_response,
                            obs::Observer* obs) {
    const auto policy = pool.affinity_policy(method_path);
    if (!policy) return;

    obs::AffinityEvent ev;
    ev.method_path = std::string(method_path);
    ev.channel_id  = channel->id();
    ev.has_channel = true;

    switch (policy->command) {
        case AffinityCommand::Bind: {
            if (!policy->key) return;
            auto key = policy->key->resolve(&first_response, obs, method_path);
            // Diagnostic already recorded by the resolver; table stays unchanged.
            if (key.empty()) return;
            pool.bind(channel, key);
            ev.kind = obs::EventKind::Bound;
            ev.affinity_key = std::move(key);
            ev.reason = "bind_from_response";
            obs::or_default(obs)->record(ev);
            return;
        }
        case AffinityCommand::Unbind: {
            if (!bound_key) return;
            const bool removed = pool.unbind(*bound_key);
            ev.kind = obs::EventKind::Unbound;
            ev.affinity_key = *bound_key;
            ev.reason = removed ? "unbind_request_key" : "unbind_no_binding";
            obs::or_default(obs)->record(ev);
            return;
        }
        case AffinityCommand::None:
        case AffinityCommand::Bound:
            return;
    }
}

void post_process(pool::ChannelPool* pool,
                  const pool::ChannelRefPtr& channel,
                  std::string_view method_path,
                  const std::optional<std::string>& bound_key,
                  const google::protobuf::Message* first_response,
                  obs::Observer* obs) {
    if (!pool || !channel) return;
    // Streaming calls may end without data: nothing to bind from.
    if (first_response) update_bindings(*pool, channel, method_path, bound_key, *first_response, obs);
    pool->decrement_active(channel);
}

void release_channel(pool::ChannelPool* pool, const pool::ChannelRefPtr& channel) {
    if (!pool || !channel) return;
    pool->decrement_active(channel);
}

} // namespace sticky::affinity
