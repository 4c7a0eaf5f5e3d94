/**
 * @file call_pipeline.cpp
 * @brief Composition of pre_process(), the lifecycle adapter and post_process().
 */
#include "sticky/affinity/call_pipeline.hpp"
#include "sticky/affinity/pre_processor.hpp"
#include "sticky/call/lifecycle_adapter.hpp"

namespace sticky::affinity {

static call::OutputCallProperties pass_through(call::InputCallProperties props,
                                               pool::TransportChannelPtr channel,
                                               const char* reason,
                                               obs::Observer* obs) {
    obs::AffinityEvent ev;
    ev.kind        = obs::EventKind::CallBypassed;
    ev.method_path = props.method.path;
    ev.reason      = reason;
    obs::or_default(obs)->record(ev);

    return call::OutputCallProperties{std::move(props.argument), std::move(props.metadata),
                                      std::move(channel), std::move(props.method),
                                      std::move(props.options)};
}

call::OutputCallProperties intercept_call(call::InputCallProperties props, obs::Observer* obs) {
    auto* pool_target = std::get_if<std::shared_ptr<pool::ChannelPool>>(&props.channel);
    if (!pool_target || !*pool_target) {
        auto* foreign = std::get_if<pool::TransportChannelPtr>(&props.channel);
        pool::TransportChannelPtr channel = foreign ? *foreign : nullptr;
        const char* reason = channel ? "foreign_channel" : "no_pool";
        return pass_through(std::move(props), std::move(channel), reason, obs);
    }
    std::shared_ptr<pool::ChannelPool> pool = *pool_target;

    auto pre = pre_process(*pool, props.method.path, props.argument.get(), obs);
    if (!pre.channel) {
        // Contract breach by an external pool; nothing was reserved.
        return pass_through(std::move(props), nullptr, "pool_returned_no_channel", obs);
    }

    obs::AffinityEvent ev;
    ev.kind         = obs::EventKind::CallIntercepted;
    ev.method_path  = props.method.path;
    ev.affinity_key = pre.bound_key.value_or(std::string{});
    ev.channel_id   = pre.channel->id();
    ev.has_channel  = true;
    ev.reason       = pre.bound_key ? "bound_key" : "pool_selection";
    obs::or_default(obs)->record(ev);

    pool::TransportChannelPtr transport = pre.channel->channel();
    call::CallAffinityContext ctx{props.method.path, std::move(pre.bound_key),
                                  std::move(pre.channel), std::move(pool)};
    props.options.observers.push_back(
        std::make_shared<call::CallLifecycleAdapter>(std::move(ctx), obs));

    return call::OutputCallProperties{std::move(props.argument), std::move(props.metadata),
                                      std::move(transport), std::move(props.method),
                                      std::move(props.options)};
}

} // namespace sticky::affinity
