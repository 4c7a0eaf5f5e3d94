/**
 * @file lifecycle_adapter.cpp
 * @brief Transition functions of CallLifecycleAdapter.
 */
#include "sticky/call/lifecycle_adapter.hpp"
#include "sticky/affinity/post_processor.hpp"

namespace sticky::call {

const char* to_string(LifecycleState s) noexcept {
    switch (s) {
        case LifecycleState::Started:              return "started";
        case LifecycleState::FirstMessageCaptured: return "first_message_captured";
        case LifecycleState::Completed:            return "completed";
    }
    return "unknown";
}

CallLifecycleAdapter::CallLifecycleAdapter(CallAffinityContext ctx, obs::Observer* obs) noexcept
    : ctx_(std::move(ctx)), obs_(obs) {}

CallLifecycleAdapter::~CallLifecycleAdapter() {
    if (state_ == LifecycleState::Completed) return;
    affinity::release_channel(ctx_.pool.get(), ctx_.channel);

    obs::AffinityEvent ev;
    ev.kind        = obs::EventKind::CallAbandoned;
    ev.method_path = ctx_.method_path;
    ev.affinity_key = ctx_.bound_key.value_or(std::string{});
    if (ctx_.channel) { ev.channel_id = ctx_.channel->id(); ev.has_channel = true; }
    ev.reason      = "no_terminal_status";
    obs::or_default(obs_)->record(ev);
}

void CallLifecycleAdapter::on_receive_metadata(const Metadata&) {
    // Metadata carries no affinity information.
}

void CallLifecycleAdapter::on_receive_message(const google::protobuf::Message& msg) {
    if (state_ != LifecycleState::Started) return;
    first_.reset(msg.New());
    first_->CopyFrom(msg);
    state_ = LifecycleState::FirstMessageCaptured;
}

void CallLifecycleAdapter::on_receive_status(const Status& status) {
    if (state_ == LifecycleState::Completed) return;
    state_ = LifecycleState::Completed;

    obs::AffinityEvent ev;
    ev.method_path = ctx_.method_path;
    ev.affinity_key = ctx_.bound_key.value_or(std::string{});
    if (ctx_.channel) { ev.channel_id = ctx_.channel->id(); ev.has_channel = true; }

    if (status.ok()) {
        affinity::post_process(ctx_.pool.get(), ctx_.channel, ctx_.method_path,
                               ctx_.bound_key, first_.get(), obs_);
        ev.kind   = obs::EventKind::CallCompleted;
        ev.reason = to_string(status.code);
    } else {
        // Failed or cancelled: bindings untouched, reservation still released.
        affinity::release_channel(ctx_.pool.get(), ctx_.channel);
        ev.kind   = obs::EventKind::ReleasedOnError;
        ev.reason = to_string(status.code);
    }
    obs::or_default(obs_)->record(ev);
}

} // namespace sticky::call
