#pragma once
/**
 * @file lifecycle_adapter.hpp
 * @brief Read-only observer that ties a call's outcome to its affinity bookkeeping.
 *
 * State machine (one transition function per event):
 *
 *   Started --message--> FirstMessageCaptured --message--> (unchanged)
 *   Started / FirstMessageCaptured --status--> Completed
 *   Completed --any--> (ignored)
 *
 * On a success status, post_process() runs with the captured first message.
 * On any other status the channel reservation is released without touching
 * the binding table. If the adapter dies before a status arrives (the call was
 * dropped by the transport), the reservation is released in the destructor.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <google/protobuf/message.h>

#include "sticky/call/call_properties.hpp"
#include "sticky/obs/observability.hpp"
#include "sticky/pool/channel_pool.hpp"

namespace sticky::call {

enum class LifecycleState : uint8_t {
    Started,
    FirstMessageCaptured,
    Completed
};

const char* to_string(LifecycleState s) noexcept;

/**
 * @struct CallAffinityContext
 * @brief Everything post-processing needs about one call.
 */
struct CallAffinityContext {
    std::string                        method_path; ///< "/pkg.Service/Method"
    std::optional<std::string>         bound_key;   ///< Key used for selection, if any
    pool::ChannelRefPtr                channel;     ///< Reserved channel
    std::shared_ptr<pool::ChannelPool> pool;        ///< Keeps the pool alive for the call
};

class CallLifecycleAdapter final : public CallObserver {
public:
    explicit CallLifecycleAdapter(CallAffinityContext ctx, obs::Observer* obs = nullptr) noexcept;
    ~CallLifecycleAdapter() override;

    CallLifecycleAdapter(const CallLifecycleAdapter&)            = delete;
    CallLifecycleAdapter& operator=(const CallLifecycleAdapter&) = delete;

    void on_receive_metadata(const Metadata& md) override;
    void on_receive_message(const google::protobuf::Message& msg) override;
    void on_receive_status(const Status& status) override;

    LifecycleState state() const noexcept { return state_; }

    /// Owned copy of the first response, or nullptr.
    const google::protobuf::Message* first_message() const noexcept { return first_.get(); }

    const CallAffinityContext& context() const noexcept { return ctx_; }

private:
    CallAffinityContext                        ctx_;
    obs::Observer*                             obs_{nullptr};
    LifecycleState                             state_{LifecycleState::Started};
    std::unique_ptr<google::protobuf::Message> first_;
};

} // namespace sticky::call
