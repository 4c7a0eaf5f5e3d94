#pragma once
/**
 * @file call_properties.hpp
 * @brief Per-call parameters exchanged with the call-dispatch layer.
 * @details The dispatch layer hands InputCallProperties to intercept_call() and
 *          dispatches the returned OutputCallProperties on its channel. Observers in
 *          CallOptions are read-only listeners: they get const views of what the
 *          caller receives and cannot alter it.
 */

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <google/protobuf/message.h>

#include "sticky/call/status.hpp"
#include "sticky/pool/channel_pool.hpp"
#include "sticky/pool/transport.hpp"

namespace sticky::call {

/// Request/response metadata (header and trailer pairs).
using Metadata = std::multimap<std::string, std::string>;

/// Request argument; null for client-streaming calls.
using MessagePtr = std::shared_ptr<const google::protobuf::Message>;

/**
 * @struct MethodDefinition
 * @brief Static description of the RPC method being invoked.
 */
struct MethodDefinition {
    std::string path;              ///< "/pkg.Service/Method"
    bool        request_stream{false};
    bool        response_stream{false};
};

/**
 * @class CallObserver
 * @brief Response-side listener attached through CallOptions.
 *
 * The transport invokes these in order for one call: metadata (optional),
 * zero or more messages, then exactly one status.
 */
class CallObserver {
public:
    virtual ~CallObserver() = default;
    virtual void on_receive_metadata(const Metadata& /*md*/) {}
    virtual void on_receive_message(const google::protobuf::Message& /*msg*/) {}
    virtual void on_receive_status(const Status& /*status*/) {}
};

using CallObserverPtr = std::shared_ptr<CallObserver>;

/**
 * @struct CallOptions
 * @brief Per-call options; observers run in list order.
 */
struct CallOptions {
    std::optional<std::chrono::system_clock::time_point> deadline; ///< Enforced by the transport
    std::vector<CallObserverPtr> observers;                        ///< Response/status listeners
};

/// Where the caller aimed the call: the pool, or a concrete (foreign) channel.
using ChannelTarget = std::variant<std::shared_ptr<pool::ChannelPool>, pool::TransportChannelPtr>;

/**
 * @struct InputCallProperties
 * @brief Call as issued by the application.
 */
struct InputCallProperties {
    MessagePtr       argument;
    Metadata         metadata;
    ChannelTarget    channel;
    MethodDefinition method;
    CallOptions      options;
};

/**
 * @struct OutputCallProperties
 * @brief Call as it must be dispatched: on a concrete transport channel.
 */
struct OutputCallProperties {
    MessagePtr                argument;
    Metadata                  metadata;
    pool::TransportChannelPtr channel;
    MethodDefinition          method;
    CallOptions               options;
};

// Transport-side fan-out helpers (in-process transports, tests).
inline void deliver_metadata(const CallOptions& o, const Metadata& md) {
    for (const auto& ob : o.observers) if (ob) ob->on_receive_metadata(md);
}
inline void deliver_message(const CallOptions& o, const google::protobuf::Message& msg) {
    for (const auto& ob : o.observers) if (ob) ob->on_receive_message(msg);
}
inline void deliver_status(const CallOptions& o, const Status& st) {
    for (const auto& ob : o.observers) if (ob) ob->on_receive_status(st);
}

} // namespace sticky::call
