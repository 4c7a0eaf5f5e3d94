/**
 * @file pre_processor.cpp
 * @brief Implementation of pre_process().
 */
#include "sticky/affinity/pre_processor.hpp"

namespace sticky::affinity {

PreProcessResult pre_process(pool::ChannelPool& pool,
                             std::string_view method_path,
                             const google::protobuf::Message* argument,
                             obs::Observer* obs) {
    PreProcessResult out;

    // No policy means no affinity participation (not an error).
    const auto policy = pool.affinity_policy(method_path);
    if (argument && policy && policy->keys_request() && policy->key) {
        auto key = policy->key->resolve(argument, obs, method_path);
        if (!key.empty()) out.bound_key = std::move(key);
    }

    out.channel = out.bound_key ? pool.get_channel(std::string_view{*out.bound_key})
                                : pool.get_channel(std::nullopt);

    // Reserve before dispatch; undone exactly once when the call ends.
    if (out.channel) pool.increment_active(out.channel);
    return out;
}

} // namespace sticky::affinity
