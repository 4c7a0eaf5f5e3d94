/**
 * @file affinity_policy.cpp
 * @brief MethodAffinityPolicy helpers.
 */
#include "sticky/policy/affinity_policy.hpp"

namespace sticky::policy {

const char* to_string(AffinityCommand c) noexcept {
    switch (c) {
        case AffinityCommand::None:   return "NONE";
        case AffinityCommand::Bound:  return "BOUND";
        case AffinityCommand::Bind:   return "BIND";
        case AffinityCommand::Unbind: return "UNBIND";
    }
    return "UNKNOWN";
}

MethodAffinityPolicy MethodAffinityPolicy::make(AffinityCommand command, std::string key_field_path) {
    MethodAffinityPolicy p;
    p.command = command;
    if (command != AffinityCommand::None) {
        p.key = std::make_shared<const message::AffinityKeyResolver>(std::move(key_field_path));
    }
    return p;
}

const std::string& MethodAffinityPolicy::key_field_path() const noexcept {
    static const std::string kNone;
    return key ? key->field_path() : kNone;
}

} // namespace sticky::policy
