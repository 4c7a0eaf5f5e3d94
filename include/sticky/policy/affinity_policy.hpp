/**
 * @file affinity_policy.hpp
 * @brief Per-method affinity policy shared by the pre/post processors.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "sticky/message/field_path.hpp"

namespace sticky::policy {

/**
 * @brief What a method does with affinity keys.
 *
 * @note Semantics:
 *  - None:   Never touches affinity.
 *  - Bound:  Route by an existing binding for the request's key.
 *  - Bind:   After success, bind the first response's key to the call's channel.
 *  - Unbind: After success, drop the binding for the request's key.
 */
enum class AffinityCommand : std::uint8_t {
  None = 0,
  Bound,
  Bind,
  Unbind
};

const char* to_string(AffinityCommand c) noexcept;

/**
 * @brief Immutable policy for one RPC method.
 *
 * The resolver is built once per configured path and shared by every call
 * of the method (and by copies of the policy).
 */
struct MethodAffinityPolicy final {
  /// Command applied to calls of this method.
  AffinityCommand command{AffinityCommand::None};

  /// Key locator; null when command is None.
  std::shared_ptr<const message::AffinityKeyResolver> key;

  /// Build a policy, allocating its resolver.
  static MethodAffinityPolicy make(AffinityCommand command, std::string key_field_path);

  /// Configured dotted path ("" when absent).
  const std::string& key_field_path() const noexcept;

  /// True if the key is computed from the request before dispatch.
  bool keys_request() const noexcept {
    return command == AffinityCommand::Bound || command == AffinityCommand::Unbind;
  }

  /// Policies compare by command and configured path.
  bool operator==(const MethodAffinityPolicy& o) const noexcept {
    return command == o.command && key_field_path() == o.key_field_path();
  }
};

} // namespace sticky::policy
