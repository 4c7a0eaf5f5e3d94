#pragma once
// Sticky Channel Pool: PolicyRegistry
// Concurrency: readers load an immutable shared_ptr<const Map>; writers publish a new one.
//   • Read-mostly workload: every call looks up its method; config reloads are rare.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers copy-on-write the whole map and atomically swap with RELEASE semantics.
//   • Writers are serialized among themselves; readers never block.
// Runtime policy: no exceptions from lookups, bounded memory (capacity limits).


#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sticky/policy/affinity_policy.hpp"

namespace sticky::policy {

// -----------------------------------------------------------------------------
// Error codes returned by registry operations.
// -----------------------------------------------------------------------------
/// Outcome of a registry mutation.
enum class PolicyErr {
    Ok,         ///< Published.
    Exists,     ///< Add failed because the method already has a policy.
    NotFound,   ///< Replace failed because the method has no policy.
    Invalid,    ///< Input validation failed (method path, field path).
    Capacity    ///< POLICY_MAX_METHODS reached.
};

const char* to_string(PolicyErr e) noexcept;

// -----------------------------------------------------------------------------
// PolicyRegistry class
// -----------------------------------------------------------------------------
///
/// Maintains a mapping: method path ("/pkg.Service/Method") → MethodAffinityPolicy.
/// - lookup() runs on every intercepted call: one acquire load, one hash probe.
/// - Mutations rebuild the map and publish it with a release store.
/// - Size is bounded by POLICY_MAX_METHODS.
/// - Non-throwing lookups; mutations return PolicyErr codes.
///
/// Thread-safety: readers never wait on writers; writers take write_mu_.
/// A call racing a reload sees either the old or the new table, never a mix.
//
class PolicyRegistry final {
public:
    // --------------------------- Keying model --------------------------------
    // Transparent functors: lookups by string_view
    // (the per-call lookup never builds a std::string).
    struct MKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct MKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    using Map = std::unordered_map<std::string, MethodAffinityPolicy, MKeyHash, MKeyEq>;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Whole table as currently published.
    std::shared_ptr<const Map> snapshot() const noexcept;

    /// Policy for a method, or std::nullopt when none is configured.
    [[nodiscard]] std::optional<MethodAffinityPolicy> lookup(std::string_view method_path) const noexcept;

    // --------------------------- Read utilities ------------------------------
    [[nodiscard]] bool hasMethod(std::string_view method_path) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<std::string> listMethods() const;

    /// Bumped once per publication.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Add a policy. Fails if the method already has one or input is invalid.
    PolicyErr addPolicy(std::string_view method_path, MethodAffinityPolicy policy);

    /// Replace the policy of a configured method.
    PolicyErr replacePolicy(std::string_view method_path, MethodAffinityPolicy policy);

    /// Insert or replace. Always succeeds if input is valid and capacity allows.
    PolicyErr upsertPolicy(std::string_view method_path, MethodAffinityPolicy policy);

    /// Remove a method's policy. Returns true if it was erased.
    bool removePolicy(std::string_view method_path);

    /// Clear all policies. Treated as maintenance operation.
    void clear();

    /// Replace the whole table in one snapshot (config reload). All-or-nothing.
    PolicyErr assignAll(const std::vector<std::pair<std::string, MethodAffinityPolicy>>& entries);

    // --------------------------- Validation ----------------------------------
    /// "/Service/Method" with non-empty parts and no whitespace.
    static bool validateMethodPath(std::string_view path) noexcept;
    /// Command None needs nothing; every other command needs a usable field path.
    static bool validatePolicy(const MethodAffinityPolicy& policy) noexcept;

    // --------------------------- Observability -------------------------------
    /// Cumulative mutation counters.
    struct Stats {
        uint64_t adds{0}, replaces{0}, upserts{0}, removes{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    // Published table; accessed only through atomic_load/atomic_store.
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::mutex write_mu_;

    std::atomic<uint64_t> adds_{0}, replaces_{0}, upserts_{0}, removes_{0}, failures_{0};

    enum class Mode { Add, Replace, Upsert };

    PolicyErr mutate(Mode mode, std::string_view method_path, MethodAffinityPolicy policy);
    void publish(std::shared_ptr<Map> next) noexcept;
};

} // namespace sticky::policy
