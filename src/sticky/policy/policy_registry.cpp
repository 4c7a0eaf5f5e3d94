/**
 * @file policy_registry.cpp
 * @brief Copy-on-write method policy table.
 * @details A call that loaded the previous table keeps it alive through its
 *          shared_ptr until it finishes; nothing is freed under a reader.
 */

#include "sticky/policy/policy_registry.hpp"
#include "sticky/config/constants.hpp"

#include <memory>

namespace sticky::policy {

using namespace sticky::config::constants;

const char* to_string(PolicyErr e) noexcept {
    switch (e) {
        case PolicyErr::Ok:       return "ok";
        case PolicyErr::Exists:   return "exists";
        case PolicyErr::NotFound: return "not_found";
        case PolicyErr::Invalid:  return "invalid";
        case PolicyErr::Capacity: return "capacity";
    }
    return "unknown";
}

//------------------------------- Validation -----------------------------------

bool PolicyRegistry::validateMethodPath(std::string_view path) noexcept {
    if (path.size() < 4 || path.size() > POLICY_MAX_METHOD_PATH_LEN) return false;
    if (path.front() != '/') return false;
    const auto sep = path.find('/', 1);
    // exactly one inner separator, both parts non-empty
    if (sep == std::string_view::npos || sep == 1 || sep + 1 == path.size()) return false;
    if (path.find('/', sep + 1) != std::string_view::npos) return false;
    for (char c : path) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') return false;
    }
    return true;
}

bool PolicyRegistry::validatePolicy(const MethodAffinityPolicy& policy) noexcept {
    if (policy.command == AffinityCommand::None) return true;
    const auto& fp = policy.key_field_path();
    if (fp.empty() || fp.size() > POLICY_MAX_FIELD_PATH_LEN) return false;
    for (auto seg : message::split_path(fp)) {
        if (seg.empty()) return false;
    }
    return true;
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const PolicyRegistry::Map>
PolicyRegistry::snapshot() const noexcept {
    // Pairs with the release store in publish().
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

std::optional<MethodAffinityPolicy> PolicyRegistry::lookup(std::string_view method_path) const noexcept {
    auto snap = snapshot();
    if (!snap) return std::nullopt;
    auto it = snap->find(method_path);
    if (it == snap->end()) return std::nullopt;
    return it->second; // copy (resolver is shared)
}

bool PolicyRegistry::hasMethod(std::string_view method_path) const noexcept {
    auto snap = snapshot();
    return snap && (snap->find(method_path) != snap->end());
}

std::size_t PolicyRegistry::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::vector<std::string> PolicyRegistry::listMethods() const {
    std::vector<std::string> out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.first);
    return out;
}

PolicyErr PolicyRegistry::addPolicy(std::string_view method_path, MethodAffinityPolicy policy) {
    return mutate(Mode::Add, method_path, std::move(policy));
}

PolicyErr PolicyRegistry::replacePolicy(std::string_view method_path, MethodAffinityPolicy policy) {
    return mutate(Mode::Replace, method_path, std::move(policy));
}

PolicyErr PolicyRegistry::upsertPolicy(std::string_view method_path, MethodAffinityPolicy policy) {
    return mutate(Mode::Upsert, method_path, std::move(policy));
}

bool PolicyRegistry::removePolicy(std::string_view method_path) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap || snap->empty()) return false;

    auto next = std::make_shared<Map>(*snap);
    auto it = next->find(method_path);
    if (it == next->end()) return false;
    next->erase(it);

    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void PolicyRegistry::clear() {
    std::lock_guard<std::mutex> lk(write_mu_);
    publish(std::make_shared<Map>());
}

PolicyErr PolicyRegistry::assignAll(const std::vector<std::pair<std::string, MethodAffinityPolicy>>& entries) {
    if (entries.size() > POLICY_MAX_METHODS) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return PolicyErr::Capacity;
    }
    auto next = std::make_shared<Map>();
    next->reserve(entries.size());
    for (const auto& [path, pol] : entries) {
        if (!validateMethodPath(path) || !validatePolicy(pol)) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            return PolicyErr::Invalid;
        }
        if (!next->emplace(path, pol).second) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            return PolicyErr::Exists;
        }
    }

    std::lock_guard<std::mutex> lk(write_mu_);
    publish(std::move(next));
    upserts_.fetch_add(entries.size(), std::memory_order_relaxed);
    return PolicyErr::Ok;
}

PolicyRegistry::Stats PolicyRegistry::stats() const noexcept {
    return Stats{adds_.load(std::memory_order_relaxed),
                 replaces_.load(std::memory_order_relaxed),
                 upserts_.load(std::memory_order_relaxed),
                 removes_.load(std::memory_order_relaxed),
                 failures_.load(std::memory_order_relaxed)};
}

//------------------------------- Mutation Core --------------------------------

void PolicyRegistry::publish(std::shared_ptr<Map> next) noexcept {
    // RCU update: RELEASE pairs with reader ACQUIRE so that all prior writes
    // to *next are visible to readers that load it.
    std::shared_ptr<const Map> cnext = std::move(next); // convert Map -> const Map
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

PolicyErr PolicyRegistry::mutate(Mode mode, std::string_view method_path, MethodAffinityPolicy policy) {
    if (!validateMethodPath(method_path) || !validatePolicy(policy)) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return PolicyErr::Invalid;
    }

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (!snap) { failures_.fetch_add(1, std::memory_order_relaxed); return PolicyErr::Invalid; }

    const bool exists = snap->find(method_path) != snap->end();
    if (!exists && snap->size() >= POLICY_MAX_METHODS) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return PolicyErr::Capacity;
    }

    switch (mode) {
        case Mode::Add:
            if (exists) { failures_.fetch_add(1, std::memory_order_relaxed); return PolicyErr::Exists; }
            break;
        case Mode::Replace:
            if (!exists) { failures_.fetch_add(1, std::memory_order_relaxed); return PolicyErr::NotFound; }
            break;
        case Mode::Upsert:
            break;
    }

    auto next = std::make_shared<Map>(*snap); // copy-on-write
    next->insert_or_assign(std::string(method_path), std::move(policy));
    publish(std::move(next));

    switch (mode) {
        case Mode::Add:     adds_.fetch_add(1, std::memory_order_relaxed); break;
        case Mode::Replace: replaces_.fetch_add(1, std::memory_order_relaxed); break;
        case Mode::Upsert:  upserts_.fetch_add(1, std::memory_order_relaxed); break;
    }
    return PolicyErr::Ok;
}

} // namespace sticky::policy
