#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: JSON ApiConfig (protobuf schema) to pool sizing and method policies.
 * @details Missing values fall back to the named constants in constants.hpp.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sticky/compat/expected.hpp"
#include "sticky/config/api_config.pb.h"
#include "sticky/policy/affinity_policy.hpp"
#include "sticky/policy/policy_registry.hpp"
#include "sticky/pool/local_channel_pool.hpp"

namespace sticky::config {

    /** @struct MethodPolicyEntry
     *  @brief One configured method and its affinity policy.
     */
    struct MethodPolicyEntry {
        std::string                  method_path; ///< "/pkg.Service/Method"
        policy::MethodAffinityPolicy policy;
    };

    /** @struct ClientConfig
     *  @brief Aggregate of everything a client needs to build its pool.
     */
    struct ClientConfig {
        sticky::pool::PoolConfig       pool;    ///< Sizing (target filled by the caller)
        std::vector<MethodPolicyEntry> methods; ///< Per-method policies, config order
    };

    /** @struct ConfigError
     *  @brief Why a document was rejected.
     */
    struct ConfigError {
        enum class Code : uint8_t {
            Io = 1,          ///< File could not be read
            Parse,           ///< Not valid ApiConfig JSON
            InvalidPoolSize, ///< channel_pool.max_size out of range
            InvalidMethod,   ///< Malformed method name
            DuplicateMethod, ///< Same method configured twice
            MissingKey,      ///< Command other than NONE without affinity_key
            BadFieldPath,    ///< Key path does not fit the method's message type
            Registry         ///< Registry refused the policy set
        };
        Code        code{Code::Parse};
        std::string detail;
    };

    const char* to_string(ConfigError::Code c) noexcept;

    /** @class Loader
     *  @brief Source of client configuration (defaults or parsed documents).
     */
    class Loader {
    public:
        /// Named defaults: pool sizing from constants, no method policies.
        static ClientConfig defaults(std::string target = {});

        /**
         * @brief Parse the JSON form of sticky.config.ApiConfig.
         * @param json Document text; field names may be lowerCamel or proto names.
         * @param target Server address stored into the pool config.
         */
        static sticky_detail::expected<ClientConfig, ConfigError>
        load_from_json(std::string_view json, std::string target = {});

        /// Read @p path and parse it with load_from_json().
        static sticky_detail::expected<ClientConfig, ConfigError>
        load_from_file(const std::string& path, std::string target = {});

        /**
         * @brief Validate an already-decoded ApiConfig.
         * @details Key paths of methods known to the generated descriptor pool are
         *          compiled against the request (Bound/Unbind) or response (Bind)
         *          type here, so a mistyped path fails loading instead of every call.
         */
        static sticky_detail::expected<ClientConfig, ConfigError>
        from_proto(const ApiConfig& api, std::string target = {});

        /// Publish @p cfg's policies as one registry snapshot (replaces the previous set).
        static sticky_detail::expected<void, ConfigError>
        apply(const ClientConfig& cfg, policy::PolicyRegistry& registry);
    };

} // namespace sticky::config
