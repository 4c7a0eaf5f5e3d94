/**
 * @file config_loader.cpp
 * @brief JSON ApiConfig parsing and validation.
 */
#include "sticky/config/config_loader.hpp"
#include "sticky/config/constants.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/json_util.h>

namespace sticky::config {
    using namespace sticky::config::constants;
    using policy::AffinityCommand;
    using policy::MethodAffinityPolicy;
    using policy::PolicyRegistry;

    namespace {

    sticky_detail::unexpected<ConfigError> fail(ConfigError::Code code, std::string detail) {
        return sticky_detail::unexpected<ConfigError>(ConfigError{code, std::move(detail)});
    }

    AffinityCommand to_command(AffinityConfig::Command c) noexcept {
        switch (c) {
            case AffinityConfig::BOUND:  return AffinityCommand::Bound;
            case AffinityConfig::BIND:   return AffinityCommand::Bind;
            case AffinityConfig::UNBIND: return AffinityCommand::Unbind;
            default:                     return AffinityCommand::None;
        }
    }

    // "/pkg.Service/Method" -> "pkg.Service.Method"
    std::string full_method_name(std::string_view path) {
        std::string out(path.substr(1));
        const auto sep = out.find('/');
        if (sep != std::string::npos) out[sep] = '.';
        return out;
    }

    // Compile the key path against the message the command reads. Methods not
    // linked into this binary are left to lazy compilation at call time.
    sticky_detail::expected<void, ConfigError>
    precompile(std::string_view method_path, const MethodAffinityPolicy& pol) {
        if (pol.command == AffinityCommand::None || !pol.key) return {};
        const auto* method = google::protobuf::DescriptorPool::generated_pool()
                                 ->FindMethodByName(full_method_name(method_path));
        if (!method) return {};

        const auto* schema = pol.keys_request() ? method->input_type() : method->output_type();
        auto ok = pol.key->prepare(schema);
        if (!ok) {
            return fail(ConfigError::Code::BadFieldPath,
                        std::string(method_path) + ": '" + pol.key_field_path() + "' on " +
                        schema->full_name() + ": " + message::to_string(ok.error()));
        }
        return {};
    }

    } // namespace

    const char* to_string(ConfigError::Code c) noexcept {
        switch (c) {
            case ConfigError::Code::Io:              return "io";
            case ConfigError::Code::Parse:           return "parse";
            case ConfigError::Code::InvalidPoolSize: return "invalid_pool_size";
            case ConfigError::Code::InvalidMethod:   return "invalid_method";
            case ConfigError::Code::DuplicateMethod: return "duplicate_method";
            case ConfigError::Code::MissingKey:      return "missing_key";
            case ConfigError::Code::BadFieldPath:    return "bad_field_path";
            case ConfigError::Code::Registry:        return "registry";
        }
        return "unknown";
    }

    ClientConfig Loader::defaults(std::string target) {
        ClientConfig cc;
        cc.pool.target        = std::move(target);
        cc.pool.max_size      = POOL_MAX_SIZE_DEFAULT;
        cc.pool.low_watermark = POOL_LOW_WATERMARK_DEFAULT;
        return cc;
    }

    sticky_detail::expected<ClientConfig, ConfigError>
    Loader::from_proto(const ApiConfig& api, std::string target) {
        ClientConfig cc = defaults(std::move(target));

        const auto& cp = api.channel_pool();
        if (cp.max_size() > POOL_MAX_SIZE_LIMIT) {
            return fail(ConfigError::Code::InvalidPoolSize,
                        "max_size " + std::to_string(cp.max_size()) + " exceeds " +
                        std::to_string(POOL_MAX_SIZE_LIMIT));
        }
        if (cp.max_size() != 0) cc.pool.max_size = cp.max_size();
        if (cp.max_concurrent_streams_low_watermark() != 0) {
            cc.pool.low_watermark = cp.max_concurrent_streams_low_watermark();
        }

        std::unordered_set<std::string> seen;
        for (const auto& mc : api.method()) {
            const auto cmd = to_command(mc.affinity().command());
            const auto& key = mc.affinity().affinity_key();
            if (cmd != AffinityCommand::None && key.empty()) {
                return fail(ConfigError::Code::MissingKey,
                            std::string("command ") + policy::to_string(cmd) + " without affinity_key");
            }
            // One resolver per configured path, shared by every name of the entry.
            auto pol = MethodAffinityPolicy::make(cmd, key);
            if (!PolicyRegistry::validatePolicy(pol)) {
                return fail(ConfigError::Code::BadFieldPath, "malformed affinity_key '" + key + "'");
            }

            for (const auto& name : mc.name()) {
                if (!PolicyRegistry::validateMethodPath(name)) {
                    return fail(ConfigError::Code::InvalidMethod, "bad method name '" + name + "'");
                }
                if (!seen.insert(name).second) {
                    return fail(ConfigError::Code::DuplicateMethod, name);
                }
                if (auto pre = precompile(name, pol); !pre) {
                    return sticky_detail::unexpected<ConfigError>(std::move(pre.error()));
                }
                cc.methods.push_back(MethodPolicyEntry{name, pol});
            }
        }
        if (cc.methods.size() > POLICY_MAX_METHODS) {
            return fail(ConfigError::Code::Registry, "too many methods");
        }
        return cc;
    }

    sticky_detail::expected<ClientConfig, ConfigError>
    Loader::load_from_json(std::string_view json, std::string target) {
        ApiConfig api;
        const std::string text(json);
        auto st = google::protobuf::util::JsonStringToMessage(text, &api);
        if (!st.ok()) {
            return fail(ConfigError::Code::Parse, st.ToString());
        }
        return from_proto(api, std::move(target));
    }

    sticky_detail::expected<ClientConfig, ConfigError>
    Loader::load_from_file(const std::string& path, std::string target) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return fail(ConfigError::Code::Io, "cannot open " + path);
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        if (in.bad()) {
            return fail(ConfigError::Code::Io, "read error on " + path);
        }
        return load_from_json(buf.str(), std::move(target));
    }

    sticky_detail::expected<void, ConfigError>
    Loader::apply(const ClientConfig& cfg, PolicyRegistry& registry) {
        std::vector<std::pair<std::string, MethodAffinityPolicy>> entries;
        entries.reserve(cfg.methods.size());
        for (const auto& m : cfg.methods) entries.emplace_back(m.method_path, m.policy);

        const auto err = registry.assignAll(entries);
        if (err != policy::PolicyErr::Ok) {
            return fail(ConfigError::Code::Registry, policy::to_string(err));
        }
        return {};
    }

} // namespace sticky::config
