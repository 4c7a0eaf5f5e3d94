#pragma once
/**
 * @file field_path.hpp
 * @brief Affinity key extraction: dotted field paths compiled against protobuf schemas.
 * @details A dotted path ("header.session.name") is compiled once per message type
 *          into a chain of FieldDescriptors; per-call extraction walks reflection only.
 *          Extraction never throws and never mutates the message.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

#include "sticky/compat/expected.hpp"
#include "sticky/obs/observability.hpp"

namespace sticky::message {

/// Why a path failed to compile or to yield a key.
enum class PathError : uint8_t {
    Empty,          ///< Zero-length path (never treated as identity)
    EmptySegment,   ///< "a..b", ".a" or "a."
    TooDeep,        ///< More segments than FIELD_PATH_MAX_SEGMENTS
    NoSchema,       ///< No message / descriptor to walk
    UnknownField,   ///< Segment names no field of the current message
    NotAMessage,    ///< Non-terminal segment is a scalar
    RepeatedField,  ///< Repeated/map fields cannot carry a single key
    UnsupportedLeaf,///< Leaf is neither a string nor an integer scalar
    AbsentMessage,  ///< Intermediate sub-message is unset at runtime
    EmptyValue      ///< Leaf resolved to an empty string
};

const char* to_string(PathError e) noexcept;

/// Split a dotted path into its segments; empty segments are preserved.
std::vector<std::string_view> split_path(std::string_view dotted);

/**
 * @class FieldPath
 * @brief A dotted path bound to one message type.
 */
class FieldPath final {
public:
    /**
     * @brief Compile @p dotted against @p root.
     * @return The bound path, or the first structural error found.
     */
    static sticky_detail::expected<FieldPath, PathError>
    compile(const google::protobuf::Descriptor* root, std::string_view dotted);

    /**
     * @brief Walk the path on @p msg (which must be of type root()).
     * @return Key text; integers are rendered in decimal.
     */
    sticky_detail::expected<std::string, PathError>
    extract(const google::protobuf::Message& msg) const;

    const google::protobuf::Descriptor* root() const noexcept { return root_; }
    std::size_t depth() const noexcept { return fields_.size(); }

private:
    FieldPath(const google::protobuf::Descriptor* root,
              std::vector<const google::protobuf::FieldDescriptor*> fields) noexcept
        : root_(root), fields_(std::move(fields)) {}

    const google::protobuf::Descriptor*                  root_{nullptr};
    std::vector<const google::protobuf::FieldDescriptor*> fields_;
};

/**
 * @class AffinityKeyResolver
 * @brief Resolves the configured key path on request/response messages.
 *
 * Thread-safety: resolve() may be called concurrently; compiled paths are
 * memoized per message type under an internal mutex.
 */
class AffinityKeyResolver final {
public:
    explicit AffinityKeyResolver(std::string field_path);

    AffinityKeyResolver(const AffinityKeyResolver&)            = delete;
    AffinityKeyResolver& operator=(const AffinityKeyResolver&) = delete;

    /// Configured dotted path, verbatim.
    const std::string& field_path() const noexcept { return path_; }

    /// Compile against a known schema ahead of the first call.
    sticky_detail::expected<void, PathError>
    prepare(const google::protobuf::Descriptor* root) const;

    /**
     * @brief Extract the affinity key from @p message.
     * @param message Request or response; nullptr counts as absent.
     * @param obs Diagnostic sink (nullptr = default observer).
     * @param method_path Only used to label diagnostics.
     * @return The key, or an empty string on failure (a diagnostic is recorded).
     */
    std::string resolve(const google::protobuf::Message* message,
                        obs::Observer* obs = nullptr,
                        std::string_view method_path = {}) const;

private:
    using Compiled = sticky_detail::expected<std::shared_ptr<const FieldPath>, PathError>;

    Compiled compiled_for(const google::protobuf::Descriptor* root) const;

    const std::string path_;
    mutable std::mutex mu_;
    mutable std::vector<std::pair<const google::protobuf::Descriptor*, Compiled>> cache_;
};

/// One-shot resolution without memoization (same failure contract as resolve()).
std::string resolve_affinity_key(const google::protobuf::Message* message,
                                 std::string_view field_path,
                                 obs::Observer* obs = nullptr);

} // namespace sticky::message
