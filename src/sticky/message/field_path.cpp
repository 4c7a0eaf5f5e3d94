/**
 * @file field_path.cpp
 * @brief Compilation and reflective walking of affinity key paths.
 */
#include "sticky/message/field_path.hpp"
#include "sticky/config/constants.hpp"

namespace sticky::message {

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;
using google::protobuf::Message;
using google::protobuf::Reflection;

const char* to_string(PathError e) noexcept {
    switch (e) {
        case PathError::Empty:           return "empty path";
        case PathError::EmptySegment:    return "empty path segment";
        case PathError::TooDeep:         return "path too deep";
        case PathError::NoSchema:        return "message absent";
        case PathError::UnknownField:    return "no such field";
        case PathError::NotAMessage:     return "intermediate field is not a message";
        case PathError::RepeatedField:   return "repeated field";
        case PathError::UnsupportedLeaf: return "leaf is not a string or integer";
        case PathError::AbsentMessage:   return "sub-message not set";
        case PathError::EmptyValue:      return "empty key value";
    }
    return "unknown";
}

std::vector<std::string_view> split_path(std::string_view dotted) {
    std::vector<std::string_view> out;
    if (dotted.empty()) return out;
    std::size_t start = 0;
    for (;;) {
        const auto dot = dotted.find('.', start);
        if (dot == std::string_view::npos) {
            out.push_back(dotted.substr(start));
            return out;
        }
        out.push_back(dotted.substr(start, dot - start));
        start = dot + 1;
    }
}

// Proto field name first ("session_id"), then lowerCamelCase ("sessionId").
static const FieldDescriptor* find_field(const Descriptor* d, std::string_view name) {
    const std::string n(name);
    if (const auto* f = d->FindFieldByName(n)) return f;
    return d->FindFieldByCamelcaseName(n);
}

static bool is_integer(FieldDescriptor::CppType t) noexcept {
    return t == FieldDescriptor::CPPTYPE_INT32  || t == FieldDescriptor::CPPTYPE_INT64 ||
           t == FieldDescriptor::CPPTYPE_UINT32 || t == FieldDescriptor::CPPTYPE_UINT64;
}

//------------------------------- FieldPath ------------------------------------

sticky_detail::expected<FieldPath, PathError>
FieldPath::compile(const Descriptor* root, std::string_view dotted) {
    using sticky_detail::unexpected;
    if (!root) return unexpected(PathError::NoSchema);
    if (dotted.empty()) return unexpected(PathError::Empty);

    const auto segments = split_path(dotted);
    if (segments.size() > config::constants::FIELD_PATH_MAX_SEGMENTS) {
        return unexpected(PathError::TooDeep);
    }

    std::vector<const FieldDescriptor*> fields;
    fields.reserve(segments.size());
    const Descriptor* cur = root;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].empty()) return unexpected(PathError::EmptySegment);
        const auto* f = find_field(cur, segments[i]);
        if (!f) return unexpected(PathError::UnknownField);
        if (f->is_repeated()) return unexpected(PathError::RepeatedField);

        const bool last = (i + 1 == segments.size());
        if (!last) {
            if (f->cpp_type() != FieldDescriptor::CPPTYPE_MESSAGE) {
                return unexpected(PathError::NotAMessage);
            }
            cur = f->message_type();
        } else if (f->cpp_type() != FieldDescriptor::CPPTYPE_STRING &&
                   !is_integer(f->cpp_type())) {
            return unexpected(PathError::UnsupportedLeaf);
        }
        fields.push_back(f);
    }
    return FieldPath{root, std::move(fields)};
}

sticky_detail::expected<std::string, PathError>
FieldPath::extract(const Message& msg) const {
    using sticky_detail::unexpected;
    const Message* cur = &msg;
    for (std::size_t i = 0; i + 1 < fields_.size(); ++i) {
        const Reflection* r = cur->GetReflection();
        // Unset sub-message: JS-style getters would yield "absent" here.
        if (!r->HasField(*cur, fields_[i])) return unexpected(PathError::AbsentMessage);
        cur = &r->GetMessage(*cur, fields_[i]);
    }

    const FieldDescriptor* leaf = fields_.back();
    const Reflection* r = cur->GetReflection();
    std::string out;
    switch (leaf->cpp_type()) {
        case FieldDescriptor::CPPTYPE_STRING: out = r->GetString(*cur, leaf); break;
        case FieldDescriptor::CPPTYPE_INT32:  out = std::to_string(r->GetInt32(*cur, leaf)); break;
        case FieldDescriptor::CPPTYPE_INT64:  out = std::to_string(r->GetInt64(*cur, leaf)); break;
        case FieldDescriptor::CPPTYPE_UINT32: out = std::to_string(r->GetUInt32(*cur, leaf)); break;
        case FieldDescriptor::CPPTYPE_UINT64: out = std::to_string(r->GetUInt64(*cur, leaf)); break;
        default: return unexpected(PathError::UnsupportedLeaf);
    }
    if (out.empty()) return unexpected(PathError::EmptyValue);
    return out;
}

//--------------------------- AffinityKeyResolver ------------------------------

AffinityKeyResolver::AffinityKeyResolver(std::string field_path)
    : path_(std::move(field_path)) {}

AffinityKeyResolver::Compiled
AffinityKeyResolver::compiled_for(const Descriptor* root) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [d, c] : cache_) {
        if (d == root) return c;
    }
    auto fp = FieldPath::compile(root, path_);
    Compiled c = fp ? Compiled{std::make_shared<const FieldPath>(std::move(*fp))}
                    : Compiled{sticky_detail::unexpected(fp.error())};
    // Failures are memoized too: a misconfigured path is diagnosed per call
    // but compiled once per message type.
    cache_.emplace_back(root, c);
    return c;
}

sticky_detail::expected<void, PathError>
AffinityKeyResolver::prepare(const Descriptor* root) const {
    auto c = compiled_for(root);
    if (!c) return sticky_detail::unexpected(c.error());
    return {};
}

std::string AffinityKeyResolver::resolve(const Message* message,
                                         obs::Observer* obs,
                                         std::string_view method_path) const {
    auto fail = [&](PathError e) {
        obs::AffinityEvent ev;
        ev.kind        = obs::EventKind::KeyResolutionFailed;
        ev.method_path = std::string(method_path);
        ev.field_path  = path_;
        ev.reason      = to_string(e);
        obs::or_default(obs)->record(ev);
        return std::string{};
    };

    if (path_.empty()) return fail(PathError::Empty);
    if (!message) return fail(PathError::NoSchema);

    const auto compiled = compiled_for(message->GetDescriptor());
    if (!compiled) return fail(compiled.error());

    auto key = (*compiled)->extract(*message);
    if (!key) return fail(key.error());
    return std::move(*key);
}

std::string resolve_affinity_key(const Message* message,
                                 std::string_view field_path,
                                 obs::Observer* obs) {
    const AffinityKeyResolver resolver{std::string(field_path)};
    return resolver.resolve(message, obs);
}

} // namespace sticky::message
