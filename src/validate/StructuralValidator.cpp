#include "validate/StructuralValidator.hpp"

namespace resumeval {

static const char* json_type_str(const json& v) {
    if (v.is_null()) return "null";
    if (v.is_string()) return "string";
    if (v.is_number()) return "number";
    if (v.is_boolean()) return "boolean";
    if (v.is_object()) return "object";
    if (v.is_array()) return "array";
    return "unknown";
}

static bool kind_matches(ValueKind k, const json& v) {
    switch (k) {
        case ValueKind::String: return v.is_string();
        case ValueKind::Number: return v.is_number();
        case ValueKind::Object: return v.is_object();
        case ValueKind::Array: return v.is_array();
        default: return false;
    }
}

static void check_object(const std::string& path, const json& raw, const EntityDescriptor& entity,
                         std::vector<Violation>& out);

static void type_mismatch(const std::string& path, const char* expected, const json& v,
                          std::vector<Violation>& out) {
    const std::string got = json_type_str(v);
    std::string msg = "expected " + std::string(expected) + ", got " + got;
    const std::string desc = describe_value(v);
    if (!v.is_object() && !v.is_array() && !v.is_null()) msg += " " + desc;
    out.push_back(make_violation(path, ViolationKind::TypeMismatch, msg, desc));
}

// Rules 3-6 for a present, non-null value.
static void check_value(const std::string& path, const json& v, const ValueSpec& spec,
                        const ValueSpec* item, std::vector<Violation>& out) {
    if (!kind_matches(spec.kind, v)) {
        type_mismatch(path, kind_str(spec.kind), v, out);
        return;
    }

    switch (spec.kind) {
        case ValueKind::String: {
            const std::string s = v.get<std::string>();
            if (!matches_pattern(spec.pattern, s)) {
                const std::string desc = describe_value(v);
                out.push_back(make_violation(
                    path, ViolationKind::PatternMismatch,
                    desc + " does not match the " + std::string(pattern_str(spec.pattern)) + " pattern",
                    desc));
            }
            break;
        }
        case ValueKind::Object:
            if (spec.entity) check_object(path, v, *spec.entity, out);
            break;
        case ValueKind::Array:
            if (!item) break;
            for (size_t i = 0; i < v.size(); ++i) {
                const json& elem = v.at(i);
                const std::string ipath = index_path(path, i);
                // array elements are never nullable
                if (elem.is_null()) {
                    type_mismatch(ipath, kind_str(item->kind), elem, out);
                    continue;
                }
                check_value(ipath, elem, *item, nullptr, out);
            }
            break;
        case ValueKind::Number:
            break;
    }
}

static void check_field(const std::string& path, const json& raw, const FieldDescriptor& f,
                        std::vector<Violation>& out) {
    const std::string fpath = join_path(path, f.name);

    auto it = raw.find(f.name);
    if (it == raw.end()) {
        if (f.required) {
            out.push_back(make_violation(fpath, ViolationKind::MissingRequiredField,
                                         "missing required field '" + f.name + "'"));
        }
        return;
    }

    const json& v = *it;
    if (v.is_null()) {
        if (!f.nullable) type_mismatch(fpath, kind_str(f.value.kind), v, out);
        return;
    }

    check_value(fpath, v, f.value, f.value.kind == ValueKind::Array ? &f.item : nullptr, out);
}

static void check_object(const std::string& path, const json& raw, const EntityDescriptor& entity,
                         std::vector<Violation>& out) {
    if (!raw.is_object()) {
        type_mismatch(path.empty() ? "$" : path, "object", raw, out);
        return;
    }

    for (const auto& f : entity.fields) {
        check_field(path, raw, f, out);
    }

    // closed object: undeclared keys, in document order
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        if (entity.find(it.key())) continue;
        out.push_back(make_violation(join_path(path, it.key()),
                                     ViolationKind::AdditionalPropertyNotAllowed,
                                     "property '" + it.key() + "' is not allowed in " + entity.name,
                                     describe_value(it.value())));
    }
}

std::vector<Violation> validate_entity(const std::string& path, const json& raw,
                                       const EntityDescriptor& entity) {
    std::vector<Violation> out;
    check_object(path, raw, entity, out);
    return out;
}

}  // namespace resumeval
