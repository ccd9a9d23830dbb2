#include "validate/Violation.hpp"

namespace resumeval {

const char* kind_str(ViolationKind k) {
    switch (k) {
        case ViolationKind::MalformedInput: return "MalformedInput";
        case ViolationKind::MissingRequiredField: return "MissingRequiredField";
        case ViolationKind::TypeMismatch: return "TypeMismatch";
        case ViolationKind::PatternMismatch: return "PatternMismatch";
        case ViolationKind::AdditionalPropertyNotAllowed: return "AdditionalPropertyNotAllowed";
        case ViolationKind::InvalidDateRange: return "InvalidDateRange";
        case ViolationKind::OrderingViolation: return "OrderingViolation";
        default: return "Unknown";
    }
}

const char* severity_str(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        default: return "unknown";
    }
}

Severity default_severity(ViolationKind k) {
    return k == ViolationKind::OrderingViolation ? Severity::Warning : Severity::Error;
}

Violation make_violation(const std::string& path, ViolationKind kind, const std::string& message,
                         const std::string& value) {
    Violation v;
    v.path = path;
    v.kind = kind;
    v.severity = default_severity(kind);
    v.message = message;
    v.value = value;
    return v;
}

std::string describe_value(const json& v) {
    static const size_t kMaxLen = 80;

    switch (v.type()) {
        case json::value_t::object: return "object";
        case json::value_t::array: return "array";
        case json::value_t::discarded: return "";
        default: break;
    }

    std::string s = v.dump(-1, ' ', false, json::error_handler_t::replace);
    if (s.size() <= kMaxLen) return s;

    // never cut inside a UTF-8 sequence
    size_t cut = kMaxLen - 3;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut) + "...";
}

std::string join_path(const std::string& parent, const std::string& key) {
    if (parent.empty()) return key;
    return parent + "." + key;
}

std::string index_path(const std::string& parent, size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

}  // namespace resumeval
