#pragma once

#include <string>

#include "io/Json.hpp"

namespace resumeval {

enum class ViolationKind {
    MalformedInput,
    MissingRequiredField,
    TypeMismatch,
    PatternMismatch,
    AdditionalPropertyNotAllowed,
    InvalidDateRange,
    OrderingViolation
};

enum class Severity {
    Error,
    Warning
};

struct Violation {
    std::string path;        // e.g. workHistory[2].duration.start, "$" for the document root
    ViolationKind kind = ViolationKind::TypeMismatch;
    Severity severity = Severity::Error;
    std::string message;
    std::string value;       // description of the offending raw value, may be empty
};

const char* kind_str(ViolationKind k);
const char* severity_str(Severity s);

// OrderingViolation is a warning, everything else an error.
Severity default_severity(ViolationKind k);

Violation make_violation(const std::string& path, ViolationKind kind, const std::string& message,
                         const std::string& value = "");

// Short printable form: primitives are dumped (strings quoted, long ones
// truncated), containers are named by type.
std::string describe_value(const json& v);

// "a" + "b" -> "a.b", "" + "b" -> "b"
std::string join_path(const std::string& parent, const std::string& key);
std::string index_path(const std::string& parent, size_t index);

}  // namespace resumeval
