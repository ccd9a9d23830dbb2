#pragma once

#include <optional>
#include <string>

#include "io/JsonIO.hpp"
#include "resume/Models.hpp"
#include "validate/ValidationReport.hpp"
#include "validate/ValidatorConfig.hpp"

namespace resumeval {

struct ValidationResult {
    std::optional<Resume> resume;   // set iff the report has no errors
    ValidationReport report;        // errors on failure, warnings either way

    bool ok() const { return resume.has_value(); }
};

// Structural pass, then (if clean) normalization and the semantic pass.
// Stateless: the same input always yields the same result.
ValidationResult validate(const json& doc, const ValidatorConfig& cfg = {});

// As above, but parses `text` first. A parse failure or a non-object root
// yields a single MalformedInput violation.
ValidationResult validate_text(const std::string& text, const ValidatorConfig& cfg = {});

}  // namespace resumeval
