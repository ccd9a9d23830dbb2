#include "validate/ResumeValidator.hpp"

#include "schema/SchemaModel.hpp"
#include "validate/SemanticValidator.hpp"
#include "validate/StructuralValidator.hpp"

namespace resumeval {

static ValidationResult malformed(const std::string& message, const std::string& value = "") {
    ValidationResult res;
    res.report.add(make_violation("$", ViolationKind::MalformedInput, message, value));
    return res;
}

ValidationResult validate(const json& doc, const ValidatorConfig& cfg) {
    if (!doc.is_object()) {
        return malformed("document root must be an object, got " + std::string(doc.type_name()),
                         describe_value(doc));
    }

    ValidationResult res;
    res.report.append(validate_entity("", doc, resume_entity()));
    if (!res.report.violations.empty()) return res;

    Resume resume = resume_from_json(doc);

    if (cfg.semantic_checks) {
        res.report.append(validate_semantics(resume, cfg));
    }

    if (res.report.pass()) res.resume = std::move(resume);
    return res;
}

ValidationResult validate_text(const std::string& text, const ValidatorConfig& cfg) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return malformed(std::string("document is not valid JSON: ") + e.what());
    }
    return validate(doc, cfg);
}

}  // namespace resumeval
