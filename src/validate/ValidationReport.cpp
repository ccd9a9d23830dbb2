#include "validate/ValidationReport.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace resumeval {

bool ValidationReport::pass() const {
    return error_count() == 0;
}

bool ValidationReport::malformed() const {
    for (const auto& v : violations) {
        if (v.kind == ViolationKind::MalformedInput) return true;
    }
    return false;
}

size_t ValidationReport::error_count() const {
    size_t n = 0;
    for (const auto& v : violations) {
        if (v.severity == Severity::Error) ++n;
    }
    return n;
}

size_t ValidationReport::warning_count() const {
    return violations.size() - error_count();
}

void ValidationReport::add(Violation v) {
    violations.push_back(std::move(v));
}

void ValidationReport::append(const std::vector<Violation>& vs) {
    violations.insert(violations.end(), vs.begin(), vs.end());
}

json report_to_json(const ValidationReport& rep) {
    json j;
    j["pass"] = rep.pass();
    j["error_count"] = rep.error_count();
    j["warning_count"] = rep.warning_count();
    j["violations"] = json::array();

    for (const auto& v : rep.violations) {
        json vj;
        vj["path"] = v.path;
        vj["kind"] = kind_str(v.kind);
        vj["severity"] = severity_str(v.severity);
        vj["message"] = v.message;
        if (!v.value.empty()) vj["value"] = v.value;
        j["violations"].push_back(vj);
    }
    return j;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    // serialize first so a failure leaves any existing file untouched
    const std::string text = report_to_json(rep).dump(2, ' ', false, json::error_handler_t::replace);

    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to write validation report: " + path.string());
    out << text << "\n";
    if (!out) throw std::runtime_error("failed to write validation report: " + path.string());
}

}  // namespace resumeval
