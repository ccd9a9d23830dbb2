#pragma once

#include <filesystem>
#include <vector>

#include "validate/Violation.hpp"

namespace resumeval {

struct ValidationReport {
    std::vector<Violation> violations;   // depth-first, declaration order, then index

    bool pass() const;                   // no error-class violations
    bool malformed() const;
    size_t error_count() const;
    size_t warning_count() const;

    void add(Violation v);
    void append(const std::vector<Violation>& vs);
};

json report_to_json(const ValidationReport& rep);

// Creates parent directories. Throws std::runtime_error if the file cannot be written.
void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace resumeval
