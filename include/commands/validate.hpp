#pragma once

#include <ostream>
#include <string>

#include "validate/ResumeValidator.hpp"

constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitMalformed = 2;

// Reads a document from `path` ("-" for stdin) and validates it.
// Unreadable input is reported as MalformedInput.
resumeval::ValidationResult validate_input(const std::string& path, const resumeval::ValidatorConfig& cfg);

// One line per violation: "- <Kind> at <path>: <message>"
void print_violations(std::ostream& os, const resumeval::ValidationReport& rep);

int exit_code_for(const resumeval::ValidationReport& rep);

int cmd_validate(int argc, char** argv);
