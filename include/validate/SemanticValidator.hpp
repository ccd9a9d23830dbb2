#pragma once

#include <vector>

#include "resume/Models.hpp"
#include "validate/ValidatorConfig.hpp"
#include "validate/Violation.hpp"

namespace resumeval {

// Cross-field checks on a structurally valid resume:
//   - every dated duration has start <= end (InvalidDateRange)
//   - workHistory is sorted most recent first, undated entries counting
//     as ongoing (OrderingViolation)
std::vector<Violation> validate_semantics(const Resume& resume, const ValidatorConfig& cfg = {});

}  // namespace resumeval
