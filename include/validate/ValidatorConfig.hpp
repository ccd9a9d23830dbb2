#pragma once

namespace resumeval {

struct ValidatorConfig {
    // run the cross-field pass after a clean structural pass
    bool semantic_checks = true;

    // workHistory must be most recent first
    bool check_ordering = true;

    // report OrderingViolation as an error instead of a warning
    bool ordering_is_error = false;
};

}  // namespace resumeval
