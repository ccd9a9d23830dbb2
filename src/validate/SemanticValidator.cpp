#include "validate/SemanticValidator.hpp"

#include "schema/Patterns.hpp"

#include <optional>
#include <string>

namespace resumeval {

static void check_date_range(const std::string& path, const std::optional<DateRange>& d,
                             std::vector<Violation>& out) {
    if (!d) return;

    const auto start = parse_partial_date(d->start);
    const auto end = parse_partial_date(d->end);
    if (!start || !end) return;

    if (compare_partial_dates(*start, *end) > 0) {
        out.push_back(make_violation(path, ViolationKind::InvalidDateRange,
                                     "start " + d->start + " is after end " + d->end,
                                     d->start + " .. " + d->end));
    }
}

// Sort key for a work history entry: nullopt means ongoing.
static std::optional<PartialDate> recency_key(const WorkHistoryItem& w) {
    if (!w.duration) return std::nullopt;
    return parse_partial_date(w.duration->end);
}

// True when `later` in the list is more recent than `earlier`.
static bool out_of_order(const WorkHistoryItem& earlier, const WorkHistoryItem& later) {
    const auto a = recency_key(earlier);
    const auto b = recency_key(later);
    if (!b) return a.has_value();   // ongoing after a dated entry
    if (!a) return false;
    return compare_partial_dates(*a, *b) < 0;
}

static std::string end_str(const WorkHistoryItem& w) {
    return w.duration ? w.duration->end : std::string("ongoing");
}

std::vector<Violation> validate_semantics(const Resume& resume, const ValidatorConfig& cfg) {
    std::vector<Violation> out;

    for (size_t i = 0; i < resume.work_history.size(); ++i) {
        check_date_range(index_path("workHistory", i) + ".duration", resume.work_history[i].duration, out);
    }
    for (size_t i = 0; i < resume.education_history.size(); ++i) {
        check_date_range(index_path("educationHistory", i) + ".duration",
                         resume.education_history[i].duration, out);
    }

    if (!cfg.check_ordering) return out;

    const auto& work = resume.work_history;
    for (size_t i = 1; i < work.size(); ++i) {
        if (!out_of_order(work[i - 1], work[i])) continue;

        Violation v = make_violation(
            index_path("workHistory", i), ViolationKind::OrderingViolation,
            "entry ending " + end_str(work[i]) + " is more recent than " +
                index_path("workHistory", i - 1) + " ending " + end_str(work[i - 1]) +
                "; expected most recent first",
            end_str(work[i]));
        if (cfg.ordering_is_error) v.severity = Severity::Error;
        out.push_back(std::move(v));
    }

    return out;
}

}  // namespace resumeval
