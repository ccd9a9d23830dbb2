#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace resumeval {

constexpr size_t kMaxEmailLength = 254;
constexpr size_t kMaxPhoneLength = 32;

// Regular-expression form of each predicate, as published in the exported
// JSON Schema. The predicates below accept exactly these languages (plus the
// length and digit-count bounds noted on each).
extern const char* const kEmailRegex;
extern const char* const kPhoneRegex;
extern const char* const kPartialDateRegex;

// local@domain.tld, at most kMaxEmailLength chars
bool is_valid_email(const std::string& s);

// optional leading '+', digits with space/dash/dot/paren separators,
// 7..15 digits, at most kMaxPhoneLength chars
bool is_valid_phone(const std::string& s);

// YYYY, YYYY-MM or YYYY-MM-DD with month 01-12 and day 01-31
bool is_valid_partial_date(const std::string& s);

struct PartialDate {
    int year = 0;
    int month = 0;   // 0 when absent
    int day = 0;     // 0 when absent
};

std::optional<PartialDate> parse_partial_date(const std::string& s);

// Compares at the coarsest granularity both dates carry.
// Returns <0, 0 or >0.
int compare_partial_dates(const PartialDate& a, const PartialDate& b);

}  // namespace resumeval
