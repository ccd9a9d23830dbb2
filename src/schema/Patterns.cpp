#include "schema/Patterns.hpp"

#include <cctype>

namespace resumeval {

const char* const kEmailRegex =
    R"(^[A-Za-z0-9._%+-]+@[A-Za-z0-9-]+(\.[A-Za-z0-9-]+)*\.[A-Za-z]{2,}$)";
const char* const kPhoneRegex =
    R"(^\+?[0-9(][0-9 ().-]*[0-9]$)";
const char* const kPartialDateRegex =
    R"(^[0-9]{4}(-(0[1-9]|1[0-2])(-(0[1-9]|[12][0-9]|3[01]))?)?$)";

static bool is_digit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

static bool is_alpha(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

static bool is_local_char(char ch) {
    return is_digit(ch) || is_alpha(ch) ||
           ch == '.' || ch == '_' || ch == '%' || ch == '+' || ch == '-';
}

static bool is_label_char(char ch) {
    return is_digit(ch) || is_alpha(ch) || ch == '-';
}

bool is_valid_email(const std::string& s) {
    if (s.empty() || s.size() > kMaxEmailLength) return false;

    const size_t at = s.find('@');
    if (at == std::string::npos || at == 0) return false;
    for (size_t i = 0; i < at; ++i) {
        if (!is_local_char(s[i])) return false;
    }

    // domain: two or more non-empty labels, last one alphabetic, 2+ chars
    size_t labels = 0;
    size_t label_start = at + 1;
    for (size_t i = at + 1; i <= s.size(); ++i) {
        if (i < s.size() && s[i] != '.') {
            if (!is_label_char(s[i])) return false;
            continue;
        }
        if (i == label_start) return false;
        ++labels;
        if (i == s.size()) break;
        label_start = i + 1;
    }
    if (labels < 2) return false;

    const size_t tld_len = s.size() - label_start;
    if (tld_len < 2) return false;
    for (size_t i = label_start; i < s.size(); ++i) {
        if (!is_alpha(s[i])) return false;
    }
    return true;
}

bool is_valid_phone(const std::string& s) {
    if (s.empty() || s.size() > kMaxPhoneLength) return false;

    size_t pos = (s[0] == '+') ? 1 : 0;
    if (s.size() - pos < 2) return false;
    if (!is_digit(s[pos]) && s[pos] != '(') return false;
    if (!is_digit(s.back())) return false;

    int digits = 0;
    for (size_t i = pos; i < s.size(); ++i) {
        const char ch = s[i];
        if (is_digit(ch)) {
            ++digits;
            continue;
        }
        if (ch != ' ' && ch != '(' && ch != ')' && ch != '.' && ch != '-') return false;
    }
    return digits >= 7 && digits <= 15;
}

static bool read_digits(const std::string& s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!is_digit(s[i])) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

std::optional<PartialDate> parse_partial_date(const std::string& s) {
    // exactly 4, 7 or 10 chars
    if (s.size() != 4 && s.size() != 7 && s.size() != 10) return std::nullopt;

    PartialDate d;
    if (!read_digits(s, 0, 4, d.year)) return std::nullopt;
    if (s.size() == 4) return d;

    if (s[4] != '-' || !read_digits(s, 5, 2, d.month)) return std::nullopt;
    if (d.month < 1 || d.month > 12) return std::nullopt;
    if (s.size() == 7) return d;

    if (s[7] != '-' || !read_digits(s, 8, 2, d.day)) return std::nullopt;
    if (d.day < 1 || d.day > 31) return std::nullopt;
    return d;
}

bool is_valid_partial_date(const std::string& s) {
    return parse_partial_date(s).has_value();
}

int compare_partial_dates(const PartialDate& a, const PartialDate& b) {
    if (a.year != b.year) return a.year < b.year ? -1 : 1;
    if (a.month == 0 || b.month == 0) return 0;
    if (a.month != b.month) return a.month < b.month ? -1 : 1;
    if (a.day == 0 || b.day == 0) return 0;
    if (a.day != b.day) return a.day < b.day ? -1 : 1;
    return 0;
}

}  // namespace resumeval
