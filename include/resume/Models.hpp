#pragma once
#include <optional>
#include <string>
#include <vector>

namespace resumeval {

struct DateRange {
    std::string start;               // YYYY | YYYY-MM | YYYY-MM-DD
    std::string end;
};

struct ContactInformation {
    std::string first_name;
    std::string last_name;
    std::string email;
    std::optional<std::string> phone;
    std::optional<std::string> address;
    std::optional<std::string> city;
    std::optional<std::string> state;
    std::optional<std::string> zip_code;
    std::optional<std::string> country;
};

struct WorkHistoryItem {
    std::string position_or_title;
    std::string company_name;
    std::string location_or_remote;  // city or "Remote"
    std::optional<DateRange> duration;   // nullopt = ongoing / undated
    std::vector<std::string> responsibilities_accomplishments;
};

struct EducationHistoryItem {
    std::string institution;
    std::string degree;
    std::optional<DateRange> duration;
    std::optional<std::vector<std::string>> majors;
    std::optional<std::vector<std::string>> minors;
    std::optional<std::string> grade_point_average;
};

struct Resume {
    ContactInformation contact_information;
    std::vector<WorkHistoryItem> work_history;         // most recent first
    std::vector<EducationHistoryItem> education_history;
    std::optional<std::vector<std::string>> skills;
    std::optional<std::vector<std::string>> certifications;
    std::optional<std::vector<std::string>> publications;
    std::optional<std::vector<std::string>> patents;
    std::optional<std::vector<std::string>> websites;
};

}  // namespace resumeval
