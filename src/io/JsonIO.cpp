#include "io/JsonIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace resumeval {

std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open file: " + path.string());
    }
    return read_stream(in);
}

std::string read_stream(std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string or null");
    }
    return j.at(key).get<std::string>();
}

static std::vector<std::string> string_array(const json& arr, const std::string& where) {
    if (!arr.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return string_array(j.at(key), where + "." + key);
}

static std::optional<std::vector<std::string>> optional_string_array(const json& j, const char* key,
                                                                     const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return string_array(j.at(key), where.empty() ? std::string(key) : where + "." + key);
}

static const json& require_array(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    return arr;
}

static std::optional<DateRange> parseDuration(const json& j, const std::string& where) {
    if (!j.contains("duration")) {
        throw std::runtime_error(where + " missing required field: duration");
    }
    const json& d = j.at("duration");
    if (d.is_null()) return std::nullopt;

    const std::string dwhere = where + ".duration";
    require_object(d, dwhere);

    DateRange r;
    r.start = require_string(d, "start", dwhere);
    r.end   = require_string(d, "end", dwhere);
    return r;
}

static ContactInformation parseContact(const json& j, const std::string& where) {
    require_object(j, where);

    ContactInformation c;
    c.first_name = require_string(j, "firstName", where);
    c.last_name  = require_string(j, "lastName", where);
    c.email      = require_string(j, "email", where);
    c.phone      = optional_string(j, "phone", where);
    c.address    = optional_string(j, "address", where);
    c.city       = optional_string(j, "city", where);
    c.state      = optional_string(j, "state", where);
    c.zip_code   = optional_string(j, "zipCode", where);
    c.country    = optional_string(j, "country", where);
    return c;
}

static WorkHistoryItem parseWorkItem(const json& j, const std::string& where) {
    require_object(j, where);

    WorkHistoryItem w;
    w.position_or_title  = require_string(j, "workPositionOrTitle", where);
    w.company_name       = require_string(j, "workForCompanyName", where);
    w.location_or_remote = require_string(j, "workLocationOrRemote", where);
    w.duration           = parseDuration(j, where);
    w.responsibilities_accomplishments =
        require_string_array(j, "workResponsibilitiesAccomplishments", where);
    return w;
}

static EducationHistoryItem parseEducationItem(const json& j, const std::string& where) {
    require_object(j, where);

    EducationHistoryItem e;
    e.institution         = require_string(j, "institution", where);
    e.degree              = require_string(j, "degree", where);
    e.duration            = parseDuration(j, where);
    e.majors              = optional_string_array(j, "majors", where);
    e.minors              = optional_string_array(j, "minors", where);
    e.grade_point_average = optional_string(j, "gradePointAverage", where);
    return e;
}

Resume resume_from_json(const json& j) {
    require_object(j, "$");

    Resume r;

    if (!j.contains("contactInformation")) {
        throw std::runtime_error("$ missing required field: contactInformation");
    }
    r.contact_information = parseContact(j.at("contactInformation"), "contactInformation");

    const json& work = require_array(j, "workHistory", "$");
    for (size_t i = 0; i < work.size(); ++i) {
        std::ostringstream oss;
        oss << "workHistory[" << i << "]";
        r.work_history.push_back(parseWorkItem(work.at(i), oss.str()));
    }

    const json& edu = require_array(j, "educationHistory", "$");
    for (size_t i = 0; i < edu.size(); ++i) {
        std::ostringstream oss;
        oss << "educationHistory[" << i << "]";
        r.education_history.push_back(parseEducationItem(edu.at(i), oss.str()));
    }

    r.skills         = optional_string_array(j, "skills", "");
    r.certifications = optional_string_array(j, "certifications", "");
    r.publications   = optional_string_array(j, "publications", "");
    r.patents        = optional_string_array(j, "patents", "");
    r.websites       = optional_string_array(j, "websites", "");

    return r;
}

template <typename T>
static json or_null(const std::optional<T>& v) {
    if (!v) return nullptr;
    return json(*v);
}

static json duration_to_json(const std::optional<DateRange>& d) {
    if (!d) return nullptr;
    json j;
    j["start"] = d->start;
    j["end"] = d->end;
    return j;
}

json resume_to_json(const Resume& r) {
    json j;

    const ContactInformation& c = r.contact_information;
    json cj;
    cj["firstName"] = c.first_name;
    cj["lastName"]  = c.last_name;
    cj["email"]     = c.email;
    cj["phone"]     = or_null(c.phone);
    cj["address"]   = or_null(c.address);
    cj["city"]      = or_null(c.city);
    cj["state"]     = or_null(c.state);
    cj["zipCode"]   = or_null(c.zip_code);
    cj["country"]   = or_null(c.country);
    j["contactInformation"] = cj;

    json work = json::array();
    for (const auto& w : r.work_history) {
        json wj;
        wj["workPositionOrTitle"]  = w.position_or_title;
        wj["workForCompanyName"]   = w.company_name;
        wj["workLocationOrRemote"] = w.location_or_remote;
        wj["duration"]             = duration_to_json(w.duration);
        wj["workResponsibilitiesAccomplishments"] = w.responsibilities_accomplishments;
        work.push_back(wj);
    }
    j["workHistory"] = work;

    json edu = json::array();
    for (const auto& e : r.education_history) {
        json ej;
        ej["institution"]       = e.institution;
        ej["degree"]            = e.degree;
        ej["duration"]          = duration_to_json(e.duration);
        ej["majors"]            = or_null(e.majors);
        ej["minors"]            = or_null(e.minors);
        ej["gradePointAverage"] = or_null(e.grade_point_average);
        edu.push_back(ej);
    }
    j["educationHistory"] = edu;

    j["skills"]         = or_null(r.skills);
    j["certifications"] = or_null(r.certifications);
    j["publications"]   = or_null(r.publications);
    j["patents"]        = or_null(r.patents);
    j["websites"]       = or_null(r.websites);

    return j;
}

}  // namespace resumeval
