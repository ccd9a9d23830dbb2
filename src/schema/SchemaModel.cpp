#include "schema/SchemaModel.hpp"

#include "schema/Patterns.hpp"

namespace resumeval {

const FieldDescriptor* EntityDescriptor::find(const std::string& key) const {
    for (const auto& f : fields) {
        if (f.name == key) return &f;
    }
    return nullptr;
}

const char* kind_str(ValueKind k) {
    switch (k) {
        case ValueKind::String: return "string";
        case ValueKind::Number: return "number";
        case ValueKind::Object: return "object";
        case ValueKind::Array: return "array";
        default: return "unknown";
    }
}

const char* pattern_str(Pattern p) {
    switch (p) {
        case Pattern::None: return "none";
        case Pattern::NonEmpty: return "non-empty";
        case Pattern::Email: return "email";
        case Pattern::Phone: return "phone";
        case Pattern::PartialDate: return "partial-date";
        default: return "unknown";
    }
}

bool matches_pattern(Pattern p, const std::string& s) {
    switch (p) {
        case Pattern::None: return true;
        case Pattern::NonEmpty: return !s.empty();
        case Pattern::Email: return is_valid_email(s);
        case Pattern::Phone: return is_valid_phone(s);
        case Pattern::PartialDate: return is_valid_partial_date(s);
        default: return false;
    }
}

static ValueSpec string_spec(Pattern p = Pattern::None) {
    ValueSpec v;
    v.kind = ValueKind::String;
    v.pattern = p;
    return v;
}

static ValueSpec object_spec(const EntityDescriptor& e) {
    ValueSpec v;
    v.kind = ValueKind::Object;
    v.entity = &e;
    return v;
}

static FieldDescriptor string_field(const char* name, bool required, bool nullable,
                                    Pattern p, const char* description) {
    FieldDescriptor f;
    f.name = name;
    f.value = string_spec(p);
    f.required = required;
    f.nullable = nullable;
    f.description = description;
    return f;
}

static FieldDescriptor object_field(const char* name, const EntityDescriptor& e,
                                    bool required, bool nullable, const char* description) {
    FieldDescriptor f;
    f.name = name;
    f.value = object_spec(e);
    f.required = required;
    f.nullable = nullable;
    f.description = description;
    return f;
}

static FieldDescriptor array_field(const char* name, const ValueSpec& item,
                                   bool required, bool nullable, const char* description) {
    FieldDescriptor f;
    f.name = name;
    f.value.kind = ValueKind::Array;
    f.item = item;
    f.required = required;
    f.nullable = nullable;
    f.description = description;
    return f;
}

const EntityDescriptor& date_range_entity() {
    static const EntityDescriptor e{
        "DateRange",
        "Start and end dates, each YYYY, YYYY-MM or YYYY-MM-DD",
        {
            string_field("start", true, false, Pattern::PartialDate, "The start date"),
            string_field("end", true, false, Pattern::PartialDate, "The end date"),
        }
    };
    return e;
}

const EntityDescriptor& contact_information_entity() {
    static const EntityDescriptor e{
        "ContactInformation",
        "Contact details",
        {
            string_field("firstName", true, false, Pattern::NonEmpty, "The person's first name"),
            string_field("lastName", true, false, Pattern::NonEmpty, "The person's last name"),
            string_field("email", true, false, Pattern::Email, "The person's email address"),
            string_field("phone", false, true, Pattern::Phone, "The person's phone number"),
            string_field("address", false, true, Pattern::None, "The person's street address"),
            string_field("city", false, true, Pattern::None, "The person's city"),
            string_field("state", false, true, Pattern::None, "The person's state or province"),
            string_field("zipCode", false, true, Pattern::None, "The person's postal code"),
            string_field("country", true, true, Pattern::None, "The person's country"),
        }
    };
    return e;
}

const EntityDescriptor& work_history_item_entity() {
    static const EntityDescriptor e{
        "WorkHistoryItem",
        "One position held",
        {
            string_field("workPositionOrTitle", true, false, Pattern::None, "The job title"),
            string_field("workForCompanyName", true, false, Pattern::None, "The company name"),
            string_field("workLocationOrRemote", true, false, Pattern::None,
                         "Location or 'Remote' if remote work"),
            object_field("duration", date_range_entity(), true, true,
                         "Start and end dates of the position"),
            array_field("workResponsibilitiesAccomplishments", string_spec(), true, false,
                        "List of responsibilities or accomplishments"),
        }
    };
    return e;
}

const EntityDescriptor& education_history_item_entity() {
    static const EntityDescriptor e{
        "EducationHistoryItem",
        "One program of study",
        {
            string_field("institution", true, false, Pattern::None, "The name of the institution"),
            string_field("degree", true, false, Pattern::None, "The degree obtained"),
            object_field("duration", date_range_entity(), true, true,
                         "Start and end dates of the program"),
            array_field("majors", string_spec(), false, true, "The majors"),
            array_field("minors", string_spec(), false, true, "The minors"),
            string_field("gradePointAverage", false, true, Pattern::None, "The grade point average"),
        }
    };
    return e;
}

const EntityDescriptor& resume_entity() {
    static const EntityDescriptor e{
        "Resume",
        "A person's resume",
        {
            object_field("contactInformation", contact_information_entity(), true, false,
                         "Contact details"),
            array_field("workHistory", object_spec(work_history_item_entity()), true, false,
                        "Work history, sorted by duration, most recent first"),
            array_field("educationHistory", object_spec(education_history_item_entity()), true, false,
                        "Educational background"),
            array_field("skills", string_spec(), false, true, "List of skills"),
            array_field("certifications", string_spec(), false, true, "List of certifications"),
            array_field("publications", string_spec(), false, true, "List of publications"),
            array_field("patents", string_spec(), false, true, "List of patents"),
            array_field("websites", string_spec(), false, true,
                        "List of personal or professional websites"),
        }
    };
    return e;
}

static const char* pattern_regex(Pattern p) {
    switch (p) {
        case Pattern::Email: return kEmailRegex;
        case Pattern::Phone: return kPhoneRegex;
        case Pattern::PartialDate: return kPartialDateRegex;
        default: return nullptr;
    }
}

static json entity_schema(const EntityDescriptor& e);

static json value_schema(const ValueSpec& v, bool nullable) {
    json j;
    if (v.kind == ValueKind::Object && v.entity) {
        j = entity_schema(*v.entity);
    }

    if (nullable) j["type"] = json::array({kind_str(v.kind), "null"});
    else j["type"] = kind_str(v.kind);

    if (v.kind == ValueKind::String) {
        if (v.pattern == Pattern::NonEmpty) j["minLength"] = 1;
        if (v.pattern == Pattern::Email) j["maxLength"] = kMaxEmailLength;
        if (v.pattern == Pattern::Phone) j["maxLength"] = kMaxPhoneLength;
        if (const char* re = pattern_regex(v.pattern)) j["pattern"] = re;
    }
    return j;
}

static json entity_schema(const EntityDescriptor& e) {
    json j;
    j["type"] = "object";
    if (!e.description.empty()) j["description"] = e.description;

    json props = json::object();
    json required = json::array();
    for (const auto& f : e.fields) {
        json p = value_schema(f.value, f.nullable);
        if (f.value.kind == ValueKind::Array) p["items"] = value_schema(f.item, false);
        if (!f.description.empty()) p["description"] = f.description;
        props[f.name] = p;
        if (f.required) required.push_back(f.name);
    }

    j["properties"] = props;
    j["required"] = required;
    j["additionalProperties"] = false;
    return j;
}

json to_json_schema(const EntityDescriptor& root) {
    json j;
    j["$schema"] = "http://json-schema.org/draft-07/schema#";
    j["title"] = root.name;
    j.update(entity_schema(root));
    return j;
}

}  // namespace resumeval
