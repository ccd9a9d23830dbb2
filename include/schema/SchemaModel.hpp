#pragma once

#include <string>
#include <vector>

#include "io/Json.hpp"

namespace resumeval {

enum class ValueKind {
    String,
    Number,
    Object,
    Array
};

enum class Pattern {
    None,
    NonEmpty,
    Email,
    Phone,
    PartialDate
};

struct EntityDescriptor;

struct ValueSpec {
    ValueKind kind = ValueKind::String;
    Pattern pattern = Pattern::None;             // strings only
    const EntityDescriptor* entity = nullptr;    // objects only
};

struct FieldDescriptor {
    std::string name;
    ValueSpec value;
    ValueSpec item;          // element spec when value.kind == Array
    bool required = false;
    bool nullable = false;
    std::string description;
};

// Closed object: keys outside `fields` are rejected.
struct EntityDescriptor {
    std::string name;
    std::string description;
    std::vector<FieldDescriptor> fields;   // declaration order

    const FieldDescriptor* find(const std::string& key) const;
};

const char* kind_str(ValueKind k);
const char* pattern_str(Pattern p);

bool matches_pattern(Pattern p, const std::string& s);

// Resume schema. Built once on first use, read-only afterwards.
const EntityDescriptor& date_range_entity();
const EntityDescriptor& contact_information_entity();
const EntityDescriptor& work_history_item_entity();
const EntityDescriptor& education_history_item_entity();
const EntityDescriptor& resume_entity();

// Draft-7 JSON Schema rendering of an entity tree.
json to_json_schema(const EntityDescriptor& root);

}  // namespace resumeval
