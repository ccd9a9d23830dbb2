#pragma once

#include <string>
#include <vector>

#include "schema/SchemaModel.hpp"
#include "validate/Violation.hpp"

namespace resumeval {

// Walks `raw` against `entity` and returns every violation found, in
// depth-first, declaration order. An empty path denotes the document root.
std::vector<Violation> validate_entity(const std::string& path, const json& raw,
                                       const EntityDescriptor& entity);

}  // namespace resumeval
