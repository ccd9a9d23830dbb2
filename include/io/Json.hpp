#pragma once

#include <nlohmann/json.hpp>

namespace resumeval {

// Key order of documents is preserved end to end.
using json = nlohmann::ordered_json;

}  // namespace resumeval
