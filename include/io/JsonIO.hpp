#pragma once

#include <filesystem>
#include <istream>
#include <string>

#include "io/Json.hpp"
#include "resume/Models.hpp"

namespace resumeval {

// Throws std::runtime_error if the file cannot be opened.
std::string read_text_file(const std::filesystem::path& path);
std::string read_stream(std::istream& in);

// Maps a structurally valid document onto the typed model.
// Throws std::runtime_error naming the offending path otherwise.
Resume resume_from_json(const json& j);

// Every declared field in declaration order; missing optionals as null.
json resume_to_json(const Resume& r);

}  // namespace resumeval
