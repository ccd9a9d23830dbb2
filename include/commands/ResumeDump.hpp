#pragma once

#include <string>

// Validates the resume at `resumePath` ("-" for stdin) and prints a
// readable summary of the normalized document.
int resumeDump(const std::string& resumePath);
