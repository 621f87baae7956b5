#pragma once

#include <string>

// Strips leading and trailing spaces, tabs and line breaks.
std::string trim(const std::string& str);
