#pragma once

#include <string>
#include <string_view>
#include <vector>

// Strips ASCII whitespace from both ends.
std::string trim(std::string_view s);

// Splits on sep, trimming each item and dropping empty ones.
std::vector<std::string> split_list(std::string_view s, char sep = ',');
