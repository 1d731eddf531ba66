#pragma once

#include <string>
#include <string_view>
#include <vector>

// Just enough CSV for the roster and color files: comma separated, fields may be quoted with
// '"' (and contain commas then), '""' inside quotes is a literal quote. No embedded newlines.
namespace csv {
std::vector<std::string> parseLine(std::string_view line);

std::string formatField(std::string_view field);
std::string formatLine(const std::vector<std::string>& fields);

// Splits a whole file into rows, skipping blank lines and a trailing '\r' on each line
std::vector<std::vector<std::string>> parse(std::string_view text);
}
