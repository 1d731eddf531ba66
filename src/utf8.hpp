#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace utf8 {
bool isContinuationByte(char ch);
size_t getCodePointLength(char firstCodeUnit);

// Number of code points, which is what we use as display width for team names.
// Malformed sequences count every byte that is not a continuation byte.
size_t countCodePoints(std::string_view str);
}
