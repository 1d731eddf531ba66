#include "utf8.hpp"

namespace utf8 {
bool isContinuationByte(char ch)
{
    return (static_cast<uint8_t>(ch) & 0b11000000) == 0b10000000;
}

size_t getCodePointLength(char firstCodeUnit)
{
    const auto u = static_cast<uint8_t>(firstCodeUnit);
    if ((u & 0b11111000) == 0b11110000)
        return 4;
    if ((u & 0b11110000) == 0b11100000)
        return 3;
    if ((u & 0b11100000) == 0b11000000)
        return 2;
    else
        return 1;
}

size_t countCodePoints(std::string_view str)
{
    size_t count = 0;
    size_t i = 0;
    while (i < str.size()) {
        const auto cpLen = getCodePointLength(str[i]);
        size_t len = 1;
        while (len < cpLen && i + len < str.size() && isContinuationByte(str[i + len]))
            len++;
        i += len;
        count++;
    }
    return count;
}
}
