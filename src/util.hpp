#pragma once

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

template <typename T>
T subClamp(T a, T b)
{
    if (a < b)
        return 0;
    return a - b;
}

[[noreturn]] void die(std::string_view msg);

std::unique_ptr<FILE, decltype(&fclose)> uniqueFopen(const char* path, const char* modes);

std::optional<std::string> readFile(const fs::path& path);

// Reads one line without the trailing newline. std::nullopt on EOF.
std::optional<std::string> readLine(FILE* file);

std::optional<std::string> getEnv(const char* name);

std::optional<int64_t> toInt(std::string_view str, int base = 10);

std::string_view trim(std::string_view str);
std::string toLower(std::string_view str);
bool equalsIgnoreCase(std::string_view a, std::string_view b);

std::string join(const std::vector<int64_t>& values, std::string_view separator);

// RFC 3986 unreserved characters are kept, everything else becomes %XX
std::string percentEncode(std::string_view str);

std::tm toLocalTime(std::time_t time);
