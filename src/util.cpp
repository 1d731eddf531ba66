#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#include <fmt/format.h>

#include "debug.hpp"

void die(std::string_view msg)
{
    fmt::print(stderr, "{}\n", msg);
    std::exit(1);
}

std::unique_ptr<FILE, decltype(&fclose)> uniqueFopen(const char* path, const char* modes)
{
    return std::unique_ptr<FILE, decltype(&fclose)>(fopen(path, modes), &fclose);
}

std::optional<std::string> readFile(const fs::path& path)
{
    auto f = uniqueFopen(path.c_str(), "rb");
    if (!f)
        return std::nullopt;
    if (fseek(f.get(), 0, SEEK_END) != 0)
        return std::nullopt;
    const auto size = ftell(f.get());
    if (size < 0)
        return std::nullopt;
    if (fseek(f.get(), 0, SEEK_SET) != 0)
        return std::nullopt;
    std::string buf(size, '\0');
    if (fread(buf.data(), 1, size, f.get()) != static_cast<size_t>(size))
        return std::nullopt;
    return buf;
}

std::optional<std::string> readLine(FILE* file)
{
    std::string line;
    int ch = 0;
    while ((ch = fgetc(file)) != EOF) {
        if (ch == '\n')
            return line;
        line.push_back(static_cast<char>(ch));
    }
    if (line.empty())
        return std::nullopt;
    return line;
}

std::optional<std::string> getEnv(const char* name)
{
    const auto value = ::getenv(name);
    if (!value)
        return std::nullopt;
    return std::string(value);
}

std::optional<int64_t> toInt(std::string_view str, int base)
{
    const auto s = std::string(str);
    if (s.empty())
        return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const auto value = std::strtoll(s.c_str(), &end, base);
    if (errno == ERANGE || end != s.c_str() + s.size())
        return std::nullopt;
    return static_cast<int64_t>(value);
}

std::string_view trim(std::string_view str)
{
    const auto isSpace = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)); };
    while (!str.empty() && isSpace(str.front()))
        str.remove_prefix(1);
    while (!str.empty() && isSpace(str.back()))
        str.remove_suffix(1);
    return str;
}

std::string toLower(std::string_view str)
{
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b)
{
    return toLower(a) == toLower(b);
}

std::string join(const std::vector<int64_t>& values, std::string_view separator)
{
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0)
            out.append(separator);
        out.append(std::to_string(values[i]));
    }
    return out;
}

std::string percentEncode(std::string_view str)
{
    static const char hexDigits[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(str.size() * 3);
    for (const auto ch : str) {
        const auto c = static_cast<uint8_t>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(hexDigits[c >> 4]);
            out.push_back(hexDigits[c & 15]);
        }
    }
    return out;
}

std::tm toLocalTime(std::time_t time)
{
    std::tm tm {};
    if (!::localtime_r(&time, &tm))
        debug("localtime_r failed for {}", static_cast<int64_t>(time));
    return tm;
}
