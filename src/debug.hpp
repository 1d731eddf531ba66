#pragma once

#include <cstdio>
#include <memory>

#include <fmt/format.h>

// Set by --debug. Nothing is logged otherwise.
inline bool logDebugToFile = false;
inline constexpr auto debugLogPath = "footy-debug.log";

template <typename String, typename... Args>
void debug([[maybe_unused]] String&& format, [[maybe_unused]] Args&&... args)
{
    if (!logDebugToFile)
        return;
    // I don't use the function from util.hpp here, so this file is self-contained
    auto f = std::unique_ptr<FILE, decltype(&fclose)>(fopen(debugLogPath, "a"), &fclose);
    if (!f)
        return;
    fmt::print(f.get(), format, std::forward<Args>(args)...);
    fmt::print(f.get(), "\n");
}
