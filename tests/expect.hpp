#pragma once

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "util.hpp"

#ifndef FOOTY_TEST_DATA_DIR
#define FOOTY_TEST_DATA_DIR "tests/data"
#endif

namespace {

bool expect(bool condition, const std::string& label)
{
    if (!condition) {
        std::cerr << "FAILED: " << label << "\n";
        return false;
    }
    return true;
}

template <typename A, typename B>
bool expectEq(const A& actual, const B& expected, const std::string& label)
{
    if (!(actual == expected)) {
        std::cerr << "FAILED: " << label << "\n  actual:   " << actual << "\n  expected: " << expected
                  << "\n";
        return false;
    }
    return true;
}

fs::path dataPath(const char* name)
{
    return fs::path(FOOTY_TEST_DATA_DIR) / name;
}

std::string readData(const char* name)
{
    return readFile(dataPath(name)).value_or("");
}

// Everything written to a FILE*, for checking what the render functions print
class CapturedOutput {
public:
    CapturedOutput()
        : file_(open_memstream(&buffer_, &size_))
    {
    }

    ~CapturedOutput()
    {
        if (file_)
            fclose(file_);
        free(buffer_);
    }

    CapturedOutput(const CapturedOutput&) = delete;
    CapturedOutput& operator=(const CapturedOutput&) = delete;

    FILE* get() const
    {
        return file_;
    }

    std::string str()
    {
        fflush(file_);
        return std::string(buffer_, size_);
    }

private:
    char* buffer_ = nullptr;
    size_t size_ = 0;
    FILE* file_ = nullptr;
};

// A copy of a data file in the working directory, so tests can modify it
fs::path scratchCopy(const char* name, const char* copyName)
{
    const fs::path copy = copyName;
    fs::copy_file(dataPath(name), copy, fs::copy_options::overwrite_existing);
    return copy;
}

}
