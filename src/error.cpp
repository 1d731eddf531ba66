#include "error.hpp"

namespace {
class FootyCategory : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "footy";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Transport:
            return "Request failed";
        case Error::MissingField:
            return "Missing field in response";
        case Error::Deserialization:
            return "Unexpected data in response";
        case Error::NotFound:
            return "Not found";
        case Error::File:
            return "Could not read or write file";
        case Error::ColorFormat:
            return "Malformed color";
        default:
            return "Unknown error";
        }
    }
};
}

const std::error_category& footyCategory()
{
    static FootyCategory category;
    return category;
}

std::error_code make_error_code(Error e)
{
    return std::error_code(static_cast<int>(e), footyCategory());
}
