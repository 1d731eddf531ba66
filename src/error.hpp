#pragma once

#include <string>
#include <system_error>

enum class Error {
    Transport = 1, // network failure or HTTP error status
    MissingField, // envelope without `response` (or an empty one where one element is needed)
    Deserialization, // invalid JSON or a record of the wrong shape
    NotFound, // team search returned nothing
    File, // roster or color file missing or unreadable
    ColorFormat, // malformed "(r, g, b)" triple
};

const std::error_category& footyCategory();

std::error_code make_error_code(Error e);

namespace std {
template <>
struct is_error_code_enum<Error> : true_type {
};
}
