#ifndef PATCHWORK_ENCODINGS_JSON_HPP
#define PATCHWORK_ENCODINGS_JSON_HPP

#include <patchwork/core/dynamic.hpp>

// JSON - conversion to and from JSON strings

namespace patchwork {

// Parse some JSON text into a dynamic value.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in compact JSON format.
string
value_to_json(dynamic const& v);

} // namespace patchwork

#endif
