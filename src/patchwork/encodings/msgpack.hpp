#ifndef PATCHWORK_ENCODINGS_MSGPACK_HPP
#define PATCHWORK_ENCODINGS_MSGPACK_HPP

#include <patchwork/core/dynamic.hpp>

// This file provides functions for converting dynamic values to and from
// MessagePack.

namespace patchwork {

dynamic
parse_msgpack_value(uint8_t const* data, size_t size);

dynamic
parse_msgpack_value(string const& msgpack);

string
value_to_msgpack_string(dynamic const& v);

} // namespace patchwork

#endif
