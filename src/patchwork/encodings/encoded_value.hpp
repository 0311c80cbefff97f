#ifndef PATCHWORK_ENCODINGS_ENCODED_VALUE_HPP
#define PATCHWORK_ENCODINGS_ENCODED_VALUE_HPP

#include <ostream>

#include <patchwork/core/type_interfaces.hpp>

// An encoded_value is the form in which values are stored inside patches.
// The diff/merge logic treats it as an opaque payload. Only the code that
// produces values (diffing) and consumes them (applying, validating, and
// rendering) looks inside, and it does so through the functions below, so the
// storage format can vary without affecting anything else.

namespace patchwork {

enum class value_encoding
{
    JSON,
    MSGPACK
};

std::ostream&
operator<<(std::ostream& s, value_encoding encoding);

// Get the value_encoding whose name (as written by the above) is :name.
// If there's no such encoding, this throws invalid_enum_string.
value_encoding
parse_value_encoding(string const& name);

// The default encoding is used for values written into patches whenever the
// caller doesn't request a specific one. It starts out as JSON and can be
// changed through configuration. (It's safe to access from any thread.)
value_encoding
get_default_encoding();

void
set_default_encoding(value_encoding encoding);

struct encoded_value
{
    value_encoding encoding = value_encoding::JSON;
    string bytes;
};

bool
operator==(encoded_value const& a, encoded_value const& b);
bool
operator!=(encoded_value const& a, encoded_value const& b);
bool
operator<(encoded_value const& a, encoded_value const& b);

// Encode a dynamic value.
// If the value can't be represented in the given encoding, this throws a
// conversion_error.
encoded_value
encode_dynamic(value_encoding encoding, dynamic const& v);

// Decode an encoded value.
// If the bytes aren't valid for the value's encoding, this throws a
// conversion_error.
dynamic
decode_dynamic(encoded_value const& v);

// Get a human-readable rendering of an encoded value. This is always compact
// JSON, regardless of the storage encoding.
string
render_encoded_value(encoded_value const& v);

std::ostream&
operator<<(std::ostream& s, encoded_value const& v);

// decode_error is thrown when a stored value can't be decoded into the type
// that it's supposed to hold.
PATCHWORK_DEFINE_EXCEPTION(decode_error)
PATCHWORK_DEFINE_ERROR_INFO(string, decode_target_type)

// Encode a value of any diffable type.
template<class T>
encoded_value
encode_value(value_encoding encoding, T const& x)
{
    dynamic v;
    to_dynamic(&v, x);
    return encode_dynamic(encoding, v);
}

// Decode a value of any diffable type.
// Any failure, either in decoding the bytes or in converting the decoded
// value to T, is reported as a decode_error.
template<class T>
void
decode_value(T* x, encoded_value const& v)
{
    try
    {
        T decoded;
        from_dynamic(&decoded, decode_dynamic(v));
        *x = std::move(decoded);
    }
    catch (decode_error&)
    {
        throw;
    }
    catch (boost::exception& e)
    {
        PATCHWORK_THROW(
            decode_error() << decode_target_type_info(typeid(T).name())
                           << wrapped_exception_diagnostics_info(
                                  boost::diagnostic_information(e)));
    }
}

} // namespace patchwork

#endif
