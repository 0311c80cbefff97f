#include <patchwork/encodings/encoded_value.hpp>

#include <atomic>

#include <patchwork/encodings/json.hpp>
#include <patchwork/encodings/msgpack.hpp>

namespace patchwork {

std::ostream&
operator<<(std::ostream& s, value_encoding encoding)
{
    switch (encoding)
    {
        case value_encoding::JSON:
            s << "json";
            break;
        case value_encoding::MSGPACK:
            s << "msgpack";
            break;
        default:
            PATCHWORK_THROW(
                invalid_enum_value() << enum_id_info("value_encoding")
                                     << enum_value_info(int(encoding)));
    }
    return s;
}

value_encoding
parse_value_encoding(string const& name)
{
    if (name == "json")
        return value_encoding::JSON;
    if (name == "msgpack")
        return value_encoding::MSGPACK;
    PATCHWORK_THROW(
        invalid_enum_string() << enum_id_info("value_encoding")
                              << enum_string_info(name));
}

static std::atomic<value_encoding> the_default_encoding(value_encoding::JSON);

value_encoding
get_default_encoding()
{
    return the_default_encoding.load();
}

void
set_default_encoding(value_encoding encoding)
{
    the_default_encoding.store(encoding);
}

bool
operator==(encoded_value const& a, encoded_value const& b)
{
    return a.encoding == b.encoding && a.bytes == b.bytes;
}
bool
operator!=(encoded_value const& a, encoded_value const& b)
{
    return !(a == b);
}
bool
operator<(encoded_value const& a, encoded_value const& b)
{
    if (a.encoding != b.encoding)
        return a.encoding < b.encoding;
    return a.bytes < b.bytes;
}

encoded_value
encode_dynamic(value_encoding encoding, dynamic const& v)
{
    encoded_value encoded;
    encoded.encoding = encoding;
    switch (encoding)
    {
        case value_encoding::JSON:
            encoded.bytes = value_to_json(v);
            break;
        case value_encoding::MSGPACK:
            encoded.bytes = value_to_msgpack_string(v);
            break;
        default:
            PATCHWORK_THROW(
                invalid_enum_value() << enum_id_info("value_encoding")
                                     << enum_value_info(int(encoding)));
    }
    return encoded;
}

dynamic
decode_dynamic(encoded_value const& v)
{
    switch (v.encoding)
    {
        case value_encoding::JSON:
            return parse_json_value(v.bytes);
        case value_encoding::MSGPACK:
            return parse_msgpack_value(v.bytes);
        default:
            PATCHWORK_THROW(
                invalid_enum_value() << enum_id_info("value_encoding")
                                     << enum_value_info(int(v.encoding)));
    }
}

string
render_encoded_value(encoded_value const& v)
{
    if (v.encoding == value_encoding::JSON)
        return v.bytes;
    return value_to_json(decode_dynamic(v));
}

std::ostream&
operator<<(std::ostream& s, encoded_value const& v)
{
    s << render_encoded_value(v);
    return s;
}

} // namespace patchwork
