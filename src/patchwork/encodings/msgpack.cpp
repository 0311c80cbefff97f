#include <patchwork/encodings/msgpack.hpp>

#include <boost/numeric/conversion/cast.hpp>

// Include msgpack-c, disabling any warnings that it would trigger.
#define MSGPACK_USE_CPP11
#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <msgpack.hpp>
#pragma GCC diagnostic pop
#else
#include <msgpack.hpp>
#endif

namespace patchwork {

static void
write_msgpack_value(
    msgpack::packer<msgpack::sbuffer>& packer, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
            packer.pack_nil();
            break;
        case value_type::BOOLEAN:
            if (cast<bool>(v))
                packer.pack_true();
            else
                packer.pack_false();
            break;
        case value_type::INTEGER:
            packer.pack_int64(cast<integer>(v));
            break;
        case value_type::UNSIGNED:
            packer.pack_uint64(cast<uint64_t>(v));
            break;
        case value_type::FLOAT:
            packer.pack_double(cast<double>(v));
            break;
        case value_type::STRING: {
            auto const& s = cast<string>(v);
            packer.pack_str(boost::numeric_cast<uint32_t>(s.length()));
            packer.pack_str_body(
                s.c_str(), boost::numeric_cast<uint32_t>(s.length()));
            break;
        }
        case value_type::ARRAY: {
            dynamic_array const& x = cast<dynamic_array>(v);
            size_t size = x.size();
            packer.pack_array(boost::numeric_cast<uint32_t>(size));
            for (size_t i = 0; i != size; ++i)
                write_msgpack_value(packer, x[i]);
            break;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            packer.pack_map(boost::numeric_cast<uint32_t>(x.size()));
            for (auto const& i : x)
            {
                write_msgpack_value(packer, i.first);
                write_msgpack_value(packer, i.second);
            }
            break;
        }
    }
}

string
value_to_msgpack_string(dynamic const& v)
{
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> packer(buffer);
    write_msgpack_value(packer, v);
    return string(buffer.data(), buffer.size());
}

static void
throw_unsupported_msgpack_type(msgpack::type::object_type type)
{
    PATCHWORK_THROW(
        conversion_error()
        << expected_format_info("MessagePack")
        << conversion_message_info(
               "unsupported MessagePack type: "
               + std::to_string(static_cast<int>(type))));
}

static dynamic
read_msgpack_value(msgpack::object const& object)
{
    switch (object.type)
    {
        case msgpack::type::NIL:
            return nil;
        case msgpack::type::BOOLEAN:
            return object.via.boolean;
        case msgpack::type::POSITIVE_INTEGER:
            return uint64_t(object.via.u64);
        case msgpack::type::NEGATIVE_INTEGER:
            return integer(object.via.i64);
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return object.via.f64;
        case msgpack::type::STR:
            return string(object.via.str.ptr, object.via.str.size);
        case msgpack::type::ARRAY: {
            dynamic_array array;
            array.reserve(object.via.array.size);
            for (uint32_t i = 0; i != object.via.array.size; ++i)
                array.push_back(read_msgpack_value(object.via.array.ptr[i]));
            return array;
        }
        case msgpack::type::MAP: {
            dynamic_map map;
            for (uint32_t i = 0; i != object.via.map.size; ++i)
            {
                auto const& pair = object.via.map.ptr[i];
                map[read_msgpack_value(pair.key)]
                    = read_msgpack_value(pair.val);
            }
            return map;
        }
        default:
            throw_unsupported_msgpack_type(object.type);
            return nil;
    }
}

dynamic
parse_msgpack_value(uint8_t const* data, size_t size)
{
    msgpack::object_handle handle;
    try
    {
        size_t offset = 0;
        handle = msgpack::unpack(
            reinterpret_cast<char const*>(data), size, offset);
        if (offset != size)
        {
            PATCHWORK_THROW(
                conversion_error()
                << expected_format_info("MessagePack")
                << parsing_error_info("trailing bytes after value"));
        }
    }
    catch (msgpack::unpack_error& e)
    {
        PATCHWORK_THROW(
            conversion_error() << expected_format_info("MessagePack")
                               << parsing_error_info(e.what()));
    }
    return read_msgpack_value(handle.get());
}

dynamic
parse_msgpack_value(string const& msgpack)
{
    return parse_msgpack_value(
        reinterpret_cast<uint8_t const*>(msgpack.data()), msgpack.size());
}

} // namespace patchwork
