#include <patchwork/encodings/json.hpp>

#include <cmath>
#include <mutex>

#include <nlohmann/json.hpp>
#include <simdjson.h>

namespace patchwork {

// JSON I/O

// Maps whose keys aren't all strings are written as objects with a single
// member, named by this tag, that holds an array of key/value objects.
// String-keyed maps whose only key is the tag are also written that way so
// that a lone tag member always denotes an encoded map.
static char const map_tag[] = "$map";

static dynamic
read_json_value(simdjson::dom::element const& json);

static void
throw_malformed_json_map(string const& message)
{
    PATCHWORK_THROW(
        conversion_error() << expected_format_info("JSON")
                           << conversion_message_info(
                                  "malformed encoded map: " + message));
}

static dynamic_map
read_encoded_json_map(simdjson::dom::element const& pairs)
{
    if (pairs.type() != simdjson::dom::element_type::ARRAY)
        throw_malformed_json_map("expected an array of key/value pairs");
    dynamic_map map;
    for (auto const& element : simdjson::dom::array(pairs))
    {
        if (element.type() != simdjson::dom::element_type::OBJECT)
            throw_malformed_json_map("expected a key/value object");
        simdjson::dom::object pair = element;
        auto key = pair.at_key("key");
        auto value = pair.at_key("value");
        if (pair.size() != 2 || key.error() == simdjson::NO_SUCH_FIELD
            || value.error() == simdjson::NO_SUCH_FIELD)
        {
            throw_malformed_json_map("expected 'key' and 'value' members");
        }
        map[read_json_value(key.value())] = read_json_value(value.value());
    }
    return map;
}

// Read a JSON value into a dynamic.
static dynamic
read_json_value(simdjson::dom::element const& json)
{
    switch (json.type())
    {
        case simdjson::dom::element_type::NULL_VALUE:
        default: // to avoid warnings
            return nil;
        case simdjson::dom::element_type::BOOL:
            return bool(json);
        case simdjson::dom::element_type::INT64:
            return integer(int64_t(json));
        case simdjson::dom::element_type::UINT64:
            return uint64_t(json);
        case simdjson::dom::element_type::DOUBLE:
            return double(json);
        case simdjson::dom::element_type::STRING:
            return string(json.get_string().value());
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array source = json;
            dynamic_array array;
            array.reserve(source.size());
            for (auto const& i : source)
            {
                array.push_back(read_json_value(i));
            }
            return array;
        }
        case simdjson::dom::element_type::OBJECT: {
            // An object is analogous to a map, but maps with non-string keys
            // are also encoded as JSON objects, so we have to check here if
            // it's actually one of those.
            simdjson::dom::object object = json;
            auto pairs = object.at_key(map_tag);
            if (object.size() == 1 && pairs.error() != simdjson::NO_SUCH_FIELD)
                return read_encoded_json_map(pairs.value());
            dynamic_map map;
            for (auto const& i : object)
            {
                map[string(i.key)] = read_json_value(i.value);
            }
            return map;
        }
    }
}

dynamic
parse_json_value(char const* json, size_t length)
{
    static simdjson::dom::parser the_parser;
    static std::mutex the_mutex;

    std::lock_guard<std::mutex> guard(the_mutex);

    simdjson::dom::element doc;
    try
    {
        doc = the_parser.parse(json, length);
    }
    catch (simdjson::simdjson_error& e)
    {
        PATCHWORK_THROW(
            conversion_error() << expected_format_info("JSON")
                               << parsed_text_info(string(json, json + length))
                               << parsing_error_info(e.what()));
    }
    return read_json_value(doc);
}

// Check if a map can be written directly as a JSON object.
static bool
is_plain_json_object(dynamic_map const& map)
{
    for (auto const& i : map)
    {
        if (i.first.type() != value_type::STRING)
            return false;
    }
    return !(map.size() == 1 && cast<string>(map.begin()->first) == map_tag);
}

static nlohmann::json
to_nlohmann_json(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            return nullptr;
        case value_type::BOOLEAN:
            return cast<bool>(v);
        case value_type::INTEGER:
            return cast<integer>(v);
        case value_type::UNSIGNED:
            return cast<uint64_t>(v);
        case value_type::FLOAT: {
            double d = cast<double>(v);
            // JSON has no representation for these, and nlohmann would
            // silently write them as null.
            if (!std::isfinite(d))
            {
                PATCHWORK_THROW(
                    conversion_error()
                    << expected_format_info("JSON")
                    << conversion_message_info(
                           "non-finite floats can't be written as JSON"));
            }
            return d;
        }
        case value_type::STRING:
            return cast<string>(v);
        case value_type::ARRAY: {
            nlohmann::json json(nlohmann::json::value_t::array);
            for (auto const& i : cast<dynamic_array>(v))
            {
                json.push_back(to_nlohmann_json(i));
            }
            return json;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            if (is_plain_json_object(x))
            {
                nlohmann::json json(nlohmann::json::value_t::object);
                for (auto const& i : x)
                {
                    json[cast<string>(i.first)] = to_nlohmann_json(i.second);
                }
                return json;
            }
            // Otherwise, encode it as a tagged array of key/value pairs.
            else
            {
                nlohmann::json pairs(nlohmann::json::value_t::array);
                for (auto const& i : x)
                {
                    nlohmann::json pair;
                    pair["key"] = to_nlohmann_json(i.first);
                    pair["value"] = to_nlohmann_json(i.second);
                    pairs.push_back(pair);
                }
                nlohmann::json json(nlohmann::json::value_t::object);
                json[map_tag] = std::move(pairs);
                return json;
            }
        }
    }
}

string
value_to_json(dynamic const& v)
{
    return to_nlohmann_json(v).dump();
}

} // namespace patchwork
