#include <patchwork/encodings/json.hpp>

#include <cmath>
#include <limits>

#include <patchwork/core/testing.hpp>

using namespace patchwork;

static string
strip_whitespace(string s)
{
    s.erase(std::remove_if(s.begin(), s.end(), isspace), s.end());
    return s;
}

// Test that a JSON string can be translated to and from its expected dynamic
// form.
static void
test_json_encoding(string const& json, dynamic const& expected_value)
{
    CAPTURE(json);

    // Parse it and check that it matches.
    auto converted_value = parse_json_value(json);
    REQUIRE(converted_value == expected_value);

    // Convert it back to JSON and check that that matches the original (modulo
    // whitespace).
    auto converted_json = value_to_json(converted_value);
    REQUIRE(strip_whitespace(converted_json) == strip_whitespace(json));
}

TEST_CASE("basic JSON encoding", "[encodings][json]")
{
    // Try some basic types.
    test_json_encoding(
        R"(
            null
        )",
        nil);
    test_json_encoding(
        R"(
            false
        )",
        false);
    test_json_encoding(
        R"(
            true
        )",
        true);
    test_json_encoding(
        R"(
            1
        )",
        integer(1));
    test_json_encoding(
        R"(
            10737418240
        )",
        integer(10737418240));
    test_json_encoding(
        R"(
            -1
        )",
        integer(-1));
    test_json_encoding(
        R"(
            1.25
        )",
        1.25);
    test_json_encoding(
        R"(
            "hi"
        )",
        "hi");

    // Try some arrays.
    test_json_encoding(
        R"(
            [ 1, 2, 3 ]
        )",
        dynamic({integer(1), integer(2), integer(3)}));
    test_json_encoding(
        R"(
            []
        )",
        dynamic_array());

    // Try a map with string keys.
    test_json_encoding(
        R"(
            {
                "happy": true,
                "n": 4.125
            }
        )",
        {{"happy", true}, {"n", 4.125}});

    // Try a map with non-string keys.
    test_json_encoding(
        R"(
            {
                "$map": [
                    {
                        "key": false,
                        "value": "no"
                    },
                    {
                        "key": true,
                        "value": "yes"
                    }
                ]
            }
        )",
        dynamic_map({{false, "no"}, {true, "yes"}}));

    // Arrays of key/value objects are still arrays.
    test_json_encoding(
        R"(
            [
                {
                    "key": false,
                    "value": "no"
                },
                {
                    "key": true,
                    "value": "yes"
                }
            ]
        )",
        {{{"key", false}, {"value", "no"}}, {{"key", true}, {"value", "yes"}}});

    // A string-keyed map that would look like an encoded map is encoded
    // itself.
    test_json_encoding(
        R"(
            {
                "$map": [
                    {
                        "key": "$map",
                        "value": 1
                    }
                ]
            }
        )",
        {{"$map", 1}});
    test_json_encoding(
        R"(
            {
                "$map": 1,
                "other": 2
            }
        )",
        {{"$map", 1}, {"other", 2}});

    // Try some other JSON that looks like the above.
    test_json_encoding(
        R"(
            [
                {
                    "key": false
                },
                {
                    "key": true
                }
            ]
        )",
        {{{"key", false}}, {{"key", true}}});
    test_json_encoding(
        R"(
            [
                {
                    "key": false,
                    "valu": "no"
                },
                {
                    "key": true,
                    "valu": "yes"
                }
            ]
        )",
        {{{"key", false}, {"valu", "no"}}, {{"key", true}, {"valu", "yes"}}});
    test_json_encoding(
        R"(
            [
                {
                    "ke": false,
                    "value": "no"
                },
                {
                    "ke": true,
                    "value": "yes"
                }
            ]
        )",
        {{{"ke", false}, {"value", "no"}}, {{"ke", true}, {"value", "yes"}}});

    // Try some strings that need escaping.
    test_json_encoding(
        R"(
            "a\"b\\c\n"
        )",
        "a\"b\\c\n");
}

TEST_CASE("JSON unsigned integers", "[encodings][json]")
{
    uint64_t const max = std::numeric_limits<uint64_t>::max();
    test_json_encoding("18446744073709551615", dynamic(max));
    test_json_encoding("9223372036854775808", dynamic(uint64_t(1) << 63));
    REQUIRE(
        parse_json_value("9223372036854775807").type()
        == value_type::INTEGER);
}

TEST_CASE("malformed encoded maps", "[encodings][json]")
{
    REQUIRE_THROWS_AS(parse_json_value(R"({"$map": 1})"), conversion_error);
    REQUIRE_THROWS_AS(parse_json_value(R"({"$map": [1]})"), conversion_error);
    REQUIRE_THROWS_AS(
        parse_json_value(R"({"$map": [{"key": 1}]})"), conversion_error);
    REQUIRE_THROWS_AS(
        parse_json_value(R"({"$map": [{"key": 1, "valu": 2}]})"),
        conversion_error);
}

TEST_CASE("JSON float formatting", "[encodings][json]")
{
    // Integral floats keep their decimal point so that they read back as
    // floats.
    REQUIRE(value_to_json(dynamic(2.)) == "2.0");
    REQUIRE(parse_json_value("2.0").type() == value_type::FLOAT);
    REQUIRE(parse_json_value("2").type() == value_type::INTEGER);
}

TEST_CASE("malformed JSON", "[encodings][json]")
{
    try
    {
        parse_json_value("{ \"a\": ");
        FAIL("no exception thrown");
    }
    catch (conversion_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "JSON");
        REQUIRE(
            get_required_error_info<parsed_text_info>(e) == "{ \"a\": ");
        get_required_error_info<parsing_error_info>(e);
    }
}

TEST_CASE("unrepresentable JSON values", "[encodings][json]")
{
    REQUIRE_THROWS_AS(
        value_to_json(dynamic(std::numeric_limits<double>::quiet_NaN())),
        conversion_error);
    REQUIRE_THROWS_AS(
        value_to_json(dynamic(std::numeric_limits<double>::infinity())),
        conversion_error);
}
