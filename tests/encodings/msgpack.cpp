#include <patchwork/encodings/msgpack.hpp>

#include <cstring>
#include <limits>

#include <patchwork/core/testing.hpp>
#include <patchwork/encodings/json.hpp>

using namespace patchwork;

// Test that some MessagePack data can be translated to and from its expected
// dynamic form.
static void
test_msgpack_encoding(
    std::vector<uint8_t> const& msgpack, dynamic const& expected_value)
{
    // Parse it and check that it matches.
    auto converted_value = parse_msgpack_value(msgpack.data(), msgpack.size());
    REQUIRE(converted_value == expected_value);

    // Also try parsing it as a string.
    auto string_converted_value = parse_msgpack_value(std::string(
        reinterpret_cast<char const*>(msgpack.data()),
        reinterpret_cast<char const*>(msgpack.data()) + msgpack.size()));
    REQUIRE(string_converted_value == expected_value);

    // Convert it back to MessagePack and check that that matches the original.
    auto converted_msgpack = value_to_msgpack_string(converted_value);
    REQUIRE(converted_msgpack.size() == msgpack.size());
    REQUIRE(
        std::memcmp(converted_msgpack.data(), msgpack.data(), msgpack.size())
        == 0);
}

TEST_CASE("basic msgpack encoding", "[encodings][msgpack]")
{
    test_msgpack_encoding({0xc0}, nil);
    test_msgpack_encoding({0xc3}, true);
    test_msgpack_encoding({0xc2}, false);
    test_msgpack_encoding({0x01}, integer(1));
    test_msgpack_encoding({0xff}, integer(-1));
    test_msgpack_encoding({0xcd, 0x10, 0x00}, integer(4096));
    test_msgpack_encoding({0xd0, 0xc4}, integer(-60));
    test_msgpack_encoding(
        {0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff},
        std::numeric_limits<uint64_t>::max());
    test_msgpack_encoding(
        {0xcf, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        uint64_t(1) << 63);
    test_msgpack_encoding(
        {0xcb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}, 1.5);
    test_msgpack_encoding({0xa2, 'h', 'i'}, "hi");
    test_msgpack_encoding(
        {0x92, 0x01, 0x02}, dynamic({integer(1), integer(2)}));
    test_msgpack_encoding({0x90}, dynamic_array());
    test_msgpack_encoding({0x80}, dynamic_map());
}

TEST_CASE("msgpack maps", "[encodings][msgpack]")
{
    // MessagePack maps can have keys of any type.
    test_msgpack_encoding(
        {0x82, 0xa1, 'a', 0xc0, 0xa1, 'b', 0xc3},
        {{"a", nil}, {"b", true}});
    test_msgpack_encoding(
        {0x82, 0xc2, 0xa1, 'n', 0xc3, 0xa1, 'y'},
        dynamic_map({{false, "n"}, {true, "y"}}));
}

TEST_CASE("msgpack and JSON agree", "[encodings][msgpack]")
{
    auto value = parse_json_value(
        R"(
            {
                "alpha": null,
                "beta": [ -60, 4096 ],
                "gamma": [ -1.5, 12.5 ],
                "delta": "foo",
                "epsilon": {
                    "a": null,
                    "b": true
                },
                "zeta": {
                    "$map": [
                        {
                            "key": 1,
                            "value": "a"
                        },
                        {
                            "key": 2,
                            "value": "b"
                        }
                    ]
                },
                "eta": 18446744073709551615
            }
        )");
    REQUIRE(
        parse_msgpack_value(value_to_msgpack_string(value)) == value);
}

TEST_CASE("unsupported MessagePack types", "[encodings][msgpack]")
{
    uint8_t msgpack_data[] = {0xd4, 0x02, 0x00};
    try
    {
        parse_msgpack_value(msgpack_data, 3);
        FAIL("no exception thrown");
    }
    catch (conversion_error& e)
    {
        REQUIRE(
            get_required_error_info<expected_format_info>(e) == "MessagePack");
        get_required_error_info<conversion_message_info>(e);
    }
}

TEST_CASE("malformed MessagePack", "[encodings][msgpack]")
{
    {
        uint8_t msgpack_data[] = {0x92, 0x01};
        REQUIRE_THROWS_AS(
            parse_msgpack_value(msgpack_data, 2), conversion_error);
    }
    {
        uint8_t msgpack_data[] = {0xc1};
        REQUIRE_THROWS_AS(
            parse_msgpack_value(msgpack_data, 1), conversion_error);
    }
    {
        uint8_t msgpack_data[] = {0xc0, 0xc0};
        try
        {
            parse_msgpack_value(msgpack_data, 2);
            FAIL("no exception thrown");
        }
        catch (conversion_error& e)
        {
            REQUIRE(
                get_required_error_info<parsing_error_info>(e)
                == "trailing bytes after value");
        }
    }
}
