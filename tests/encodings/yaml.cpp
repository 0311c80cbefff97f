#include <patchwork/encodings/yaml.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

#include <patchwork/core/testing.hpp>

using namespace patchwork;

static string
strip_whitespace(string s)
{
    s.erase(std::remove_if(s.begin(), s.end(), isspace), s.end());
    return s;
}

// Test that a dynamic value can be translated to the expected YAML.
static void
test_yaml_encoding(dynamic const& value, string const& expected_yaml)
{
    CAPTURE(expected_yaml);

    auto yaml = value_to_diagnostic_yaml(value);
    REQUIRE(strip_whitespace(yaml) == strip_whitespace(expected_yaml));
}

TEST_CASE("basic diagnostic YAML encoding", "[encodings][yaml]")
{
    // Try some basic types.
    test_yaml_encoding(nil, "~");
    test_yaml_encoding(false, "false");
    test_yaml_encoding(true, "true");
    test_yaml_encoding(integer(1), "1");
    test_yaml_encoding(integer(-1), "-1");
    test_yaml_encoding(
        std::numeric_limits<uint64_t>::max(), "18446744073709551615");
    test_yaml_encoding(1.25, "1.25");
    test_yaml_encoding("hi", "hi");

    // Strings that would be read back as something else are quoted.
    test_yaml_encoding("true", R"("true")");
    test_yaml_encoding("null", R"("null")");
    test_yaml_encoding("1.25", R"("1.25")");
    test_yaml_encoding("12", R"("12")");
    test_yaml_encoding("", R"("")");

    // Try some containers.
    test_yaml_encoding(
        dynamic({integer(1), integer(2), integer(3)}),
        R"(
            - 1
            - 2
            - 3
        )");
    test_yaml_encoding(
        {{"happy", true}, {"n", 4.125}},
        R"(
            happy: true
            n: 4.125
        )");
    test_yaml_encoding(
        {{"list", dynamic({integer(1), integer(2)})},
         {"map", {{"a", "x"}}}},
        R"(
            list:
              - 1
              - 2
            map:
              a: x
        )");
}

TEST_CASE("diagnostic YAML abbreviation", "[encodings][yaml]")
{
    dynamic_array big_array(100, dynamic(integer(0)));
    dynamic_map big_map;
    for (integer i = 0; i != 100; ++i)
        big_map[dynamic(i)] = dynamic(i);

    // Large containers are summarized.
    REQUIRE(
        value_to_diagnostic_yaml(dynamic(big_array)).find("size: 100")
        != string::npos);
    REQUIRE(
        value_to_diagnostic_yaml(dynamic(big_map)).find("size: 100")
        != string::npos);
    REQUIRE(
        value_to_diagnostic_yaml(
            dynamic({{"nested", dynamic(big_array)}}))
            .find("size: 100")
        != string::npos);

    // Smaller ones are written out.
    dynamic_array small_array(63, dynamic(integer(0)));
    REQUIRE(
        value_to_diagnostic_yaml(dynamic(small_array)).find("size")
        == string::npos);
}
