#include <patchwork/core/type_interfaces.hpp>

#include <cmath>
#include <limits>

#include <patchwork/core/testing.hpp>

using namespace patchwork;

// Test that a value can be converted to its expected dynamic form and back.
template<class T>
void
test_dynamic_conversion(T const& x, dynamic const& expected)
{
    auto v = to_dynamic(x);
    REQUIRE(v == expected);
    REQUIRE(from_dynamic<T>(v) == x);
}

TEST_CASE("nil type interface", "[core][types]")
{
    REQUIRE(to_dynamic(nil) == dynamic());
    REQUIRE_NOTHROW(from_dynamic<nil_t>(dynamic()));
    REQUIRE_THROWS_AS(from_dynamic<nil_t>(dynamic(false)), type_mismatch);
}

TEST_CASE("bool type interface", "[core][types]")
{
    test_dynamic_conversion(false, dynamic(false));
    test_dynamic_conversion(true, dynamic(true));
    REQUIRE_THROWS_AS(
        from_dynamic<bool>(dynamic(integer(1))), type_mismatch);
}

TEST_CASE("char type interface", "[core][types]")
{
    test_dynamic_conversion('q', dynamic("q"));
    REQUIRE_THROWS_AS(from_dynamic<char>(dynamic("qq")), conversion_error);
    REQUIRE_THROWS_AS(from_dynamic<char>(dynamic("")), conversion_error);
}

template<class Integer>
void
test_integer_interface()
{
    test_dynamic_conversion(Integer(0), dynamic(integer(0)));
    test_dynamic_conversion(Integer(1), dynamic(integer(1)));

    // Integral floats are accepted.
    REQUIRE(from_dynamic<Integer>(dynamic(2.)) == Integer(2));
    REQUIRE_THROWS_AS(from_dynamic<Integer>(dynamic(2.5)), conversion_error);

    REQUIRE_THROWS_AS(
        from_dynamic<Integer>(dynamic(string("1"))), type_mismatch);
}

TEST_CASE("integer type interfaces", "[core][types]")
{
    test_integer_interface<signed char>();
    test_integer_interface<unsigned char>();
    test_integer_interface<signed short>();
    test_integer_interface<unsigned short>();
    test_integer_interface<signed int>();
    test_integer_interface<unsigned int>();
    test_integer_interface<signed long>();
    test_integer_interface<unsigned long>();
    test_integer_interface<signed long long>();
    test_integer_interface<unsigned long long>();
}

TEST_CASE("integer range checking", "[core][types]")
{
    REQUIRE_THROWS_AS(
        from_dynamic<unsigned char>(dynamic(integer(256))), conversion_error);
    REQUIRE_THROWS_AS(
        from_dynamic<unsigned int>(dynamic(integer(-1))), conversion_error);
    test_dynamic_conversion(
        std::numeric_limits<int64_t>::min(),
        dynamic(std::numeric_limits<integer>::min()));

    // The full unsigned range is representable.
    uint64_t const max = std::numeric_limits<uint64_t>::max();
    test_dynamic_conversion(max, dynamic(max));
    REQUIRE(to_dynamic(max).type() == value_type::UNSIGNED);
    test_dynamic_conversion(
        static_cast<unsigned long long>(max), dynamic(max));
    test_dynamic_conversion(uint64_t(12), dynamic(integer(12)));
    REQUIRE_THROWS_AS(from_dynamic<integer>(dynamic(max)), conversion_error);
    REQUIRE_THROWS_AS(
        from_dynamic<unsigned int>(dynamic(max)), conversion_error);
    REQUIRE(from_dynamic<double>(dynamic(max)) == double(max));
}

template<class Float>
void
test_float_interface()
{
    test_dynamic_conversion(Float(0.5), dynamic(0.5));
    test_dynamic_conversion(Float(1.5), dynamic(1.5));

    // Integers are accepted.
    REQUIRE(from_dynamic<Float>(dynamic(integer(3))) == Float(3));
}

TEST_CASE("floating point type interfaces", "[core][types]")
{
    test_float_interface<float>();
    test_float_interface<double>();
}

TEST_CASE("float range checking", "[core][types]")
{
    REQUIRE_THROWS_AS(from_dynamic<float>(dynamic(1e300)), conversion_error);
    REQUIRE_THROWS_AS(from_dynamic<float>(dynamic(-1e300)), conversion_error);
    REQUIRE(from_dynamic<float>(dynamic(1e30)) == float(1e30));

    // Non-finite values pass through.
    REQUIRE(
        from_dynamic<float>(dynamic(std::numeric_limits<double>::infinity()))
        == std::numeric_limits<float>::infinity());
    REQUIRE(std::isnan(from_dynamic<float>(
        dynamic(std::numeric_limits<double>::quiet_NaN()))));
}

TEST_CASE("string type interface", "[core][types]")
{
    test_dynamic_conversion(string("hello"), dynamic("hello"));
    test_dynamic_conversion(string(), dynamic(""));
}

TEST_CASE("optional type interface", "[core][types]")
{
    test_dynamic_conversion(some(string("hello")), dynamic("hello"));
    test_dynamic_conversion(optional<string>(), dynamic());

    // Values of the wrong type are still errors.
    REQUIRE_THROWS_AS(
        from_dynamic<optional<string>>(dynamic(integer(0))), type_mismatch);

    // Values that can be nil themselves are wrapped.
    typedef optional<optional<int>> nested;
    test_dynamic_conversion(nested(), dynamic());
    test_dynamic_conversion(
        nested(optional<int>()), dynamic{{"some", nil}});
    test_dynamic_conversion(
        nested(optional<int>(2)), dynamic{{"some", 2}});
    test_dynamic_conversion(
        optional<dynamic>(dynamic()), dynamic{{"some", nil}});
    test_dynamic_conversion(
        optional<dynamic>(dynamic{{"some", 1}}),
        dynamic{{"some", dynamic{{"some", 1}}}});

    REQUIRE_THROWS_AS(from_dynamic<nested>(dynamic(2)), type_mismatch);
    REQUIRE_THROWS_AS(
        from_dynamic<nested>(dynamic{{"other", 2}}), conversion_error);
    try
    {
        from_dynamic<nested>(dynamic{{"some", "x"}});
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>{dynamic("some")});
    }
}

TEST_CASE("vector type interface", "[core][types]")
{
    test_dynamic_conversion(
        std::vector<int>({0, 1}),
        dynamic({dynamic(integer(0)), dynamic(integer(1))}));
    test_dynamic_conversion(std::vector<int>(), dynamic(dynamic_array()));

    try
    {
        from_dynamic<std::vector<int>>(
            dynamic({dynamic(integer(0)), dynamic("one")}));
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>{dynamic(integer(1))});
    }
}

TEST_CASE("array type interface", "[core][types]")
{
    test_dynamic_conversion(
        std::array<int, 2>{{3, 4}},
        dynamic({dynamic(integer(3)), dynamic(integer(4))}));

    try
    {
        from_dynamic<std::array<int, 2>>(dynamic({dynamic(integer(3))}));
        FAIL("no exception thrown");
    }
    catch (array_size_mismatch& e)
    {
        REQUIRE(get_required_error_info<expected_size_info>(e) == 2u);
        REQUIRE(get_required_error_info<actual_size_info>(e) == 1u);
    }
}

TEST_CASE("map type interface", "[core][types]")
{
    test_dynamic_conversion(std::map<int, int>(), dynamic(dynamic_map()));

    test_dynamic_conversion(
        std::map<int, int>({{0, 1}, {1, 2}}),
        dynamic(dynamic_map(
            {{dynamic(integer(0)), dynamic(integer(1))},
             {dynamic(integer(1)), dynamic(integer(2))}})));

    test_dynamic_conversion(
        std::map<string, double>({{"a", 1.5}}),
        dynamic(dynamic_map({{dynamic("a"), dynamic(1.5)}})));

    try
    {
        from_dynamic<std::map<string, int>>(
            dynamic(dynamic_map({{dynamic("a"), dynamic(false)}})));
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>{dynamic("a")});
    }
}
