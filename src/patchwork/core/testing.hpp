#ifndef PATCHWORK_CORE_TESTING_HPP
#define PATCHWORK_CORE_TESTING_HPP

#define CATCH_CONFIG_CPP11_NO_NULLPTR
#include <catch2/catch.hpp>

#include <patchwork/core/diff.hpp>

// Catch would otherwise pick up the operator<< that Boost.Optional declares
// only to reject streaming of optionals.
namespace Catch {
template<class T>
struct StringMaker<boost::optional<T>>
{
    static std::string
    convert(boost::optional<T> const& x)
    {
        return x ? "some(" + ::Catch::Detail::stringify(*x) + ")" : "none";
    }
};
} // namespace Catch

namespace patchwork {

// Summarize the entries of a patch as a map from path text to the compact
// JSON of the stored value (or "(removed)" for removals).
inline std::map<string, string>
summarize_patch(patch const& p)
{
    std::map<string, string> summary;
    for (auto const& entry : p)
    {
        summary[to_string(entry.first)]
            = entry.second.op == patch_op::REMOVE
                  ? "(removed)"
                  : render_encoded_value(entry.second.value);
    }
    return summary;
}

// Test that diffing :a against :b produces a patch with the expected entries
// (in both encodings), that applying it to :a yields :b, and that diffing a
// value against itself produces an empty patch.
template<class T>
void
test_diff(T const& a, T const& b, std::map<string, string> const& expected)
{
    for (auto encoding : {value_encoding::JSON, value_encoding::MSGPACK})
    {
        INFO("encoding: " << encoding)

        auto p = diff(a, b, encoding);
        REQUIRE(summarize_patch(p) == expected);
        REQUIRE(p.empty() == expected.empty());

        T x = a;
        apply_patch(&x, p);
        REQUIRE(x == b);

        REQUIRE(diff(a, a, encoding).empty());
        REQUIRE(diff(b, b, encoding).empty());
    }
}

// Test that applying :p to :x fails with an unknown_path_error for
// :expected_path.
template<class T>
void
test_unknown_path(T x, patch const& p, string const& expected_path)
{
    try
    {
        apply_patch(&x, p);
        FAIL("no exception thrown");
    }
    catch (unknown_path_error& e)
    {
        REQUIRE(
            to_string(get_required_error_info<patch_path_info>(e))
            == expected_path);
    }
}

} // namespace patchwork

#endif
