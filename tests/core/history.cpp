#include <patchwork/core/history.hpp>

#include <patchwork/core/testing.hpp>

using namespace patchwork;

typedef std::map<string, int> int_map;
typedef std::map<string, string> entry_summary;

TEST_CASE("history updates and reverts", "[core][history]")
{
    history<int_map> h(int_map{{"a", 1}});
    REQUIRE(h.value() == int_map{{"a", 1}});
    REQUIRE(h.depth() == 0);
    REQUIRE_THROWS_AS(h.revert(), empty_history);

    auto forward = h.update(int_map{{"a", 2}, {"b", 3}});
    REQUIRE(summarize_patch(forward) == entry_summary{{"a", "2"}, {"b", "3"}});
    REQUIRE(h.depth() == 1);

    auto undo = h.apply(make_patch<int_map>({{"b", removal}}));
    REQUIRE(h.value() == int_map{{"a", 2}});
    REQUIRE(summarize_patch(undo) == entry_summary{{"b", "3"}});
    REQUIRE(h.depth() == 2);

    auto redo = h.revert();
    REQUIRE(h.value() == (int_map{{"a", 2}, {"b", 3}}));
    REQUIRE(summarize_patch(redo) == entry_summary{{"b", "(removed)"}});
    REQUIRE(h.depth() == 1);

    h.revert();
    REQUIRE(h.value() == int_map{{"a", 1}});
    REQUIRE(h.depth() == 0);
    REQUIRE_THROWS_AS(h.revert(), empty_history);

    // Redo patches can be applied to get back to where we were.
    h.apply(forward);
    h.apply(redo);
    REQUIRE(h.value() == int_map{{"a", 2}});
    REQUIRE(h.depth() == 2);
}

TEST_CASE("no-op history changes", "[core][history]")
{
    history<int_map> h(int_map{{"a", 1}});

    // Changes that don't actually change anything aren't recorded.
    REQUIRE(h.apply(new_patch<int_map>()).empty());
    REQUIRE(h.update(int_map{{"a", 1}}).empty());
    REQUIRE(h.apply(make_patch<int_map>({{"a", 1}})).empty());
    REQUIRE(h.depth() == 0);
}

TEST_CASE("failed history changes", "[core][history]")
{
    history<int_map> h(int_map{{"a", 1}, {"b", 2}});
    h.update(int_map{{"a", 1}});

    // This patch changes 'a' and then fails on 'c', so nothing should change.
    auto p = make_patch<int_map>({{"a", 4}, {"c", removal}});
    try
    {
        h.apply(p);
        FAIL("no exception thrown");
    }
    catch (unknown_path_error& e)
    {
        REQUIRE(to_string(get_required_error_info<patch_path_info>(e)) == "c");
    }
    REQUIRE(h.value() == int_map{{"a", 1}});
    REQUIRE(h.depth() == 1);

    h.revert();
    REQUIRE(h.value() == (int_map{{"a", 1}, {"b", 2}}));
}

TEST_CASE("history encoding", "[core][history]")
{
    history<std::vector<string>> h(
        std::vector<string>{"x"}, value_encoding::MSGPACK);
    auto forward = h.update(std::vector<string>{"x", "y"});
    REQUIRE(forward.encoding() == value_encoding::MSGPACK);
    REQUIRE(summarize_patch(forward) == entry_summary{{"1", "\"y\""}});

    auto redo = h.revert();
    REQUIRE(redo.encoding() == value_encoding::MSGPACK);
    REQUIRE(redo == forward);
    REQUIRE(h.value() == std::vector<string>{"x"});
}
