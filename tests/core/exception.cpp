#include <patchwork/core/exception.hpp>

#include <patchwork/core/testing.hpp>

using namespace patchwork;

TEST_CASE("error info", "[core][exception]")
{
    conversion_error error;
    error << conversion_message_info("too big");

    REQUIRE(
        get_required_error_info<conversion_message_info>(error) == "too big");

    try
    {
        get_required_error_info<internal_error_message_info>(error);
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        get_required_error_info<error_info_id_info>(e);
        REQUIRE(
            get_required_error_info<wrapped_exception_diagnostics_info>(e)
                .find("too big")
            != string::npos);
    }
}

TEST_CASE("thrown exceptions", "[core][exception]")
{
    try
    {
        PATCHWORK_THROW(
            invalid_enum_string() << enum_id_info("value_encoding")
                                  << enum_string_info("xml"));
        FAIL("no exception thrown");
    }
    catch (invalid_enum_string& e)
    {
        REQUIRE(get_error_info<stacktrace_info>(e) != nullptr);
        string what = e.what();
        REQUIRE(what.find("value_encoding") != string::npos);
        REQUIRE(what.find("xml") != string::npos);
    }
}
