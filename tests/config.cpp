#include <patchwork/config.hpp>

#include <patchwork/core/logging.hpp>
#include <patchwork/core/testing.hpp>
#include <patchwork/fs/file_io.hpp>

using namespace patchwork;

namespace {

// Restore the process-wide settings when a test is done with them.
struct settings_restorer
{
    ~settings_restorer()
    {
        set_default_encoding(value_encoding::JSON);
        get_logger()->set_level(spdlog::level::warn);
    }
};

patchwork_config
make_config(optional<string> encoding, optional<string> log_level)
{
    patchwork_config config;
    config.encoding = encoding;
    config.log_level = log_level;
    return config;
}

} // namespace

TEST_CASE("config parsing", "[config]")
{
    REQUIRE(
        parse_config(R"({"encoding": "msgpack", "log_level": "debug"})")
        == make_config(string("msgpack"), string("debug")));
    REQUIRE(
        parse_config(R"({"log_level": "info"})")
        == make_config(none, string("info")));
    REQUIRE(parse_config("{}") == make_config(none, none));

    try
    {
        parse_config(R"({"encoding": 1})");
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<dynamic_value_path_info>(e)
            == std::list<dynamic>{dynamic("encoding")});
    }

    REQUIRE_THROWS_AS(parse_config("[1, 2]"), type_mismatch);
    REQUIRE_THROWS_AS(parse_config("{"), conversion_error);
}

TEST_CASE("config files", "[config]")
{
    auto path = file_path("patchwork_config.json");
    dump_string_to_file(path, R"({"encoding": "json"})");
    REQUIRE(read_config_file(path) == make_config(string("json"), none));

    dump_string_to_file(path, R"({"encoding": false})");
    try
    {
        read_config_file(path);
        FAIL("no exception thrown");
    }
    catch (type_mismatch& e)
    {
        REQUIRE(get_required_error_info<file_path_info>(e) == path);
    }

    REQUIRE_THROWS_AS(
        read_config_file(file_path("no_such_config.json")), open_file_error);
}

TEST_CASE("config application", "[config]")
{
    settings_restorer restorer;

    apply_config(make_config(string("msgpack"), string("debug")));
    REQUIRE(get_default_encoding() == value_encoding::MSGPACK);
    REQUIRE(get_logger()->level() == spdlog::level::debug);
    REQUIRE(diff(1, 2).encoding() == value_encoding::MSGPACK);

    // Omitted settings are left alone.
    apply_config(make_config(none, none));
    REQUIRE(get_default_encoding() == value_encoding::MSGPACK);
    REQUIRE(get_logger()->level() == spdlog::level::debug);

    apply_config(make_config(string("json"), string("off")));
    REQUIRE(get_default_encoding() == value_encoding::JSON);
    REQUIRE(get_logger()->level() == spdlog::level::off);

    // An invalid setting changes nothing.
    REQUIRE_THROWS_AS(
        apply_config(make_config(string("xml"), string("info"))),
        invalid_enum_string);
    REQUIRE(get_default_encoding() == value_encoding::JSON);
    REQUIRE(get_logger()->level() == spdlog::level::off);

    REQUIRE_THROWS_AS(
        apply_config(make_config(string("msgpack"), string("loud"))),
        invalid_enum_string);
    REQUIRE(get_default_encoding() == value_encoding::JSON);
    REQUIRE(get_logger()->level() == spdlog::level::off);
}

TEST_CASE("log levels", "[config]")
{
    settings_restorer restorer;

    REQUIRE(get_logger()->name() == "patchwork");
    REQUIRE(get_logger() == get_logger());

    set_log_level("warning");
    REQUIRE(get_logger()->level() == spdlog::level::warn);
    set_log_level("trace");
    REQUIRE(get_logger()->level() == spdlog::level::trace);

    // Calls are logged at debug level.
    int x = 1;
    apply_patch(&x, diff(1, 2));
    REQUIRE(x == 2);

    try
    {
        set_log_level("verbose");
        FAIL("no exception thrown");
    }
    catch (invalid_enum_string& e)
    {
        REQUIRE(get_required_error_info<enum_id_info>(e) == "log_level");
        REQUIRE(get_required_error_info<enum_string_info>(e) == "verbose");
    }
    REQUIRE(get_logger()->level() == spdlog::level::trace);
}
