#ifndef PATCHWORK_CORE_LOGGING_HPP
#define PATCHWORK_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <patchwork/core/type_definitions.hpp>

namespace patchwork {

// Get the logger that patchwork writes to.
// If the host application has already registered a logger named "patchwork",
// that's the one that's used. Otherwise, one is created that writes to
// stderr.
std::shared_ptr<spdlog::logger>
get_logger();

// Set the level of the patchwork logger from its name (e.g., "debug",
// "info", "warning", "off").
// If :level isn't a valid level name, this throws invalid_enum_string.
void
set_log_level(string const& level);

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n" << arg.name << ": " << arg.value;
    return stream;
}

} // namespace detail

// Log a function call (at debug level).
#define PATCHWORK_LOG_CALL(args)                                              \
    {                                                                         \
        auto logger = patchwork::get_logger();                                \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define PATCHWORK_LOG_ARG(arg)                                                \
    patchwork::detail::arg_logger<                                            \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace patchwork

#endif
