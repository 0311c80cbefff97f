#ifndef PATCHWORK_CORE_EXCEPTION_HPP
#define PATCHWORK_CORE_EXCEPTION_HPP

#include <patchwork/core/type_definitions.hpp>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

namespace patchwork {

// The following macros are simple wrappers around Boost.Exception to codify
// how that library should be used within patchwork.

#define PATCHWORK_DEFINE_EXCEPTION(id)                                        \
    struct id : virtual boost::exception, virtual std::exception              \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

#define PATCHWORK_DEFINE_ERROR_INFO(T, id)                                    \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

PATCHWORK_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

#define PATCHWORK_THROW(x)                                                    \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// get_required_error_info is just like get_error_info except that it requires
// the info to be present and returns a const reference to it. If the info is
// missing, it throws its own exception.
PATCHWORK_DEFINE_EXCEPTION(missing_error_info)
PATCHWORK_DEFINE_ERROR_INFO(string, error_info_id)
PATCHWORK_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)
template<class ErrorInfo, class Exception>
typename ErrorInfo::error_info::value_type const&
get_required_error_info(Exception const& e)
{
    typename ErrorInfo::error_info::value_type const* info
        = get_error_info<ErrorInfo>(e);
    if (!info)
    {
        PATCHWORK_THROW(
            missing_error_info()
            << error_info_id_info(typeid(ErrorInfo).name())
            << wrapped_exception_diagnostics_info(
                   boost::diagnostic_information(e)));
    }
    return *info;
}

// If a simple parsing operation fails, this exception can be thrown.
PATCHWORK_DEFINE_EXCEPTION(parsing_error)
PATCHWORK_DEFINE_ERROR_INFO(string, expected_format)
PATCHWORK_DEFINE_ERROR_INFO(string, parsed_text)
PATCHWORK_DEFINE_ERROR_INFO(string, parsing_error)

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
PATCHWORK_DEFINE_EXCEPTION(invalid_enum_value)
PATCHWORK_DEFINE_ERROR_INFO(string, enum_id)
PATCHWORK_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when attempting to convert a string value to
// an enum and the string doesn't match any of the enum's cases.
PATCHWORK_DEFINE_EXCEPTION(invalid_enum_string)
// Note that this also uses the enum_id info declared above.
PATCHWORK_DEFINE_ERROR_INFO(string, enum_string)

// conversion_error is thrown when a value can't be converted between its
// native form and the form in which it's stored in a patch (e.g., an integer
// that doesn't fit in the storage range, or malformed encoded bytes).
PATCHWORK_DEFINE_EXCEPTION(conversion_error)
PATCHWORK_DEFINE_ERROR_INFO(string, conversion_message)

// If an error occurs internally within a library that provides its own
// error messages, this is used to convey that message.
PATCHWORK_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace patchwork

#endif
