#include <patchwork/core/type_interfaces.hpp>

#include <cmath>
#include <type_traits>

#include <boost/numeric/conversion/cast.hpp>

namespace patchwork {

// BOOL

void
to_dynamic(dynamic* v, bool x)
{
    *v = x;
}

void
from_dynamic(bool* x, dynamic const& v)
{
    *x = cast<bool>(v);
}

// CHAR

void
to_dynamic(dynamic* v, char x)
{
    *v = string(1, x);
}

void
from_dynamic(char* x, dynamic const& v)
{
    string const& s = cast<string>(v);
    if (s.length() != 1)
    {
        PATCHWORK_THROW(
            conversion_error()
            << conversion_message_info("expected a single character")
            << parsed_text_info(s));
    }
    *x = s[0];
}

// NUMBERS

// Convert between numeric types, reporting values that don't fit as
// conversion errors.
template<class To, class From>
static To
checked_numeric_cast(From x)
{
    try
    {
        return boost::numeric_cast<To>(x);
    }
    catch (boost::numeric::bad_numeric_cast& e)
    {
        PATCHWORK_THROW(
            conversion_error() << conversion_message_info(e.what()));
    }
}

// Signed integers are stored as integers. Unsigned ones are stored as
// integers when they fit and as UNSIGNED values otherwise.
template<class T>
static dynamic
integer_to_dynamic(T x)
{
    if (std::is_signed<T>::value)
        return dynamic(integer(x));
    else
        return dynamic(uint64_t(x));
}

#define PATCHWORK_DEFINE_INTEGER_INTERFACE(T)                                 \
    void to_dynamic(dynamic* v, T x)                                          \
    {                                                                         \
        *v = integer_to_dynamic(x);                                           \
    }                                                                         \
    void from_dynamic(T* x, dynamic const& v)                                 \
    {                                                                         \
        switch (v.type())                                                     \
        {                                                                     \
            /* Floats can also be acceptable as integers if they convert      \
             * properly.                                                      \
             */                                                               \
            case value_type::FLOAT: {                                         \
                double d = cast<double>(v);                                   \
                T converted = checked_numeric_cast<T>(d);                     \
                if (double(converted) != d)                                   \
                {                                                             \
                    PATCHWORK_THROW(                                          \
                        conversion_error() << conversion_message_info(        \
                            "float value is not integral"));                  \
                }                                                             \
                *x = converted;                                               \
                break;                                                        \
            }                                                                 \
            case value_type::UNSIGNED:                                        \
                *x = checked_numeric_cast<T>(cast<uint64_t>(v));              \
                break;                                                        \
            default:                                                          \
                *x = checked_numeric_cast<T>(cast<integer>(v));               \
        }                                                                     \
    }

PATCHWORK_DEFINE_INTEGER_INTERFACE(signed char)
PATCHWORK_DEFINE_INTEGER_INTERFACE(unsigned char)
PATCHWORK_DEFINE_INTEGER_INTERFACE(signed short)
PATCHWORK_DEFINE_INTEGER_INTERFACE(unsigned short)
PATCHWORK_DEFINE_INTEGER_INTERFACE(signed int)
PATCHWORK_DEFINE_INTEGER_INTERFACE(unsigned int)
PATCHWORK_DEFINE_INTEGER_INTERFACE(signed long)
PATCHWORK_DEFINE_INTEGER_INTERFACE(unsigned long)
PATCHWORK_DEFINE_INTEGER_INTERFACE(signed long long)
PATCHWORK_DEFINE_INTEGER_INTERFACE(unsigned long long)

// Floats are widened to double for storage. Finite values that are out of
// range for the target type are conversion errors. Infinities and NaNs
// convert as they are.
template<class T>
static T
narrow_float(double d)
{
    if (std::isfinite(d))
        return checked_numeric_cast<T>(d);
    return T(d);
}

#define PATCHWORK_DEFINE_FLOAT_INTERFACE(T)                                   \
    void to_dynamic(dynamic* v, T x)                                          \
    {                                                                         \
        *v = double(x);                                                       \
    }                                                                         \
    void from_dynamic(T* x, dynamic const& v)                                 \
    {                                                                         \
        /* Integers are also acceptable as floats.                            \
         */                                                                   \
        switch (v.type())                                                     \
        {                                                                     \
            case value_type::INTEGER:                                         \
                *x = T(cast<integer>(v));                                     \
                break;                                                        \
            case value_type::UNSIGNED:                                        \
                *x = T(cast<uint64_t>(v));                                    \
                break;                                                        \
            default:                                                          \
                *x = narrow_float<T>(cast<double>(v));                        \
        }                                                                     \
    }

PATCHWORK_DEFINE_FLOAT_INTERFACE(double)
PATCHWORK_DEFINE_FLOAT_INTERFACE(float)

// STRING

void
to_dynamic(dynamic* v, string const& x)
{
    *v = x;
}

void
from_dynamic(string* x, dynamic const& v)
{
    *x = cast<string>(v);
}

// STD::ARRAY

void
check_array_size(size_t expected_size, size_t actual_size)
{
    if (expected_size != actual_size)
    {
        PATCHWORK_THROW(
            array_size_mismatch() << expected_size_info(expected_size)
                                  << actual_size_info(actual_size));
    }
}

} // namespace patchwork
