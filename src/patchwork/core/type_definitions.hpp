#ifndef PATCHWORK_CORE_TYPE_DEFINITIONS_HPP
#define PATCHWORK_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace patchwork {

using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

struct dynamic;

enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    INTEGER, // integer
    // uint64_t - only for unsigned values beyond the range of integer
    UNSIGNED,
    FLOAT, // double
    STRING, // string
    ARRAY, // dynamic_array - array of dynamic values
    MAP, // dynamic_map - collection of dynamic values keyed by dynamic values
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

// Maps are represented as std::maps and can be manipulated as such.
typedef std::map<dynamic, dynamic> dynamic_map;

// dynamic is the run-time representation of values. Every diffable type can
// be converted to and from a dynamic, and the encodings (JSON, MessagePack)
// operate on dynamics, so this is the common currency between the typed
// diff/patch logic and the bytes that are actually stored in a patch.
struct dynamic
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    dynamic()
    {
        set(nil);
    }

    // Construct a dynamic from one of the base types.
    dynamic(nil_t v)
    {
        set(v);
    }
    dynamic(bool v)
    {
        set(v);
    }
    dynamic(integer v)
    {
        set(v);
    }
    dynamic(int v)
    {
        set(integer(v));
    }
    // Unsigned values are stored as integers whenever they fit.
    dynamic(uint64_t v)
    {
        set(v);
    }
    dynamic(double v)
    {
        set(v);
    }
    dynamic(string const& v)
    {
        set(v);
    }
    dynamic(string&& v)
    {
        set(std::move(v));
    }
    dynamic(char const* v)
    {
        set(string(v));
    }
    dynamic(dynamic_array const& v)
    {
        set(v);
    }
    dynamic(dynamic_array&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_map const& v)
    {
        set(v);
    }
    dynamic(dynamic_map&& v)
    {
        set(std::move(v));
    }

    // Construct from an initializer list.
    dynamic(std::initializer_list<dynamic> list);

    // GETTERS

    // Get the type of value stored here.
    value_type
    type() const
    {
        return type_;
    }

    // Get the contents.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any const&
    contents() const&
    {
        return value_;
    }

    // Get a non-const reference to the contents.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any&
    contents() &
    {
        return value_;
    }

 private:
    void
    set(nil_t _);
    void
    set(bool v);
    void
    set(integer v);
    void
    set(uint64_t v);
    void
    set(double v);
    void
    set(string const& v);
    void
    set(string&& v);
    void
    set(dynamic_array const& v);
    void
    set(dynamic_array&& v);
    void
    set(dynamic_map const& v);
    void
    set(dynamic_map&& v);

    friend void
    swap(dynamic& a, dynamic& b);

    value_type type_;
    std::any value_;
};

} // namespace patchwork

#endif
