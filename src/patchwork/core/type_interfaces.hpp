#ifndef PATCHWORK_CORE_TYPE_INTERFACES_HPP
#define PATCHWORK_CORE_TYPE_INTERFACES_HPP

#include <array>
#include <map>
#include <type_traits>
#include <vector>

#include <patchwork/core/dynamic.hpp>

// This file provides the dynamic conversion interface (to_dynamic and
// from_dynamic) for all the core types that patchwork can diff.

namespace patchwork {

// NIL

// Note that we don't have to do anything here because callers of to_dynamic
// are required to provide a default-constructed dynamic, which is already nil.
inline void
to_dynamic(dynamic*, nil_t)
{
}

inline void
from_dynamic(nil_t*, dynamic const& v)
{
    check_type(value_type::NIL, v.type());
}

// BOOL

void
to_dynamic(dynamic* v, bool x);

void
from_dynamic(bool* x, dynamic const& v);

// CHAR - Characters are stored as single-character strings.

void
to_dynamic(dynamic* v, char x);

void
from_dynamic(char* x, dynamic const& v);

// INTEGERS AND FLOATS

#define PATCHWORK_DECLARE_NUMBER_INTERFACE(T)                                 \
    void to_dynamic(dynamic* v, T x);                                         \
                                                                              \
    void from_dynamic(T* x, dynamic const& v);

PATCHWORK_DECLARE_NUMBER_INTERFACE(signed char)
PATCHWORK_DECLARE_NUMBER_INTERFACE(unsigned char)
PATCHWORK_DECLARE_NUMBER_INTERFACE(signed short)
PATCHWORK_DECLARE_NUMBER_INTERFACE(unsigned short)
PATCHWORK_DECLARE_NUMBER_INTERFACE(signed int)
PATCHWORK_DECLARE_NUMBER_INTERFACE(unsigned int)
PATCHWORK_DECLARE_NUMBER_INTERFACE(signed long)
PATCHWORK_DECLARE_NUMBER_INTERFACE(unsigned long)
PATCHWORK_DECLARE_NUMBER_INTERFACE(signed long long)
PATCHWORK_DECLARE_NUMBER_INTERFACE(unsigned long long)
PATCHWORK_DECLARE_NUMBER_INTERFACE(float)
PATCHWORK_DECLARE_NUMBER_INTERFACE(double)

// STRING

void
to_dynamic(dynamic* v, string const& x);

void
from_dynamic(string* x, dynamic const& v);

// STD::VECTOR

template<class T>
void
to_dynamic(dynamic* v, std::vector<T> const& x)
{
    dynamic_array array;
    size_t n_elements = x.size();
    array.resize(n_elements);
    for (size_t i = 0; i != n_elements; ++i)
    {
        to_dynamic(&array[i], x[i]);
    }
    *v = std::move(array);
}

template<class T>
void
from_dynamic(std::vector<T>* x, dynamic const& v)
{
    // Certain ways of encoding values (e.g., JSON) have the same
    // representation for empty arrays and empty maps, so if we encounter an
    // empty map here, we should treat it as an empty array.
    if (v.type() == value_type::MAP && cast<dynamic_map>(v).empty())
    {
        x->clear();
        return;
    }

    dynamic_array const& array = cast<dynamic_array>(v);
    size_t n_elements = array.size();
    std::vector<T> result(n_elements);
    for (size_t i = 0; i != n_elements; ++i)
    {
        try
        {
            from_dynamic(&result[i], array[i]);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, integer(i));
            throw;
        }
    }
    *x = std::move(result);
}

// STD::ARRAY

// Check that an array size matches an expected size.
void
check_array_size(size_t expected_size, size_t actual_size);

// If the above check fails, it throws this exception.
PATCHWORK_DEFINE_EXCEPTION(array_size_mismatch)
PATCHWORK_DEFINE_ERROR_INFO(size_t, expected_size)
PATCHWORK_DEFINE_ERROR_INFO(size_t, actual_size)

template<class T, size_t N>
void
to_dynamic(dynamic* v, std::array<T, N> const& x)
{
    dynamic_array l;
    l.resize(N);
    for (size_t i = 0; i != N; ++i)
    {
        to_dynamic(&l[i], x[i]);
    }
    *v = std::move(l);
}

template<class T, size_t N>
void
from_dynamic(std::array<T, N>* x, dynamic const& v)
{
    if (N == 0)
    {
        // See the note on empty maps in the std::vector version.
        if (v.type() == value_type::MAP && cast<dynamic_map>(v).empty())
        {
            return;
        }
    }

    dynamic_array const& l = cast<dynamic_array>(v);
    check_array_size(N, l.size());
    for (size_t i = 0; i != N; ++i)
    {
        try
        {
            from_dynamic(&(*x)[i], l[i]);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, integer(i));
            throw;
        }
    }
}

// STD::MAP

template<class Key, class Value>
void
to_dynamic(dynamic* v, std::map<Key, Value> const& x)
{
    dynamic_map map;
    for (auto const& i : x)
        to_dynamic(&map[to_dynamic(i.first)], i.second);
    *v = std::move(map);
}

template<class Key, class Value>
void
from_dynamic(std::map<Key, Value>* x, dynamic const& v)
{
    // See the note on empty maps in the std::vector version.
    if (v.type() == value_type::ARRAY && cast<dynamic_array>(v).empty())
    {
        x->clear();
        return;
    }

    dynamic_map const& map = cast<dynamic_map>(v);
    std::map<Key, Value> result;
    for (auto const& i : map)
    {
        try
        {
            from_dynamic(&result[from_dynamic<Key>(i.first)], i.second);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, i.first);
            throw;
        }
    }
    *x = std::move(result);
}

// OPTIONAL - An empty optional is stored as nil. An engaged one is stored
// exactly as its value would be, unless that value can itself be nil. In
// that case, it's wrapped in a map with the single key "some" so that an
// engaged optional holding an empty value is distinguishable from an empty
// optional.

// is_nullable<T>::value is true if T can be stored as nil.
template<class T>
struct is_nullable : std::false_type
{
};
template<class T>
struct is_nullable<optional<T>> : std::true_type
{
};
template<>
struct is_nullable<dynamic> : std::true_type
{
};
template<>
struct is_nullable<nil_t> : std::true_type
{
};

template<class T>
void
to_dynamic(dynamic* v, optional<T> const& x)
{
    if (!x)
    {
        *v = nil;
    }
    else if (is_nullable<T>::value)
    {
        dynamic_map map;
        to_dynamic(&map[dynamic("some")], *x);
        *v = std::move(map);
    }
    else
    {
        to_dynamic(v, *x);
    }
}

template<class T>
void
from_dynamic(optional<T>* x, dynamic const& v)
{
    if (v.type() == value_type::NIL)
    {
        *x = none;
        return;
    }
    T t;
    if (is_nullable<T>::value)
    {
        dynamic_map const& map = cast<dynamic_map>(v);
        if (map.size() != 1 || map.begin()->first != dynamic("some"))
        {
            PATCHWORK_THROW(
                conversion_error() << conversion_message_info(
                    "expected a map with the single key 'some'"));
        }
        try
        {
            from_dynamic(&t, map.begin()->second);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, "some");
            throw;
        }
    }
    else
    {
        from_dynamic(&t, v);
    }
    *x = std::move(t);
}

} // namespace patchwork

#endif
