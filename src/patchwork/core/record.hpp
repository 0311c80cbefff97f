#ifndef PATCHWORK_CORE_RECORD_HPP
#define PATCHWORK_CORE_RECORD_HPP

#include <type_traits>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>

#include <patchwork/core/diff.hpp>

// Records are structs whose fields are diffed and patched individually.
// A struct becomes a record by defining it with PATCHWORK_DEFINE_RECORD,
// which must be invoked at global scope:
//
//   namespace app {
//   struct point
//   {
//       double x, y;
//       optional<string> label;
//   };
//   }
//   PATCHWORK_DEFINE_RECORD(app::point, (x)(y)(label))
//
// This provides diff/apply support, a validator that knows the record's
// fields, and conversion to/from dynamic (as a map from field names to
// values, in which missing optional fields are treated as empty).

namespace patchwork {

// record_definition<T> describes the fields of the record type T.
// When defined, it provides:
//
//   static string name();
//
//   // Call visitor(field_name, &T::field) for each field in order.
//   template<class Visitor>
//   static void for_each_field(Visitor&& visitor);
//
template<class T>
struct record_definition
{
    static bool const is_defined = false;
};

template<class T>
struct is_record
    : std::integral_constant<bool, record_definition<T>::is_defined>
{
};

#define PATCHWORK_RECORD_FIELD_VISIT(r, type, field)                          \
    visitor(BOOST_PP_STRINGIZE(field), &type::field);

#define PATCHWORK_DEFINE_RECORD(type, fields)                                 \
    namespace patchwork {                                                     \
    template<>                                                                \
    struct record_definition<type>                                            \
    {                                                                         \
        static bool const is_defined = true;                                  \
                                                                              \
        static string                                                         \
        name()                                                                \
        {                                                                     \
            return BOOST_PP_STRINGIZE(type);                                  \
        }                                                                     \
                                                                              \
        template<class Visitor>                                               \
        static void                                                           \
        for_each_field(Visitor&& visitor)                                     \
        {                                                                     \
            BOOST_PP_SEQ_FOR_EACH(PATCHWORK_RECORD_FIELD_VISIT, type, fields) \
        }                                                                     \
    };                                                                        \
    }

namespace detail {

template<class Record, class Field>
void
check_record_field_entry(
    Field Record::*,
    value_path const& path,
    size_t depth,
    patch_action const& action)
{
    patch_type_info_query<Field>::check(path, depth, action);
}

} // namespace detail

// DYNAMIC CONVERSION

template<class Field>
void
read_field_from_record(
    Field* field, dynamic_map const& record, string const& field_name)
{
    auto const& v = get_field(record, field_name);
    try
    {
        from_dynamic(field, v);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, field_name);
        throw;
    }
}

// Optional fields are allowed to be missing.
template<class Field>
void
read_field_from_record(
    optional<Field>* field, dynamic_map const& record, string const& field_name)
{
    dynamic const* v;
    if (!get_field(&v, record, field_name))
    {
        *field = none;
        return;
    }
    try
    {
        from_dynamic(field, *v);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, field_name);
        throw;
    }
}

template<class T>
std::enable_if_t<is_record<T>::value>
to_dynamic(dynamic* v, T const& x)
{
    dynamic_map map;
    record_definition<T>::for_each_field(
        [&](char const* field_name, auto member) {
            to_dynamic(&map[dynamic(field_name)], x.*member);
        });
    *v = std::move(map);
}

template<class T>
std::enable_if_t<is_record<T>::value>
from_dynamic(T* x, dynamic const& v)
{
    dynamic_map const& map = cast<dynamic_map>(v);
    T result;
    record_definition<T>::for_each_field(
        [&](char const* field_name, auto member) {
            read_field_from_record(&(result.*member), map, field_name);
        });
    *x = std::move(result);
}

// DIFF/APPLY

template<class T>
std::enable_if_t<is_record<T>::value>
diff_values(patch* p, T const& a, T const& b)
{
    record_definition<T>::for_each_field(
        [&](char const* field_name, auto member) {
            auto field_patch = diff(a.*member, b.*member, p->encoding());
            if (!field_patch.empty())
                p->merge(path_segment::field(field_name), field_patch);
        });
}

template<class T>
std::enable_if_t<is_record<T>::value>
patch_value(T* x, patch const& p)
{
    optional<patch_action> whole;
    std::map<path_segment, patch> children;
    split_patch(&whole, &children, p);
    if (whole)
        apply_whole_value(x, *whole);
    for (auto const& child : children)
    {
        auto const& segment = child.first;
        bool found = false;
        if (segment.kind == path_segment_kind::FIELD)
        {
            record_definition<T>::for_each_field(
                [&](char const* field_name, auto member) {
                    if (!found && segment.name == field_name)
                    {
                        found = true;
                        detail::apply_child_patch(segment, [&] {
                            patch_value(&(x->*member), child.second);
                        });
                    }
                });
        }
        if (!found)
        {
            throw_unknown_path(
                value_path(segment),
                "no such field in " + record_definition<T>::name());
        }
    }
}

template<class T>
struct patch_type_info_query<T, std::enable_if_t<is_record<T>::value>>
{
    static string
    name()
    {
        return record_definition<T>::name();
    }

    static void
    check(value_path const& path, size_t depth, patch_action const& action)
    {
        if (depth == path.depth())
        {
            check_whole_value_entry<T>(path, action);
            return;
        }
        auto const& segment = path.segments()[depth];
        bool found = false;
        if (segment.kind == path_segment_kind::FIELD)
        {
            record_definition<T>::for_each_field(
                [&](char const* field_name, auto member) {
                    if (!found && segment.name == field_name)
                    {
                        found = true;
                        detail::check_record_field_entry(
                            member, path, depth + 1, action);
                    }
                });
        }
        if (!found)
            reject_patch_entry(path, "no such field in " + name());
    }
};

} // namespace patchwork

#endif
