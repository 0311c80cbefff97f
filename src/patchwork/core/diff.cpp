#include <patchwork/core/diff.hpp>

#include <cmath>

#include <fmt/format.h>

namespace patchwork {

void
throw_unknown_path(value_path const& path, string const& message)
{
    PATCHWORK_THROW(
        unknown_path_error() << patch_path_info(path)
                             << path_error_message_info(message));
}

void
add_patch_path_element(boost::exception& e, path_segment const& segment)
{
    value_path const* existing = get_error_info<patch_path_info>(e);
    value_path path
        = existing ? prepend_path(segment, *existing) : value_path(segment);
    e << patch_path_info(path);
}

patch
strip_root_entry(patch const& p)
{
    patch stripped(p.type_name(), accept_all_validator(), p.encoding());
    for (auto const& entry : p)
    {
        if (!entry.first.is_root())
            stripped.add(entry.first, entry.second);
    }
    return stripped;
}

void
reject_patch_entry(value_path const& path, string const& message)
{
    PATCHWORK_THROW(
        validation_error() << patch_path_info(path)
                           << validation_message_info(message));
}

// LEAVES

namespace {

template<class T>
bool
leaf_values_equal(T const& a, T const& b)
{
    return a == b;
}

// NaNs are considered equal to each other so that diffing a value against
// itself always produces an empty patch.
bool
leaf_values_equal(float a, float b)
{
    return a == b || (std::isnan(a) && std::isnan(b));
}
bool
leaf_values_equal(double a, double b)
{
    return a == b || (std::isnan(a) && std::isnan(b));
}

template<class T>
void
diff_leaf_values(patch* p, T const& a, T const& b)
{
    if (!leaf_values_equal(a, b))
        p->add(value_path(), encode_value(p->encoding(), b));
}

template<class T>
void
patch_leaf_value(T* x, patch const& p)
{
    for (auto const& entry : p)
    {
        if (!entry.first.is_root())
        {
            throw_unknown_path(
                entry.first, "path extends below a leaf value");
        }
        apply_whole_value(x, entry.second);
    }
}

template<class T>
void
check_leaf_entry(
    value_path const& path, size_t depth, patch_action const& action)
{
    if (depth != path.depth())
    {
        reject_patch_entry(
            path,
            fmt::format(
                "path extends {} segment(s) below a {} value",
                path.depth() - depth,
                patch_type_info_query<T>::name()));
        return;
    }
    check_whole_value_entry<T>(path, action);
}

} // namespace

#define PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(T, type_name)                   \
    void diff_values(patch* p, T const& a, T const& b)                        \
    {                                                                         \
        diff_leaf_values(p, a, b);                                            \
    }                                                                         \
                                                                              \
    void patch_value(T* x, patch const& p)                                    \
    {                                                                         \
        patch_leaf_value(x, p);                                               \
    }                                                                         \
                                                                              \
    string patch_type_info_query<T>::name()                                   \
    {                                                                         \
        return type_name;                                                     \
    }                                                                         \
                                                                              \
    void patch_type_info_query<T>::check(                                     \
        value_path const& path, size_t depth, patch_action const& action)     \
    {                                                                         \
        check_leaf_entry<T>(path, depth, action);                             \
    }

PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(bool, "bool")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(char, "char")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(signed char, "signed char")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(unsigned char, "unsigned char")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(signed short, "short")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(unsigned short, "unsigned short")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(signed int, "int")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(unsigned int, "unsigned int")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(signed long, "long")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(unsigned long, "unsigned long")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(signed long long, "long long")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(unsigned long long, "unsigned long long")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(float, "float")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(double, "double")
PATCHWORK_DEFINE_LEAF_PATCH_INTERFACE(string, "string")

// MAP KEYS

bool
to_path_segment(path_segment* segment, string const& key)
{
    *segment = path_segment::field(key);
    return true;
}

bool
from_path_segment(string* key, path_segment const& segment)
{
    if (segment.kind != path_segment_kind::FIELD)
        return false;
    *key = segment.name;
    return true;
}

bool
to_path_segment(path_segment* segment, dynamic const& key)
{
    switch (key.type())
    {
        case value_type::STRING:
            *segment = path_segment::field(cast<string>(key));
            return true;
        case value_type::INTEGER: {
            integer i = cast<integer>(key);
            if (i < 0)
                return false;
            *segment = path_segment::at(static_cast<size_t>(i));
            return true;
        }
        case value_type::UNSIGNED:
            *segment = path_segment::at(cast<uint64_t>(key));
            return true;
        default:
            return false;
    }
}

bool
from_path_segment(dynamic* key, path_segment const& segment)
{
    switch (segment.kind)
    {
        case path_segment_kind::FIELD:
            *key = dynamic(segment.name);
            return true;
        case path_segment_kind::INDEX:
            *key = dynamic(uint64_t(segment.index));
            return true;
        default:
            return false;
    }
}

// DYNAMIC

static bool
keys_are_addressable(dynamic_map const& map)
{
    path_segment segment;
    for (auto const& i : map)
    {
        if (!to_path_segment(&segment, i.first))
            return false;
    }
    return true;
}

void
diff_values(patch* p, dynamic const& a, dynamic const& b)
{
    if (a == b)
        return;
    if (a.type() == value_type::MAP && b.type() == value_type::MAP)
    {
        auto const& a_map = cast<dynamic_map>(a);
        auto const& b_map = cast<dynamic_map>(b);
        if (keys_are_addressable(a_map) && keys_are_addressable(b_map))
        {
            diff_maps(p, a_map, b_map);
            return;
        }
    }
    if (a.type() == value_type::ARRAY && b.type() == value_type::ARRAY)
    {
        diff_sequences(p, cast<dynamic_array>(a), cast<dynamic_array>(b));
        return;
    }
    p->add(value_path(), encode_dynamic(p->encoding(), b));
}

void
patch_value(dynamic* x, patch const& p)
{
    optional<patch_action> whole;
    std::map<path_segment, patch> children;
    split_patch(&whole, &children, p);
    if (whole)
        apply_whole_value(x, *whole);
    if (children.empty())
        return;
    switch (x->type())
    {
        case value_type::MAP:
            patch_map_elements(&cast<dynamic_map>(*x), children);
            break;
        case value_type::ARRAY:
            patch_sequence_elements(&cast<dynamic_array>(*x), children);
            break;
        default:
            throw_unknown_path(
                value_path(children.begin()->first),
                "a dynamic " + boost::lexical_cast<string>(x->type())
                    + " value has no elements");
    }
}

string
patch_type_info_query<dynamic>::name()
{
    return "dynamic";
}

void
patch_type_info_query<dynamic>::check(
    value_path const& path, size_t depth, patch_action const& action)
{
    // The structure below a dynamic value isn't known until the patch is
    // applied, so deeper entries are always accepted.
    if (depth == path.depth())
        check_whole_value_entry<dynamic>(path, action);
}

} // namespace patchwork
