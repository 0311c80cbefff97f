#ifndef PATCHWORK_CORE_DIFF_HPP
#define PATCHWORK_CORE_DIFF_HPP

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <type_traits>

#include <boost/lexical_cast.hpp>

#include <patchwork/core/logging.hpp>
#include <patchwork/core/patch.hpp>

// This file provides the diff/apply machinery: computing the patch that
// transforms one value into another and applying patches to values.
//
// A type T participates by providing the following (all in namespace
// patchwork or T's own namespace):
//
// * diff_values(patch* p, T const& a, T const& b), which stores in *p the
//   entries that transform :a into :b (relative to the location of the
//   value),
//
// * patch_value(T* x, patch const& p), which applies the entries of :p
//   (relative to the location of *x) to *x,
//
// * a specialization of patch_type_info_query<T>, which provides the type's
//   name and checks the entries that are proposed for a patch of that type,
//
// * to_dynamic and from_dynamic, which are used to encode values stored in
//   patches.
//
// All the core types are covered here. Record types are covered by
// record.hpp.

namespace patchwork {

// unknown_path_error is thrown when a patch entry's path doesn't resolve
// within the value that the patch is applied to (or when it asks to remove
// something that can't be removed).
// The error carries the full path of the entry in patch_path_info.
PATCHWORK_DEFINE_EXCEPTION(unknown_path_error)
PATCHWORK_DEFINE_ERROR_INFO(string, path_error_message)

// Throw unknown_path_error for :path (relative to the value that's being
// patched).
void
throw_unknown_path(value_path const& path, string const& message);

// Given an exception :e that's passing up through the element/field
// identified by :segment, this adds :segment to the beginning of :e's
// patch_path_info (or associates a path consisting only of :segment with :e
// if it has none).
void
add_patch_path_element(boost::exception& e, path_segment const& segment);

// Get a copy of :p without its root entry (if any).
patch
strip_root_entry(patch const& p);

// TYPE INFO

template<class T, class Enable = void>
struct patch_type_info_query;

// Reject a proposed patch entry.
void
reject_patch_entry(value_path const& path, string const& message);

// Check a proposed entry that replaces a whole value of type T.
template<class T>
void
check_whole_value_entry(value_path const& path, patch_action const& action)
{
    if (action.op == patch_op::REMOVE)
    {
        reject_patch_entry(
            path,
            "a " + patch_type_info_query<T>::name()
                + " value can't be removed here");
        return;
    }
    try
    {
        T x;
        decode_value(&x, action.value);
    }
    catch (decode_error& e)
    {
        PATCHWORK_THROW(
            validation_error()
            << patch_path_info(path)
            << validation_message_info(
                   "value isn't a valid "
                   + patch_type_info_query<T>::name())
            << wrapped_exception_diagnostics_info(
                   boost::diagnostic_information(e)));
    }
}

// typed_patch_validator<T> checks proposed entries against the structure of
// T.
template<class T>
class typed_patch_validator : public patch_validator
{
 public:
    void
    check(value_path const& path, patch_action const& action) const override
    {
        try
        {
            patch_type_info_query<T>::check(path, 0, action);
        }
        catch (validation_error& e)
        {
            e << patch_type_info(patch_type_info_query<T>::name());
            throw;
        }
    }
};

// Get the validator for T. (This is shared by all patches for T.)
template<class T>
patch_validator_ptr
get_typed_patch_validator()
{
    static patch_validator_ptr const the_validator
        = std::make_shared<typed_patch_validator<T> const>();
    return the_validator;
}

// PUBLIC INTERFACE

// Create an empty patch for values of type T.
template<class T>
patch
new_patch(value_encoding encoding = get_default_encoding())
{
    return patch(
        patch_type_info_query<T>::name(),
        get_typed_patch_validator<T>(),
        encoding);
}

// Get the patch that transforms :a into :b.
template<class T>
patch
diff(T const& a, T const& b, value_encoding encoding = get_default_encoding())
{
    patch p = new_patch<T>(encoding);
    diff_values(&p, a, b);
    return p;
}

// Apply a patch to *x.
// If this fails, *x may be left partially patched. (See
// apply_patch_atomically for an alternative.)
template<class T>
void
apply_patch(T* x, patch const& p)
{
    PATCHWORK_LOG_CALL(<< PATCHWORK_LOG_ARG(p))
    patch_value(x, p);
}

// Apply a patch to *x such that either the whole patch is applied or *x is
// left untouched.
template<class T>
void
apply_patch_atomically(T* x, patch const& p)
{
    T patched = *x;
    apply_patch(&patched, p);
    using std::swap;
    swap(*x, patched);
}

// BULK CONSTRUCTION

struct removal_t
{
};
constexpr removal_t removal{};

// A patch_item is an entry for make_patch, below: a path (in text form) and
// either a value or 'removal'.
struct patch_item
{
    template<class Value>
    patch_item(char const* path, Value const& value)
        : path(path), value(to_dynamic(value))
    {
    }

    patch_item(char const* path, char const* value)
        : path(path), value(dynamic(string(value)))
    {
    }

    patch_item(char const* path, removal_t) : path(path)
    {
    }

    string path;
    // If this is none, the item is a removal.
    optional<dynamic> value;
};

// Make a patch for T directly from a list of items, e.g.,
//
//   make_patch<point>({{"x", 1}, {"label", removal}})
//
// Every item is checked by T's validator.
template<class T>
patch
make_patch(
    std::initializer_list<patch_item> items,
    value_encoding encoding = get_default_encoding())
{
    patch p = new_patch<T>(encoding);
    for (auto const& item : items)
    {
        auto path = parse_value_path(item.path);
        if (item.value)
            p.add(path, encode_dynamic(p.encoding(), *item.value));
        else
            p.add_removal(path);
    }
    return p;
}

// SHARED IMPLEMENTATION

// Replace *x with the value stored in :action.
template<class T>
void
apply_whole_value(T* x, patch_action const& action)
{
    if (action.op == patch_op::REMOVE)
    {
        throw_unknown_path(value_path(), "this value can't be removed");
    }
    try
    {
        decode_value(x, action.value);
    }
    catch (boost::exception& e)
    {
        e << patch_path_info(value_path());
        throw;
    }
}

namespace detail {

// Invoke :fn, which applies a child patch to the element/field at :segment.
template<class Fn>
void
apply_child_patch(path_segment const& segment, Fn&& fn)
{
    try
    {
        fn();
    }
    catch (boost::exception& e)
    {
        add_patch_path_element(e, segment);
        throw;
    }
}

// Merge the patch for a collection element into :p.
// A removal at the root of the element's patch (i.e., an optional element
// becoming empty) would read as removing the element itself, so in that case
// the new element is stored whole.
template<class T>
void
merge_element_patch(
    patch* p,
    path_segment const& segment,
    patch const& element_patch,
    T const& new_element)
{
    auto root = element_patch.find(value_path());
    if (root != element_patch.end() && root->second.op == patch_op::REMOVE)
        p->add(value_path(segment), encode_value(p->encoding(), new_element));
    else
        p->merge(segment, element_patch);
}

} // namespace detail

// LEAVES

#define PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(T)                             \
    void diff_values(patch* p, T const& a, T const& b);                       \
                                                                              \
    void patch_value(T* x, patch const& p);                                   \
                                                                              \
    template<>                                                                \
    struct patch_type_info_query<T>                                           \
    {                                                                         \
        static string                                                         \
        name();                                                               \
                                                                              \
        static void                                                           \
        check(                                                                \
            value_path const& path,                                           \
            size_t depth,                                                     \
            patch_action const& action);                                      \
    };

PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(bool)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(char)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(signed char)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(unsigned char)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(signed short)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(unsigned short)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(signed int)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(unsigned int)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(signed long)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(unsigned long)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(signed long long)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(unsigned long long)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(float)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(double)
PATCHWORK_DECLARE_LEAF_PATCH_INTERFACE(string)

// MAP KEYS - Map keys are addressed by path segments. String keys are FIELD
// segments. Integer keys are INDEX segments if they're nonnegative and FIELD
// segments (holding their decimal text) otherwise.
// These return false if the conversion isn't possible.

bool
to_path_segment(path_segment* segment, string const& key);

bool
from_path_segment(string* key, path_segment const& segment);

template<class Integer>
std::enable_if_t<
    std::is_integral<Integer>::value && !std::is_same<Integer, bool>::value,
    bool>
to_path_segment(path_segment* segment, Integer key)
{
    if (key >= 0)
        *segment = path_segment::at(static_cast<size_t>(key));
    else
        *segment = path_segment::field(std::to_string(key));
    return true;
}

template<class Integer>
std::enable_if_t<
    std::is_integral<Integer>::value && !std::is_same<Integer, bool>::value,
    bool>
from_path_segment(Integer* key, path_segment const& segment)
{
    switch (segment.kind)
    {
        case path_segment_kind::INDEX:
            if (segment.index > static_cast<unsigned long long>(
                    std::numeric_limits<Integer>::max()))
            {
                return false;
            }
            *key = static_cast<Integer>(segment.index);
            return true;
        case path_segment_kind::FIELD:
            return boost::conversion::try_lexical_convert(segment.name, *key)
                   && *key < 0;
        default:
            return false;
    }
}

// Dynamic keys are only addressable if they're strings or nonnegative
// integers.
bool
to_path_segment(path_segment* segment, dynamic const& key);

bool
from_path_segment(dynamic* key, path_segment const& segment);

// Get the segment for a map key, which is required to be addressable.
template<class Key>
path_segment
key_segment(Key const& key)
{
    path_segment segment;
    if (!to_path_segment(&segment, key))
    {
        PATCHWORK_THROW(
            conversion_error() << conversion_message_info(
                "map key can't be addressed by a path segment"));
    }
    return segment;
}

// SEQUENCES

template<class T>
void
diff_sequences(patch* p, std::vector<T> const& a, std::vector<T> const& b)
{
    size_t common = (std::min)(a.size(), b.size());
    for (size_t i = 0; i != common; ++i)
    {
        auto element_patch = diff(a[i], b[i], p->encoding());
        if (!element_patch.empty())
        {
            detail::merge_element_patch(
                p, path_segment::at(i), element_patch, b[i]);
        }
    }
    for (size_t i = common; i < b.size(); ++i)
    {
        p->add(
            value_path(path_segment::at(i)),
            encode_value(p->encoding(), b[i]));
    }
    for (size_t i = common; i < a.size(); ++i)
        p->add_removal(value_path(path_segment::at(i)));
}

// Apply the deeper entries of a sequence patch. (Entries at the root of the
// sequence itself are the caller's responsibility.)
// SET entries at index size() append. Removals are applied last, from the
// highest index down.
template<class T>
void
patch_sequence_elements(
    std::vector<T>* x, std::map<path_segment, patch> const& children)
{
    std::vector<size_t> removals;
    for (auto const& child : children)
    {
        auto const& segment = child.first;
        if (segment.kind != path_segment_kind::INDEX)
        {
            throw_unknown_path(
                value_path(segment), "sequence elements require an index");
        }
        size_t index = segment.index;
        auto root = child.second.find(value_path());
        if (root != child.second.end() && root->second.op == patch_op::REMOVE)
        {
            if (index >= x->size())
            {
                throw_unknown_path(
                    value_path(segment), "no element to remove at this index");
            }
            removals.push_back(index);
        }
        else if (index < x->size())
        {
            T element = (*x)[index];
            detail::apply_child_patch(
                segment, [&] { patch_value(&element, child.second); });
            (*x)[index] = std::move(element);
        }
        else if (index == x->size() && root != child.second.end())
        {
            T element;
            detail::apply_child_patch(
                segment, [&] { patch_value(&element, child.second); });
            x->push_back(std::move(element));
        }
        else
        {
            throw_unknown_path(
                value_path(segment), "index is past the end of the sequence");
        }
    }
    // The children are ordered by index, so this erases from the back.
    for (auto i = removals.rbegin(); i != removals.rend(); ++i)
        x->erase(x->begin() + *i);
}

template<class T>
void
patch_sequence(std::vector<T>* x, patch const& p)
{
    optional<patch_action> whole;
    std::map<path_segment, patch> children;
    split_patch(&whole, &children, p);
    if (whole)
        apply_whole_value(x, *whole);
    patch_sequence_elements(x, children);
}

// STD::VECTOR

template<class T>
void
diff_values(patch* p, std::vector<T> const& a, std::vector<T> const& b)
{
    diff_sequences(p, a, b);
}

template<class T>
void
patch_value(std::vector<T>* x, patch const& p)
{
    patch_sequence(x, p);
}

template<class T>
struct patch_type_info_query<std::vector<T>>
{
    static string
    name()
    {
        return "vector<" + patch_type_info_query<T>::name() + ">";
    }

    static void
    check(value_path const& path, size_t depth, patch_action const& action)
    {
        if (depth == path.depth())
        {
            check_whole_value_entry<std::vector<T>>(path, action);
            return;
        }
        if (path.segments()[depth].kind != path_segment_kind::INDEX)
        {
            reject_patch_entry(path, "expected an index into a " + name());
            return;
        }
        // Elements can be removed.
        if (action.op == patch_op::REMOVE && depth + 1 == path.depth())
            return;
        patch_type_info_query<T>::check(path, depth + 1, action);
    }
};

// STD::ARRAY

template<class T, size_t N>
void
diff_values(patch* p, std::array<T, N> const& a, std::array<T, N> const& b)
{
    for (size_t i = 0; i != N; ++i)
    {
        auto element_patch = diff(a[i], b[i], p->encoding());
        if (!element_patch.empty())
            p->merge(path_segment::at(i), element_patch);
    }
}

template<class T, size_t N>
void
patch_value(std::array<T, N>* x, patch const& p)
{
    optional<patch_action> whole;
    std::map<path_segment, patch> children;
    split_patch(&whole, &children, p);
    if (whole)
        apply_whole_value(x, *whole);
    for (auto const& child : children)
    {
        auto const& segment = child.first;
        if (segment.kind != path_segment_kind::INDEX || segment.index >= N)
        {
            throw_unknown_path(
                value_path(segment), "not a valid index for this array");
        }
        detail::apply_child_patch(segment, [&] {
            patch_value(&(*x)[segment.index], child.second);
        });
    }
}

template<class T, size_t N>
struct patch_type_info_query<std::array<T, N>>
{
    static string
    name()
    {
        return "array<" + patch_type_info_query<T>::name() + ", "
               + std::to_string(N) + ">";
    }

    static void
    check(value_path const& path, size_t depth, patch_action const& action)
    {
        if (depth == path.depth())
        {
            check_whole_value_entry<std::array<T, N>>(path, action);
            return;
        }
        auto const& segment = path.segments()[depth];
        if (segment.kind != path_segment_kind::INDEX || segment.index >= N)
        {
            reject_patch_entry(path, "not a valid index for a " + name());
            return;
        }
        patch_type_info_query<T>::check(path, depth + 1, action);
    }
};

// MAPS

template<class Key, class Value>
void
diff_maps(
    patch* p, std::map<Key, Value> const& a, std::map<Key, Value> const& b)
{
    auto i = a.begin();
    auto j = b.begin();
    while (i != a.end() || j != b.end())
    {
        if (j == b.end() || (i != a.end() && i->first < j->first))
        {
            p->add_removal(value_path(key_segment(i->first)));
            ++i;
        }
        else if (i == a.end() || j->first < i->first)
        {
            p->add(
                value_path(key_segment(j->first)),
                encode_value(p->encoding(), j->second));
            ++j;
        }
        else
        {
            auto element_patch = diff(i->second, j->second, p->encoding());
            if (!element_patch.empty())
            {
                detail::merge_element_patch(
                    p, key_segment(j->first), element_patch, j->second);
            }
            ++i;
            ++j;
        }
    }
}

// Apply the deeper entries of a map patch.
// REMOVE entries erase existing keys. SET entries for missing keys insert
// them.
template<class Key, class Value>
void
patch_map_elements(
    std::map<Key, Value>* x, std::map<path_segment, patch> const& children)
{
    for (auto const& child : children)
    {
        auto const& segment = child.first;
        Key key;
        if (!from_path_segment(&key, segment))
        {
            throw_unknown_path(
                value_path(segment), "not a valid key for this map");
        }
        auto root = child.second.find(value_path());
        auto existing = x->find(key);
        if (root != child.second.end() && root->second.op == patch_op::REMOVE)
        {
            if (existing == x->end())
            {
                throw_unknown_path(
                    value_path(segment), "no entry to remove for this key");
            }
            x->erase(existing);
        }
        else if (existing != x->end())
        {
            detail::apply_child_patch(segment, [&] {
                patch_value(&existing->second, child.second);
            });
        }
        else if (root != child.second.end())
        {
            Value value;
            detail::apply_child_patch(
                segment, [&] { patch_value(&value, child.second); });
            x->emplace(std::move(key), std::move(value));
        }
        else
        {
            throw_unknown_path(
                value_path(segment), "no entry for this key");
        }
    }
}

template<class Key, class Value>
void
patch_map(std::map<Key, Value>* x, patch const& p)
{
    optional<patch_action> whole;
    std::map<path_segment, patch> children;
    split_patch(&whole, &children, p);
    if (whole)
        apply_whole_value(x, *whole);
    patch_map_elements(x, children);
}

// STD::MAP

template<class Key, class Value>
void
diff_values(
    patch* p, std::map<Key, Value> const& a, std::map<Key, Value> const& b)
{
    diff_maps(p, a, b);
}

template<class Key, class Value>
void
patch_value(std::map<Key, Value>* x, patch const& p)
{
    patch_map(x, p);
}

template<class Key, class Value>
struct patch_type_info_query<std::map<Key, Value>>
{
    static string
    name()
    {
        return "map<" + patch_type_info_query<Key>::name() + ", "
               + patch_type_info_query<Value>::name() + ">";
    }

    static void
    check(value_path const& path, size_t depth, patch_action const& action)
    {
        if (depth == path.depth())
        {
            check_whole_value_entry<std::map<Key, Value>>(path, action);
            return;
        }
        Key key;
        if (!from_path_segment(&key, path.segments()[depth]))
        {
            reject_patch_entry(path, "not a valid key for a " + name());
            return;
        }
        // Entries can be removed.
        if (action.op == patch_op::REMOVE && depth + 1 == path.depth())
            return;
        patch_type_info_query<Value>::check(path, depth + 1, action);
    }
};

// OPTIONAL - Engaged values are diffed at the same level as the optional
// itself. An optional that becomes empty is recorded as a removal.
// If the value can itself be empty (see is_nullable), an entry at the root
// of its patch would be read as applying to the optional, so in that case the
// new optional is stored whole.

template<class T>
void
diff_values(patch* p, optional<T> const& a, optional<T> const& b)
{
    if (a && b)
    {
        if (is_nullable<T>::value)
        {
            auto value_patch = diff(*a, *b, p->encoding());
            if (value_patch.find(value_path()) != value_patch.end())
                p->add(value_path(), encode_value(p->encoding(), b));
            else
                p->merge(value_path(), value_patch);
        }
        else
        {
            diff_values(p, *a, *b);
        }
    }
    else if (a)
        p->add_removal(value_path());
    else if (b)
        p->add(value_path(), encode_value(p->encoding(), b));
}

template<class T>
void
patch_value(optional<T>* x, patch const& p)
{
    auto root = p.find(value_path());
    if (root != p.end())
    {
        if (root->second.op == patch_op::REMOVE)
            *x = none;
        else
            apply_whole_value(x, root->second);
    }
    auto deeper = strip_root_entry(p);
    if (!deeper.empty())
    {
        if (!*x)
        {
            throw_unknown_path(
                deeper.begin()->first, "the optional value is empty");
        }
        patch_value(&**x, deeper);
    }
}

template<class T>
struct patch_type_info_query<optional<T>>
{
    static string
    name()
    {
        return "optional<" + patch_type_info_query<T>::name() + ">";
    }

    static void
    check(value_path const& path, size_t depth, patch_action const& action)
    {
        if (depth == path.depth())
        {
            if (action.op != patch_op::REMOVE)
                check_whole_value_entry<optional<T>>(path, action);
        }
        else
        {
            patch_type_info_query<T>::check(path, depth, action);
        }
    }
};

// DYNAMIC - Maps and arrays are diffed structurally (as long as all their
// keys are addressable). Anything else is replaced whole.

void
diff_values(patch* p, dynamic const& a, dynamic const& b);

void
patch_value(dynamic* x, patch const& p);

template<>
struct patch_type_info_query<dynamic>
{
    static string
    name();

    static void
    check(value_path const& path, size_t depth, patch_action const& action);
};

} // namespace patchwork

#endif
