#ifndef PATCHWORK_CORE_PATCH_HPP
#define PATCHWORK_CORE_PATCH_HPP

#include <functional>
#include <map>
#include <memory>

#include <patchwork/core/path.hpp>
#include <patchwork/encodings/encoded_value.hpp>

namespace patchwork {

// PATCH ACTIONS

enum class patch_op
{
    // store the action's value at the path, replacing whatever is there
    SET,
    // remove the element (of a collection) or the value (of an optional)
    // addressed by the path
    REMOVE
};

std::ostream&
operator<<(std::ostream& s, patch_op op);

struct patch_action
{
    patch_op op = patch_op::SET;
    // valid if op is SET
    encoded_value value;
};

patch_action
make_set_action(encoded_value value);

patch_action
make_removal_action();

bool
operator==(patch_action const& a, patch_action const& b);
bool
operator!=(patch_action const& a, patch_action const& b);

// VALIDATION

// validation_error is thrown when a validator rejects an entry that's being
// added to a patch.
PATCHWORK_DEFINE_EXCEPTION(validation_error)
PATCHWORK_DEFINE_ERROR_INFO(string, patch_type)
PATCHWORK_DEFINE_ERROR_INFO(value_path, patch_path)
PATCHWORK_DEFINE_ERROR_INFO(string, validation_message)

// A patch_validator decides whether or not an entry may be stored in a patch.
// Validators are shared by all the patches that they're bound to, so check()
// must be free of side effects and safe to call concurrently.
class patch_validator
{
 public:
    virtual ~patch_validator()
    {
    }

    // Check an entry. If the entry is unacceptable, this throws a
    // validation_error.
    virtual void
    check(value_path const& path, patch_action const& action) const = 0;
};

typedef std::shared_ptr<patch_validator const> patch_validator_ptr;

// Get the validator that accepts everything.
patch_validator_ptr
accept_all_validator();

// Make a validator from a predicate. Entries for which :predicate returns
// false are rejected with the given message.
patch_validator_ptr
make_function_validator(
    std::function<bool(value_path const&, patch_action const&)> predicate,
    string const& message = "rejected by predicate");

// PATCH

// A patch describes how to transform one value of a type into another. It's
// an ordered collection of entries, each of which associates a path within
// the value with an action to take there.
class patch
{
 public:
    typedef std::map<value_path, patch_action> entry_map;
    typedef entry_map::const_iterator const_iterator;

    // Construct an empty, untyped patch that accepts any entry.
    patch();

    patch(
        string type_name,
        patch_validator_ptr validator,
        value_encoding encoding);

    // the name of the type that this patch applies to (for diagnostics)
    string const&
    type_name() const
    {
        return type_name_;
    }

    // the encoding that diffs use for values that they store in this patch
    value_encoding
    encoding() const
    {
        return encoding_;
    }

    patch_validator_ptr const&
    validator() const
    {
        return validator_;
    }

    // Add an entry, overwriting any existing entry at the same path.
    // If the validator rejects the entry, this throws a validation_error and
    // leaves the patch unchanged.
    patch&
    add(value_path const& path, patch_action action);

    patch&
    add(value_path const& path, encoded_value value);

    patch&
    add_removal(value_path const& path);

    // Merge another patch into this one, placing its entries under :prefix.
    // (An entry at the root of :other lands at :prefix itself.)
    // Every combined entry is checked by this patch's validator. If any of
    // them is rejected, this throws the validation_error for the first such
    // entry (in :other's order) and leaves this patch unchanged.
    patch&
    merge(value_path const& prefix, patch const& other);

    patch&
    merge(path_segment const& prefix, patch const& other);

    // Same as above, but :prefix is given in text form.
    patch&
    merge(string const& prefix, patch const& other);

    bool
    empty() const
    {
        return entries_.empty();
    }

    size_t
    size() const
    {
        return entries_.size();
    }

    const_iterator
    begin() const
    {
        return entries_.begin();
    }

    const_iterator
    end() const
    {
        return entries_.end();
    }

    const_iterator
    find(value_path const& path) const
    {
        return entries_.find(path);
    }

    entry_map const&
    entries() const
    {
        return entries_;
    }

    void
    swap(patch& other);

 private:
    string type_name_;
    value_encoding encoding_;
    patch_validator_ptr validator_;
    entry_map entries_;
};

// Two patches are equal if they're for the same type and have the same
// entries. (Validators and default encodings aren't compared.)
bool
operator==(patch const& a, patch const& b);
bool
operator!=(patch const& a, patch const& b);

inline void
swap(patch& a, patch& b)
{
    a.swap(b);
}

std::ostream&
operator<<(std::ostream& s, patch const& p);

string
to_string(patch const& p);

// Split a patch by the first segment of its paths.
// If :p has an entry at the root path, *whole receives its action.
// Every other entry is moved (with its first segment removed) into the patch
// in *children that corresponds to that first segment.
// This is the inverse of merging child patches under their segments.
void
split_patch(
    optional<patch_action>* whole,
    std::map<path_segment, patch>* children,
    patch const& p);

} // namespace patchwork

#endif
