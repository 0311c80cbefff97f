#ifndef PATCHWORK_CORE_HISTORY_HPP
#define PATCHWORK_CORE_HISTORY_HPP

#include <vector>

#include <patchwork/core/diff.hpp>

namespace patchwork {

// empty_history is thrown when trying to revert a history that has no
// recorded changes.
PATCHWORK_DEFINE_EXCEPTION(empty_history)

// history<T> holds a value of type T along with a log of the changes that
// have been made to it. Each change is recorded as the patch that undoes it,
// so changes can be reverted one at a time (most recent first).
//
// All changes are all-or-nothing: if applying a patch fails, neither the
// value nor the log is affected.
template<class T>
class history
{
 public:
    history() : encoding_(get_default_encoding())
    {
    }

    explicit history(
        T initial_value, value_encoding encoding = get_default_encoding())
        : value_(std::move(initial_value)), encoding_(encoding)
    {
    }

    T const&
    value() const
    {
        return value_;
    }

    // the number of changes that can be reverted
    size_t
    depth() const
    {
        return undo_log_.size();
    }

    // Apply a patch to the value.
    // The return value is the patch that undoes the change. (If the patch
    // didn't actually change anything, that's empty and isn't recorded.)
    patch
    apply(patch const& p)
    {
        T patched = value_;
        apply_patch(&patched, p);
        return commit(std::move(patched));
    }

    // Replace the value.
    // The return value is the patch that describes the change.
    patch
    update(T new_value)
    {
        patch forward = diff(value_, new_value, encoding_);
        commit(std::move(new_value));
        return forward;
    }

    // Revert the most recent change.
    // The return value is the patch that redoes it.
    patch
    revert()
    {
        if (undo_log_.empty())
            PATCHWORK_THROW(empty_history());
        T reverted = value_;
        apply_patch(&reverted, undo_log_.back());
        patch redo = diff(reverted, value_, encoding_);
        using std::swap;
        swap(value_, reverted);
        undo_log_.pop_back();
        return redo;
    }

 private:
    patch
    commit(T new_value)
    {
        patch undo = diff(new_value, value_, encoding_);
        if (!undo.empty())
            undo_log_.push_back(undo);
        using std::swap;
        swap(value_, new_value);
        return undo;
    }

    T value_;
    value_encoding encoding_;
    std::vector<patch> undo_log_;
};

} // namespace patchwork

#endif
