#include <patchwork/core/patch.hpp>

#include <sstream>
#include <vector>

namespace patchwork {

std::ostream&
operator<<(std::ostream& s, patch_op op)
{
    switch (op)
    {
        case patch_op::SET:
            s << "set";
            break;
        case patch_op::REMOVE:
            s << "remove";
            break;
        default:
            PATCHWORK_THROW(
                invalid_enum_value() << enum_id_info("patch_op")
                                     << enum_value_info(int(op)));
    }
    return s;
}

patch_action
make_set_action(encoded_value value)
{
    patch_action action;
    action.op = patch_op::SET;
    action.value = std::move(value);
    return action;
}

patch_action
make_removal_action()
{
    patch_action action;
    action.op = patch_op::REMOVE;
    return action;
}

bool
operator==(patch_action const& a, patch_action const& b)
{
    if (a.op != b.op)
        return false;
    return a.op == patch_op::REMOVE || a.value == b.value;
}
bool
operator!=(patch_action const& a, patch_action const& b)
{
    return !(a == b);
}

namespace {

struct accept_all_patch_validator : patch_validator
{
    void
    check(value_path const&, patch_action const&) const override
    {
    }
};

struct function_patch_validator : patch_validator
{
    function_patch_validator(
        std::function<bool(value_path const&, patch_action const&)> predicate,
        string const& message)
        : predicate(std::move(predicate)), message(message)
    {
    }

    void
    check(value_path const& path, patch_action const& action) const override
    {
        if (!predicate(path, action))
        {
            PATCHWORK_THROW(
                validation_error() << patch_path_info(path)
                                   << validation_message_info(message));
        }
    }

    std::function<bool(value_path const&, patch_action const&)> predicate;
    string message;
};

} // namespace

patch_validator_ptr
accept_all_validator()
{
    static patch_validator_ptr const the_validator
        = std::make_shared<accept_all_patch_validator const>();
    return the_validator;
}

patch_validator_ptr
make_function_validator(
    std::function<bool(value_path const&, patch_action const&)> predicate,
    string const& message)
{
    return std::make_shared<function_patch_validator const>(
        std::move(predicate), message);
}

patch::patch()
    : encoding_(get_default_encoding()), validator_(accept_all_validator())
{
}

patch::patch(
    string type_name, patch_validator_ptr validator, value_encoding encoding)
    : type_name_(std::move(type_name)),
      encoding_(encoding),
      validator_(
          validator ? std::move(validator) : accept_all_validator())
{
}

patch&
patch::add(value_path const& path, patch_action action)
{
    validator_->check(path, action);
    entries_[path] = std::move(action);
    return *this;
}

patch&
patch::add(value_path const& path, encoded_value value)
{
    return add(path, make_set_action(std::move(value)));
}

patch&
patch::add_removal(value_path const& path)
{
    return add(path, make_removal_action());
}

patch&
patch::merge(value_path const& prefix, patch const& other)
{
    if (&other == this)
    {
        patch copy = other;
        return merge(prefix, copy);
    }
    // Check every entry before storing any of them so that a rejection
    // leaves this patch untouched.
    std::vector<value_path> paths;
    paths.reserve(other.entries_.size());
    for (auto const& entry : other.entries_)
    {
        paths.push_back(extend_path(prefix, entry.first));
        validator_->check(paths.back(), entry.second);
    }
    auto path = paths.begin();
    for (auto const& entry : other.entries_)
        entries_[std::move(*path++)] = entry.second;
    return *this;
}

patch&
patch::merge(path_segment const& prefix, patch const& other)
{
    return merge(value_path(prefix), other);
}

patch&
patch::merge(string const& prefix, patch const& other)
{
    return merge(parse_value_path(prefix), other);
}

void
patch::swap(patch& other)
{
    using std::swap;
    swap(type_name_, other.type_name_);
    swap(encoding_, other.encoding_);
    swap(validator_, other.validator_);
    swap(entries_, other.entries_);
}

bool
operator==(patch const& a, patch const& b)
{
    return a.type_name() == b.type_name() && a.entries() == b.entries();
}
bool
operator!=(patch const& a, patch const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, patch const& p)
{
    s << "patch<" << p.type_name() << ">";
    for (auto const& entry : p)
    {
        s << "\n  " << entry.first << ": ";
        if (entry.second.op == patch_op::REMOVE)
            s << "(removed)";
        else
            s << entry.second.value;
    }
    return s;
}

string
to_string(patch const& p)
{
    std::ostringstream s;
    s << p;
    return s.str();
}

void
split_patch(
    optional<patch_action>* whole,
    std::map<path_segment, patch>* children,
    patch const& p)
{
    *whole = none;
    children->clear();
    for (auto const& entry : p)
    {
        if (entry.first.is_root())
        {
            *whole = entry.second;
        }
        else
        {
            auto child = children->find(entry.first.head());
            if (child == children->end())
            {
                child = children
                            ->emplace(
                                entry.first.head(),
                                patch(
                                    string(),
                                    accept_all_validator(),
                                    p.encoding()))
                            .first;
            }
            child->second.add(entry.first.tail(), entry.second);
        }
    }
}

} // namespace patchwork
