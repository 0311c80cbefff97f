#ifndef PATCHWORK_CORE_PATH_HPP
#define PATCHWORK_CORE_PATH_HPP

#include <ostream>
#include <vector>

#include <patchwork/core/exception.hpp>

namespace patchwork {

// A value_path addresses a location within a nested value, relative to the
// value at which the path is interpreted. It's a sequence of segments:
//
// * ROOT denotes the whole value at this level. It only ever appears as the
//   sole segment of a path.
// * FIELD names a record field or a string map key.
// * INDEX is a sequence index or a (nonnegative) integer map key.
//
// As text, paths are written with their segments joined by dots (e.g.,
// "a.b.2.c"), and the root path is written as "$".

enum class path_segment_kind
{
    ROOT,
    FIELD,
    INDEX
};

std::ostream&
operator<<(std::ostream& s, path_segment_kind kind);

struct path_segment
{
    path_segment_kind kind = path_segment_kind::ROOT;
    // valid if kind is FIELD
    string name;
    // valid if kind is INDEX
    size_t index = 0;

    static path_segment
    root()
    {
        return path_segment();
    }

    static path_segment
    field(string name)
    {
        path_segment s;
        s.kind = path_segment_kind::FIELD;
        s.name = std::move(name);
        return s;
    }

    static path_segment
    at(size_t index)
    {
        path_segment s;
        s.kind = path_segment_kind::INDEX;
        s.index = index;
        return s;
    }
};

bool
operator==(path_segment const& a, path_segment const& b);
bool
operator!=(path_segment const& a, path_segment const& b);
bool
operator<(path_segment const& a, path_segment const& b);

// Get the text form of a single segment (with any necessary escaping).
string
to_string(path_segment const& segment);

std::ostream&
operator<<(std::ostream& s, path_segment const& segment);

class value_path
{
 public:
    // Construct the root path.
    value_path() : segments_(1, path_segment::root())
    {
    }

    // Construct a path consisting of a single segment.
    value_path(path_segment segment) : segments_(1, std::move(segment))
    {
    }

    // Construct a path from a list of segments.
    // An empty list yields the root path. ROOT segments are not allowed in a
    // list of more than one segment.
    explicit value_path(std::vector<path_segment> segments);

    bool
    is_root() const
    {
        return segments_.front().kind == path_segment_kind::ROOT;
    }

    // Get the segments of the path.
    // For the root path, this is a single ROOT segment.
    std::vector<path_segment> const&
    segments() const
    {
        return segments_;
    }

    // Get the number of segments below the root. (This is 0 for the root
    // path.)
    size_t
    depth() const
    {
        return is_root() ? 0 : segments_.size();
    }

    // Get the first segment of a non-root path.
    path_segment const&
    head() const
    {
        return segments_.front();
    }

    // Get the path that remains after removing the first segment.
    // For a single-segment path, this is the root path.
    value_path
    tail() const;

 private:
    std::vector<path_segment> segments_;
};

// If a list of segments violates the invariants above, this is thrown.
PATCHWORK_DEFINE_EXCEPTION(invalid_path)

bool
operator==(value_path const& a, value_path const& b);
bool
operator!=(value_path const& a, value_path const& b);
bool
operator<(value_path const& a, value_path const& b);

// Concatenate two paths. The root path is the identity for this operation.
value_path
extend_path(value_path const& prefix, value_path const& suffix);

value_path
extend_path(value_path const& prefix, path_segment const& segment);

// Get the path that results from putting :segment in front of :path.
value_path
prepend_path(path_segment const& segment, value_path const& path);

string
to_string(value_path const& path);

std::ostream&
operator<<(std::ostream& s, value_path const& path);

// Parse the text form of a path.
// If the text isn't a valid path, this throws a parsing_error.
value_path
parse_value_path(string const& text);

} // namespace patchwork

#endif
