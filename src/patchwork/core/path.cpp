#include <patchwork/core/path.hpp>

#include <algorithm>
#include <sstream>

#include <boost/lexical_cast.hpp>

namespace patchwork {

std::ostream&
operator<<(std::ostream& s, path_segment_kind kind)
{
    switch (kind)
    {
        case path_segment_kind::ROOT:
            s << "root";
            break;
        case path_segment_kind::FIELD:
            s << "field";
            break;
        case path_segment_kind::INDEX:
            s << "index";
            break;
        default:
            PATCHWORK_THROW(
                invalid_enum_value() << enum_id_info("path_segment_kind")
                                     << enum_value_info(int(kind)));
    }
    return s;
}

bool
operator==(path_segment const& a, path_segment const& b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
        case path_segment_kind::ROOT:
        default:
            return true;
        case path_segment_kind::FIELD:
            return a.name == b.name;
        case path_segment_kind::INDEX:
            return a.index == b.index;
    }
}
bool
operator!=(path_segment const& a, path_segment const& b)
{
    return !(a == b);
}
bool
operator<(path_segment const& a, path_segment const& b)
{
    if (a.kind != b.kind)
        return a.kind < b.kind;
    switch (a.kind)
    {
        case path_segment_kind::ROOT:
        default:
            return false;
        case path_segment_kind::FIELD:
            return a.name < b.name;
        case path_segment_kind::INDEX:
            return a.index < b.index;
    }
}

static bool
is_all_digits(string const& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

string
to_string(path_segment const& segment)
{
    switch (segment.kind)
    {
        case path_segment_kind::ROOT:
        default:
            return "$";
        case path_segment_kind::INDEX:
            return boost::lexical_cast<string>(segment.index);
        case path_segment_kind::FIELD: {
            string text;
            // Names that would otherwise read back as the root or as an
            // index are marked with a leading escape.
            if (is_all_digits(segment.name)
                || (!segment.name.empty() && segment.name[0] == '$'))
            {
                text.push_back('\\');
            }
            for (char c : segment.name)
            {
                if (c == '.' || c == '\\')
                    text.push_back('\\');
                text.push_back(c);
            }
            return text;
        }
    }
}

std::ostream&
operator<<(std::ostream& s, path_segment const& segment)
{
    s << to_string(segment);
    return s;
}

value_path::value_path(std::vector<path_segment> segments)
{
    if (segments.empty())
    {
        segments_.push_back(path_segment::root());
        return;
    }
    if (segments.size() > 1)
    {
        for (auto const& segment : segments)
        {
            if (segment.kind == path_segment_kind::ROOT)
            {
                PATCHWORK_THROW(
                    invalid_path() << internal_error_message_info(
                        "root segment inside a multi-segment path"));
            }
        }
    }
    segments_ = std::move(segments);
}

value_path
value_path::tail() const
{
    if (segments_.size() <= 1)
        return value_path();
    return value_path(
        std::vector<path_segment>(segments_.begin() + 1, segments_.end()));
}

bool
operator==(value_path const& a, value_path const& b)
{
    return a.segments() == b.segments();
}
bool
operator!=(value_path const& a, value_path const& b)
{
    return !(a == b);
}
bool
operator<(value_path const& a, value_path const& b)
{
    return std::lexicographical_compare(
        a.segments().begin(),
        a.segments().end(),
        b.segments().begin(),
        b.segments().end());
}

value_path
extend_path(value_path const& prefix, value_path const& suffix)
{
    if (prefix.is_root())
        return suffix;
    if (suffix.is_root())
        return prefix;
    std::vector<path_segment> segments = prefix.segments();
    segments.insert(
        segments.end(), suffix.segments().begin(), suffix.segments().end());
    return value_path(std::move(segments));
}

value_path
extend_path(value_path const& prefix, path_segment const& segment)
{
    return extend_path(prefix, value_path(segment));
}

value_path
prepend_path(path_segment const& segment, value_path const& path)
{
    return extend_path(value_path(segment), path);
}

string
to_string(value_path const& path)
{
    std::ostringstream text;
    bool first = true;
    for (auto const& segment : path.segments())
    {
        if (!first)
            text << '.';
        text << segment;
        first = false;
    }
    return text.str();
}

std::ostream&
operator<<(std::ostream& s, value_path const& path)
{
    s << to_string(path);
    return s;
}

static void
throw_path_parsing_error(string const& text, string const& message)
{
    PATCHWORK_THROW(
        parsing_error() << expected_format_info("value path")
                        << parsed_text_info(text)
                        << parsing_error_info(message));
}

value_path
parse_value_path(string const& text)
{
    if (text == "$")
        return value_path();

    std::vector<path_segment> segments;
    string name;
    // whether the current segment contained any escapes
    bool escaped = false;

    auto finish_segment = [&]() {
        if (!escaped && name == "$")
            throw_path_parsing_error(text, "root marker inside a path");
        if (!escaped && is_all_digits(name))
        {
            size_t index;
            if (!boost::conversion::try_lexical_convert(name, index))
                throw_path_parsing_error(text, "index out of range");
            segments.push_back(path_segment::at(index));
        }
        else
        {
            segments.push_back(path_segment::field(name));
        }
        name.clear();
        escaped = false;
    };

    for (size_t i = 0; i != text.length(); ++i)
    {
        char c = text[i];
        if (c == '\\')
        {
            escaped = true;
            // A leading escape only marks the segment as a field name.
            if (i + 1 == text.length())
                break;
            char next = text[i + 1];
            if (next == '.' || next == '\\')
            {
                name.push_back(next);
                ++i;
            }
        }
        else if (c == '.')
        {
            finish_segment();
        }
        else
        {
            name.push_back(c);
        }
    }
    finish_segment();

    return value_path(std::move(segments));
}

} // namespace patchwork
