#include <patchwork/encodings/yaml.hpp>

#include <boost/lexical_cast.hpp>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

namespace patchwork {

// Check if a string would be read back as some other kind of scalar if it
// were written without quotes.
static bool
string_resembles_other_scalar(string const& s)
{
    if (s.empty() || s == "true" || s == "false" || s == "null" || s == "~")
        return true;
    integer i;
    if (boost::conversion::try_lexical_convert(s, i))
        return true;
    double d;
    if (boost::conversion::try_lexical_convert(s, d))
        return true;
    return false;
}

static void
emit_string(YAML::Emitter& out, string const& s)
{
    if (string_resembles_other_scalar(s))
        out << YAML::DoubleQuoted << s;
    else
        out << s;
}

// :abbreviation_limit is the container size at which contents are replaced
// by a summary.
static void
emit_yaml_value(
    YAML::Emitter& out, dynamic const& v, size_t abbreviation_limit)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            out << YAML::Null;
            break;
        case value_type::BOOLEAN:
            out << cast<bool>(v);
            break;
        case value_type::INTEGER:
            out << cast<integer>(v);
            break;
        case value_type::UNSIGNED:
            out << cast<uint64_t>(v);
            break;
        case value_type::FLOAT:
            out << cast<double>(v);
            break;
        case value_type::STRING:
            emit_string(out, cast<string>(v));
            break;
        case value_type::ARRAY: {
            dynamic_array const& array = cast<dynamic_array>(v);
            if (array.size() >= abbreviation_limit)
            {
                out << "<array - size: "
                           + boost::lexical_cast<string>(array.size()) + ">";
                break;
            }
            out << YAML::BeginSeq;
            for (auto const& i : array)
            {
                emit_yaml_value(out, i, abbreviation_limit);
            }
            out << YAML::EndSeq;
            break;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            if (x.size() >= abbreviation_limit)
            {
                out << "<map - size: " + boost::lexical_cast<string>(x.size())
                           + ">";
                break;
            }
            out << YAML::BeginMap;
            for (auto const& i : x)
            {
                out << YAML::Key;
                emit_yaml_value(out, i.first, abbreviation_limit);
                out << YAML::Value;
                emit_yaml_value(out, i.second, abbreviation_limit);
            }
            out << YAML::EndMap;
            break;
        }
    }
}

static string
emit_yaml(dynamic const& v, size_t abbreviation_limit)
{
    YAML::Emitter out;
    out << YAML::FloatPrecision(5);
    out << YAML::DoublePrecision(12);
    emit_yaml_value(out, v, abbreviation_limit);
    return out.c_str();
}

string
value_to_diagnostic_yaml(dynamic const& v)
{
    return emit_yaml(v, 64);
}

} // namespace patchwork
