#include <patchwork/config.hpp>

#include <patchwork/core/logging.hpp>
#include <patchwork/encodings/json.hpp>
#include <patchwork/fs/file_io.hpp>

namespace patchwork {

bool
operator==(patchwork_config const& a, patchwork_config const& b)
{
    return a.encoding == b.encoding && a.log_level == b.log_level;
}
bool
operator!=(patchwork_config const& a, patchwork_config const& b)
{
    return !(a == b);
}

patchwork_config
parse_config(string const& json)
{
    patchwork_config config;
    from_dynamic(&config, parse_json_value(json));
    return config;
}

patchwork_config
read_config_file(file_path const& path)
{
    try
    {
        return parse_config(read_file_contents(path));
    }
    catch (boost::exception& e)
    {
        e << file_path_info(path);
        throw;
    }
}

void
apply_config(patchwork_config const& config)
{
    // Parse everything before changing anything.
    optional<value_encoding> encoding;
    if (config.encoding)
        encoding = parse_value_encoding(*config.encoding);
    if (config.log_level)
        set_log_level(*config.log_level);
    if (encoding)
        set_default_encoding(*encoding);
}

} // namespace patchwork
