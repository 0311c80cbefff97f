#ifndef PATCHWORK_CONFIG_HPP
#define PATCHWORK_CONFIG_HPP

#include <patchwork/core/record.hpp>
#include <patchwork/fs/types.hpp>

namespace patchwork {

struct patchwork_config
{
    // the encoding to use for values stored in patches ("json" or
    // "msgpack" - defaults to "json")
    optional<string> encoding;
    // the level of the patchwork logger ("trace", "debug", "info",
    // "warning", "error", "critical" or "off" - defaults to "warning")
    optional<string> log_level;
};

bool
operator==(patchwork_config const& a, patchwork_config const& b);
bool
operator!=(patchwork_config const& a, patchwork_config const& b);

} // namespace patchwork

PATCHWORK_DEFINE_RECORD(patchwork::patchwork_config, (encoding)(log_level))

namespace patchwork {

// Parse a configuration from its JSON text.
patchwork_config
parse_config(string const& json);

// Read a configuration from a JSON file.
patchwork_config
read_config_file(file_path const& path);

// Apply a configuration to the process. (Settings that are omitted are left
// as they are.)
// If a setting is invalid, this throws invalid_enum_string and nothing is
// changed.
void
apply_config(patchwork_config const& config);

} // namespace patchwork

#endif
