#ifndef PATCHWORK_ENCODINGS_YAML_HPP
#define PATCHWORK_ENCODINGS_YAML_HPP

#include <patchwork/core/dynamic.hpp>

// YAML - conversion of values to YAML text for human consumption

namespace patchwork {

// Write a value to a diagnostic string in YAML format.
// This won't necessarily capture the entire contents of the value. In
// particular, it abbreviates large arrays and maps.
string
value_to_diagnostic_yaml(dynamic const& v);

} // namespace patchwork

#endif
