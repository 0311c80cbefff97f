#ifndef PATCHWORK_CORE_HPP
#define PATCHWORK_CORE_HPP

#include <patchwork/core/diff.hpp>
#include <patchwork/core/dynamic.hpp>
#include <patchwork/core/exception.hpp>
#include <patchwork/core/history.hpp>
#include <patchwork/core/patch.hpp>
#include <patchwork/core/path.hpp>
#include <patchwork/core/record.hpp>
#include <patchwork/core/type_definitions.hpp>
#include <patchwork/core/type_interfaces.hpp>
#include <patchwork/encodings/encoded_value.hpp>

#endif
