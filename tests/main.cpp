#define CATCH_CONFIG_MAIN
#include <patchwork/core/testing.hpp>
