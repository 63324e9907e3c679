#pragma once

/// @file pacsim.hpp
/// @brief Umbrella header: version and core result types.

#include "pacsim/core/result.hpp"
#include "pacsim/version.hpp"
