#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define PACSIM_VERSION_MAJOR 1
#define PACSIM_VERSION_MINOR 0
#define PACSIM_VERSION_PATCH 0
#define PACSIM_VERSION_STRING "1.0.0"

namespace pacsim {

/// Project version information at compile time.
struct Version {
    static constexpr int major = PACSIM_VERSION_MAJOR;
    static constexpr int minor = PACSIM_VERSION_MINOR;
    static constexpr int patch = PACSIM_VERSION_PATCH;
    static constexpr const char* string = PACSIM_VERSION_STRING;
};

} // namespace pacsim
