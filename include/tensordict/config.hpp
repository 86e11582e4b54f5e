#pragma once

#include <cstdlib>
#include <string>

#ifndef TENSORDICT_HAS_MMAP
#if defined(__unix__) || defined(__APPLE__)
#define TENSORDICT_HAS_MMAP 1
#else
#define TENSORDICT_HAS_MMAP 0
#endif
#endif

#ifndef TENSORDICT_DEFAULT_LOG_LEVEL
#define TENSORDICT_DEFAULT_LOG_LEVEL "warn"
#endif

namespace tensordict {

/**
 * @brief Directory used for memmap files created without an explicit prefix.
 *
 * The value is taken from the `TENSORDICT_MEMMAP_DIR` environment variable,
 * then `TMPDIR`, falling back to `/tmp`.
 */
inline std::string memmap_directory() {
    if (const char* env = std::getenv("TENSORDICT_MEMMAP_DIR"))
        if (*env)
            return env;
    if (const char* env = std::getenv("TMPDIR"))
        if (*env)
            return env;
    return "/tmp";
}

/// Device tag assigned to tensors created by the factory functions.
inline std::string default_device() {
    if (const char* env = std::getenv("TENSORDICT_DEFAULT_DEVICE"))
        if (*env)
            return env;
    return "cpu";
}

/// Textual log threshold, see log.hpp for the accepted values.
inline std::string log_level_setting() {
    if (const char* env = std::getenv("TENSORDICT_LOG_LEVEL"))
        if (*env)
            return env;
    return TENSORDICT_DEFAULT_LOG_LEVEL;
}

} // namespace tensordict
