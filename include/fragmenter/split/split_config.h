#pragma once

#include <fragmenter/core/types.h>

#include <cstdint>

namespace fragmenter::split {

/**
 * Configuration for a single split operation
 */
struct SplitConfig {
    int64_t maxLength = DEFAULT_MAX_FRAGMENT_LENGTH; // Byte budget per fragment; <= 0 yields nothing
    bool voidElementsSelfClose = false;  // Treat <br>, <img>, ... as self-closing
    bool skipMarkupDeclarations = false; // Keep <!...> and <?...> off the tag stack
};

} // namespace fragmenter::split
