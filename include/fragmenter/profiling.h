#pragma once

/**
 * @file profiling.h
 * @brief Profiling support using Tracy profiler
 *
 * Wrapper macros for Tracy profiling that are disabled when TRACY_ENABLE is
 * not defined.
 */

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>

// Zone macros
#define FRAGMENTER_ZONE_SCOPED() ZoneScoped
#define FRAGMENTER_ZONE_SCOPED_N(name) ZoneScopedN(name)

// Plot values
#define FRAGMENTER_PLOT(name, val) TracyPlot(name, val)

#define FRAGMENTER_SPLIT_ZONE(kind, bytes)                                                         \
    FRAGMENTER_ZONE_SCOPED_N("Split::" kind);                                                      \
    FRAGMENTER_PLOT("SourceBytes", static_cast<int64_t>(bytes))

#else
// No-op macros when profiling is disabled
#define FRAGMENTER_ZONE_SCOPED()
#define FRAGMENTER_ZONE_SCOPED_N(name)

#define FRAGMENTER_PLOT(name, val)

#define FRAGMENTER_SPLIT_ZONE(kind, bytes)

#endif // TRACY_ENABLE
