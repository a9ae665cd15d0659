#pragma once
// Optional Tracy instrumentation. Compiles to nothing unless TRACY_ENABLE is set.
#ifdef TRACY_ENABLE
  #include <tracy/Tracy.hpp>
  #define FRONTIER_TRACY_ZONE(name) ZoneScopedN(name)
#else
  #define FRONTIER_TRACY_ZONE(name)
#endif
