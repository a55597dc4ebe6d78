#pragma once

// Insert Tracy scope statements if tracing is enabled
#ifndef TXS_ENABLE_TRACY
  #define txs_trace()
  #define txs_trace_n(name)
  #define txs_trace_alloc(ptr, size)
  #define txs_trace_free(ptr)
  #define txs_trace_alloc_n(alloc_name, ptr, size)
  #define txs_trace_free_n(alloc_name, ptr)
#else // TXS_ENABLE_TRACY
  #include <Tracy.hpp>

  // Insert CPU event trace
  #define txs_trace()            ZoneScoped;
  #define txs_trace_n(name)      ZoneScopedN(name)

  // Insert memory event trace
  #define txs_trace_alloc(ptr, size)                \
    TracyAlloc(ptr, size)
  #define txs_trace_alloc_n(name, ptr, size)        \
    TracyAllocN(ptr, size, name)
  #define txs_trace_free(ptr)                       \
    TracyFree(ptr)
  #define txs_trace_free_n(name, ptr)               \
    TracyFreeN(ptr, name)

  #ifndef TRACY_ENABLE
    #define TRACY_ENABLE
  #endif // TRACY_ENABLE
  #ifndef TRACY_ON_DEMAND
  #define TRACY_ON_DEMAND
  #endif // TRACY_ON_DEMAND
#endif // TXS_ENABLE_TRACY
