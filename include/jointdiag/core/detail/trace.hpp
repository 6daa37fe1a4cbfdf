#pragma once

// Insert Tracy scope statements if tracing is enabled
#ifndef JD_ENABLE_TRACY
  #define jd_trace()
  #define jd_trace_n(name)
  #define jd_trace_frame()
#else // JD_ENABLE_TRACY
  #include <tracy/Tracy.hpp>

  // Insert CPU event trace
  #define jd_trace()            ZoneScoped;
  #define jd_trace_n(name)      ZoneScopedN(name)

  // Signal end of a solver sweep as a frame
  #define jd_trace_frame()      FrameMark;
#endif // JD_ENABLE_TRACY
