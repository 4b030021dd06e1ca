
#include <cstdint>
#include <time.h>

#include "sfmachine.hpp"

#ifndef _SFIB_TIME_H_
#define _SFIB_TIME_H_

namespace sfib {

#ifdef SFIB_USE_CYCLE_COUNTER

/*---------------------------------------------------------------------*/
/* Cycle counter */

namespace cycle_counter {

  using cycles_type = uint64_t;

  static inline
  cycles_type rdtsc() {
    unsigned int hi, lo;
    __asm__ __volatile__("rdtsc" : "=a"(lo), "=d"(hi));
    return  ((cycles_type) lo) | (((cycles_type) hi) << 32);
  }

  static inline
  cycles_type now() {
    return rdtsc();
  }

} // end namespace

#endif

/*---------------------------------------------------------------------*/
/* Lightweight timer */

namespace time {

#ifdef SFIB_USE_CYCLE_COUNTER

  using time_type = cycle_counter::cycles_type;

  static inline
  time_type now() {
    return cycle_counter::now();
  }

  // pre: machine::initialize_cpuinfo() has run (sfib::launch does it)
  static inline
  double microseconds_of(time_type cycles) {
    double ticks_per_microsecond = machine::cpu_frequency_ghz() * 1000.0;
    return (double) cycles / ticks_per_microsecond;
  }

#else // (defaultly) use the monotonic wall clock

  using time_type = uint64_t;

  static inline
  time_type now() {
    struct timespec t;
    clock_gettime(CLOCK_MONOTONIC, &t);
    return t.tv_sec * 1000000000LL + t.tv_nsec;
  }

  static inline
  double microseconds_of(time_type nanoseconds) {
    return (double) nanoseconds / 1000.0;
  }

#endif

  static inline
  double microseconds_since(time_type start) {
    return microseconds_of(now() - start);
  }

} // end namespace

} // end namespace

#endif
