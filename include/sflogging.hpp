
#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <string>
#include <vector>

#include "sfperworker.hpp"
#include "sftime.hpp"

#ifndef _SFIB_LOGGING_H_
#define _SFIB_LOGGING_H_

namespace sfib {
namespace logging {

using event_tag_type = enum {
  cache_fill,
  chunk_run,
  range_run
};

using event_type = struct {
  event_tag_type tag;
  double timestamp;
  union {
    struct {
      uint64_t index;
    } cache_fill;
    struct {
      uint64_t lo;
      uint64_t hi;
      double time;
    } chunk_run;
    struct {
      uint64_t lo;
      uint64_t hi;
      uint64_t nb_chunks;
      double time;
    } range_run;
  } u;
};

template <bool enabled>
class _buffer {
public:

  static
  time::time_type basetime;

  static
  perworker::array<std::vector<event_type>> buf;

  static
  void init() {
    basetime = time::now();
  }

  static inline
  void push(event_type e) {
    if (! enabled) {
      return;
    }
    e.timestamp = time::microseconds_since(basetime);
    buf.mine().push_back(e);
  }

  static inline
  void push_cache_fill(uint64_t index) {
    event_type e;
    e.tag = cache_fill;
    e.u.cache_fill.index = index;
    push(e);
  }

  static inline
  void push_chunk_run(uint64_t lo, uint64_t hi, double time) {
    event_type e;
    e.tag = chunk_run;
    e.u.chunk_run.lo = lo;
    e.u.chunk_run.hi = hi;
    e.u.chunk_run.time = time;
    push(e);
  }

  static inline
  void push_range_run(uint64_t lo, uint64_t hi, uint64_t nb_chunks, double time) {
    event_type e;
    e.tag = range_run;
    e.u.range_run.lo = lo;
    e.u.range_run.hi = hi;
    e.u.range_run.nb_chunks = nb_chunks;
    e.u.range_run.time = time;
    push(e);
  }

  static inline
  void print_text(FILE* f, event_type e) {
    fprintf(f, "%f\t", e.timestamp);
    switch (e.tag) {
      case cache_fill: {
        fprintf(f, "cache_fill\t%" PRIu64,
                e.u.cache_fill.index);
        break;
      }
      case chunk_run: {
        fprintf(f, "chunk_run\t%" PRIu64 "\t%" PRIu64 "\t%f",
                e.u.chunk_run.lo,
                e.u.chunk_run.hi,
                e.u.chunk_run.time);
        break;
      }
      case range_run: {
        fprintf(f, "range_run\t%" PRIu64 "\t%" PRIu64 "\t%" PRIu64 "\t%f",
                e.u.range_run.lo,
                e.u.range_run.hi,
                e.u.range_run.nb_chunks,
                e.u.range_run.time);
        break;
      }
    }
    fprintf(f, "\n");
  }

  static
  void output_text(const std::string& fname, std::vector<event_type>& b) {
    FILE* f = fopen(fname.c_str(), "w");
    if (f == nullptr) {
      die("sfib: failed to open event log %s", fname.c_str());
    }
    for (auto e : b) {
      print_text(f, e);
    }
    fclose(f);
  }

  // merges the per-worker buffers in timestamp order; an empty file name
  // means the log is not wanted
  static
  void output(const std::string& fname) {
    if (fname == "") {
      return;
    }
    std::vector<event_type> out;
    buf.iterate([&] (std::vector<event_type>& b) {
      for (auto e : b) {
        out.push_back(e);
      }
    });
    std::stable_sort(out.begin(), out.end(), [] (const event_type& e1, const event_type& e2) {
      return e1.timestamp < e2.timestamp;
    });
    output_text(fname, out);
  }

  static
  void clear() {
    buf.iterate([&] (std::vector<event_type>& b) {
      b.clear();
    });
  }

};

template <bool enabled>
perworker::array<std::vector<event_type>> _buffer<enabled>::buf;

template <bool enabled>
time::time_type _buffer<enabled>::basetime;

#ifdef SFIB_ENABLE_LOGGING
using buffer = _buffer<true>;
#else
using buffer = _buffer<false>;
#endif

} // end namespace
} // end namespace

#endif
