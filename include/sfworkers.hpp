
#include <exception>
#include <mutex>
#include <string>

#if defined(SFIB_USE_CILK_PLUS_RUNTIME)
#include <cilk/cilk.h>
#include <cilk/cilk_api.h>
#elif defined(SFIB_USE_OPENMP)
#include <omp.h>
#endif

#include "sferror.hpp"
#include "sflogging.hpp"
#include "sfmachine.hpp"
#include "sftime.hpp"
#include "sfuint128.hpp"

#ifndef _SFIB_WORKERS_H_
#define _SFIB_WORKERS_H_

namespace sfib {
namespace workers {

/*---------------------------------------------------------------------*/
/* Parallel runtime */

// Must be called before the first parallel loop; the Cilk runtime only
// accepts the setting while it is not yet running.
static inline
void initialize_runtime(int nb_workers) {
#if defined(SFIB_USE_CILK_PLUS_RUNTIME)
  int cilk_failed = __cilkrts_set_param("nworkers", std::to_string(nb_workers).c_str());
  if (cilk_failed) {
    die("Failed to set number of processors to %d in Cilk runtime", nb_workers);
  }
#elif defined(SFIB_USE_OPENMP)
  omp_set_num_threads(nb_workers);
#else
  (void) nb_workers;
#endif
}

static inline
int get_nb_workers() {
#if defined(SFIB_USE_CILK_PLUS_RUNTIME)
  return __cilkrts_get_nworkers();
#elif defined(SFIB_USE_OPENMP)
  return machine::nb_proc();
#else // if defined(SFIB_USE_SEQUENTIAL_ELISION_RUNTIME)
  return 1;
#endif
}

/*---------------------------------------------------------------------*/
/* Chunked parallel loop */

namespace range {

// Splits [lo, hi) into contiguous chunks of at most chunk_size indices and
// runs body(chunk_lo, chunk_hi) once per chunk, in parallel. Returns once
// every chunk has finished. The first exception escaping a chunk is
// reported as a worker_failure for the whole loop; the other chunks still
// run. Returns the number of chunks.
template <class Body>
index_type chunked_for(index_type lo,
                       index_type hi,
                       index_type chunk_size,
                       const Body& body) {
  if (chunk_size == 0) {
    die("sfib: chunked_for requires a positive chunk size");
  }
  if (hi <= lo) {
    return 0;
  }
  index_type nb_chunks = (hi - lo - 1) / chunk_size + 1;
  std::mutex mutex;
  std::exception_ptr failure;
  auto run_chunk = [&] (index_type i) {
    index_type chunk_lo = lo + i * chunk_size;
    index_type chunk_hi = (hi - chunk_lo > chunk_size) ? chunk_lo + chunk_size : hi;
    auto t = time::now();
    try {
      body(chunk_lo, chunk_hi);
    } catch (...) {
      std::lock_guard<std::mutex> guard(mutex);
      if (! failure) {
        failure = std::current_exception();
      }
      return;
    }
    logging::buffer::push_chunk_run(chunk_lo, chunk_hi, time::microseconds_since(t));
  };
#if defined(SFIB_USE_CILK_PLUS_RUNTIME)
  cilk_for (index_type i = 0; i < nb_chunks; i++) {
    run_chunk(i);
  }
#elif defined(SFIB_USE_OPENMP)
  int nb_threads = machine::nb_proc();
  #pragma omp parallel for schedule(dynamic, 1) num_threads(nb_threads)
  for (index_type i = 0; i < nb_chunks; i++) {
    run_chunk(i);
  }
#else // if defined(SFIB_USE_SEQUENTIAL_ELISION_RUNTIME)
  for (index_type i = 0; i < nb_chunks; i++) {
    run_chunk(i);
  }
#endif
  if (failure) {
    try {
      std::rethrow_exception(failure);
    } catch (const std::exception& e) {
      throw worker_failure(e.what());
    } catch (...) {
      throw worker_failure("unknown exception");
    }
  }
  return nb_chunks;
}

} // end namespace

} // end namespace
} // end namespace

#endif
