
#include <string>

#include "cmdline.hpp"

#include "sfengine.hpp"
#include "sflogging.hpp"
#include "sfmachine.hpp"
#include "sfworkers.hpp"

#ifndef _SFIB_LAUNCH_H_
#define _SFIB_LAUNCH_H_

namespace sfib {

/*---------------------------------------------------------------------*/
/* Program entry */

/* Reads the runtime options, initializes the machine and the event log,
 * runs body and writes the log. Options:
 *   -sfib_proc n               worker count (default: number of cores, at
 *                              most machine::max_nb_proc)
 *   -numa_alloc_interleaved b  round-robin NUMA page allocation
 *   -sfib_log_text f           event log output, when logging is compiled in
 */
template <class Body>
void launch(int argc, char** argv, const Body& body) {
  deepsea::cmdline::set(argc, argv);
  int nb_proc = deepsea::cmdline::parse_or_default_int("sfib_proc", machine::nb_proc());
  machine::set_nb_proc(nb_proc);
  workers::initialize_runtime(machine::nb_proc());
  bool numa_alloc_interleaved = (machine::nb_proc() == 1) ? false : true;
  numa_alloc_interleaved =
    deepsea::cmdline::parse_or_default_bool("numa_alloc_interleaved", numa_alloc_interleaved, false);
  machine::initialize_hwloc(numa_alloc_interleaved);
#ifdef SFIB_USE_CYCLE_COUNTER
  machine::initialize_cpuinfo();
#endif
  logging::buffer::init();
  body();
  logging::buffer::output(deepsea::cmdline::parse_or_default_string("sfib_log_text", ""));
}

// -name sativa|indica|hybrid; dies on any other name
static inline
strain parse_or_default_strain(const char* name, strain dflt) {
  std::string s = deepsea::cmdline::parse_or_default_string(name, "");
  if (s == "") {
    return dflt;
  }
  strain result;
  if (! strain_of_name(s, result)) {
    die("sfib: unknown strain %s (expected sativa, indica or hybrid)", s.c_str());
  }
  return result;
}

} // end namespace

#endif
