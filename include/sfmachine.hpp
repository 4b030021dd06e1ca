
#include <atomic>
#include <mutex>
#include <algorithm>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#ifdef SFIB_HAVE_HWLOC
#include <hwloc.h>
#endif

#ifndef _SFIB_MACHINE_H_
#define _SFIB_MACHINE_H_

namespace sfib {

/*---------------------------------------------------------------------*/
/* Runtime teardown */

inline
std::mutex& print_lock() {
  static std::mutex lock;
  return lock;
}

static inline
void die(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  {
    std::lock_guard<std::mutex> guard(print_lock());
    fprintf(stderr, "Fatal error -- ");
    vfprintf(stderr, fmt, ap);
    fprintf(stderr, "\n");
    fflush(stderr);
  }
  va_end(ap);
  exit(-1);
}

namespace machine {

/*---------------------------------------------------------------------*/
/* Hardware-specific configuration */

#ifdef SFIB_HAVE_HWLOC

class topology_handle {
private:

  hwloc_topology_t topology;

public:

  topology_handle() {
    if (hwloc_topology_init(&topology) < 0) {
      die("sfib: failed to initialize hwloc topology");
    }
    if (hwloc_topology_load(topology) < 0) {
      die("sfib: failed to load hwloc topology");
    }
  }

  ~topology_handle() {
    hwloc_topology_destroy(topology);
  }

  topology_handle(const topology_handle&) = delete;
  topology_handle& operator=(const topology_handle&) = delete;

  hwloc_topology_t get() {
    return topology;
  }

};

inline
hwloc_topology_t topology() {
  static topology_handle handle;
  return handle.get();
}

#endif

static inline
int nb_cores() {
#ifdef SFIB_HAVE_HWLOC
  int n = hwloc_get_nbobjs_by_type(topology(), HWLOC_OBJ_CORE);
  return std::max(1, n);
#else
  return 1;
#endif
}

static inline
void initialize_hwloc(bool numa_alloc_interleaved) {
#ifdef SFIB_HAVE_HWLOC
  if (! numa_alloc_interleaved) {
    return;
  }
  hwloc_bitmap_t all_cpus =
    hwloc_bitmap_dup(hwloc_topology_get_topology_cpuset(topology()));
  int err = hwloc_set_membind(topology(), all_cpus, HWLOC_MEMBIND_INTERLEAVE, 0);
  hwloc_bitmap_free(all_cpus);
  if (err < 0) {
    die("sfib: failed to set NUMA round-robin allocation policy");
  }
#else
  (void) numa_alloc_interleaved;
#endif
}

/*---------------------------------------------------------------------*/
/* CPU frequency */

inline
double& cpu_frequency_ghz() {
  static double ghz = 1.2;
  return ghz;
}

// only needed by the cycle-counter timer
static inline
void initialize_cpuinfo() {
  float cpu_frequency_mhz = 0.0;
#ifdef SFIB_TARGET_LINUX
  /* Get information from /proc/cpuinfo.
   * cpu MHz         : <float>             # cpu frequency in MHz
   */
  FILE* cpuinfo_file = fopen("/proc/cpuinfo", "r");
  char buf[1024];
  if (cpuinfo_file != NULL) {
    while (fgets(buf, sizeof(buf), cpuinfo_file) != 0) {
      sscanf(buf, "cpu MHz : %f", &cpu_frequency_mhz);
    }
    fclose(cpuinfo_file);
  }
#endif
  if (cpu_frequency_mhz == 0.) {
    die("Failed to read CPU frequency");
  }
  cpu_frequency_ghz() = (double) (cpu_frequency_mhz / 1000.0);
}

/*---------------------------------------------------------------------*/
/* Number of workers */

// per-worker tables hold max_nb_proc + 1 ids, the extra one going to the
// thread that launches parallel loops
static constexpr
int max_nb_proc = 127;

inline
std::atomic<int>& nb_proc_cell() {
  static std::atomic<int> nb_proc(-1);
  return nb_proc;
}

static inline
void set_nb_proc(int nb_proc) {
  nb_proc_cell().store(std::min(std::max(1, nb_proc), max_nb_proc));
}

static inline
int nb_proc() {
  int n = nb_proc_cell().load();
  if (n == -1) {
    n = std::min(nb_cores(), max_nb_proc);
    int expected = -1;
    if (! nb_proc_cell().compare_exchange_strong(expected, n)) {
      n = expected;
    }
  }
  return n;
}

} // end namespace
} // end namespace

#endif
