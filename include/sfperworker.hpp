
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <new>
#include <type_traits>

#include "sfmachine.hpp"

#ifndef _SFIB_PERWORKER_H_
#define _SFIB_PERWORKER_H_

namespace sfib {
namespace perworker {

/*---------------------------------------------------------------------*/
/* Worker ID number */

static constexpr
int invalid_worker_id = -1;

static constexpr
int default_max_nb_workers = machine::max_nb_proc + 1;

inline
int& my_id_cell() {
  static __thread int my_id = invalid_worker_id;
  return my_id;
}

inline
std::atomic<int>& id_counter() {
  static std::atomic<int> counter(0);
  return counter;
}

// ids are handed out on first use, one per thread, for the lifetime of
// the process
inline
int get_my_id() {
  int& my_id = my_id_cell();
  if (my_id == invalid_worker_id) {
    my_id = id_counter()++;
  }
  return my_id;
}

/*---------------------------------------------------------------------*/
/* Cache-aligned fixed-capacity array */

template <class Item, int capacity>
class cache_aligned_fixed_capacity_array {
private:

  static constexpr
  int cache_align_szb = 128;

  using aligned_item_type =
    typename std::aligned_storage<sizeof(Item), cache_align_szb>::type;

  aligned_item_type items[capacity];

  Item& at(std::size_t i) {
    return *reinterpret_cast<Item*>(items + i);
  }

public:

  cache_aligned_fixed_capacity_array() {
    for (int i = 0; i < capacity; i++) {
      new (items + i) Item();
    }
  }

  ~cache_aligned_fixed_capacity_array() {
    for (int i = 0; i < capacity; i++) {
      at(i).~Item();
    }
  }

  cache_aligned_fixed_capacity_array(const cache_aligned_fixed_capacity_array&) = delete;
  cache_aligned_fixed_capacity_array& operator=(const cache_aligned_fixed_capacity_array&) = delete;

  Item& operator[](std::size_t i) {
    return at(i);
  }

  template <class Body_fct>
  void iterate(const Body_fct& f, int n) {
    for (int i = 0; i < n; i++) {
      f(at(i));
    }
  }

};

/*---------------------------------------------------------------------*/
/* Per-worker array */

template <class Item, int max_nb_workers=default_max_nb_workers>
class array {
private:

  cache_aligned_fixed_capacity_array<Item, max_nb_workers> items;

  static
  int checked_id() {
    int id = get_my_id();
    if (id >= max_nb_workers) {
      die("sfib: worker %d exceeds the per-worker capacity of %d", id, max_nb_workers);
    }
    return id;
  }

public:

  array() { }

  Item& mine() {
    return items[checked_id()];
  }

  // visits the slots of every worker that has been assigned an id so far
  template <class Body_fct>
  void iterate(const Body_fct& body) {
    int n = std::min(id_counter().load(), max_nb_workers);
    items.iterate(body, n);
  }

};

} // end namespace
} // end namespace

#endif
