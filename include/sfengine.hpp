
#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "sferror.hpp"
#include "sflogging.hpp"
#include "sfmemo.hpp"
#include "sftime.hpp"
#include "sfuint128.hpp"
#include "sfworkers.hpp"

#ifndef _SFIB_ENGINE_H_
#define _SFIB_ENGINE_H_

namespace sfib {

/*---------------------------------------------------------------------*/
/* Strains */

enum class strain {
  sativa,
  indica,
  hybrid
};

using strain_profile = struct {
  double multiplier;
  const char* personality;
  const char* description;
};

static inline
strain_profile profile_of(strain s) {
  switch (s) {
    case strain::sativa:
      return { 1.2, "Energetic", "Fast computation with creative optimizations" };
    case strain::indica:
      return { 0.8, "Relaxed", "Methodical calculation with deep caching" };
    case strain::hybrid:
      break;
  }
  return { 1.0, "Balanced", "Optimal mix of speed and accuracy" };
}

static inline
const char* name_of(strain s) {
  switch (s) {
    case strain::sativa:
      return "Sativa";
    case strain::indica:
      return "Indica";
    case strain::hybrid:
      break;
  }
  return "Hybrid";
}

// accepts the lower-case names used on the command line
static inline
bool strain_of_name(const std::string& name, strain& dst) {
  if (name == "sativa") {
    dst = strain::sativa;
  } else if (name == "indica") {
    dst = strain::indica;
  } else if (name == "hybrid") {
    dst = strain::hybrid;
  } else {
    return false;
  }
  return true;
}

/*---------------------------------------------------------------------*/
/* Fibonacci engine */

// F(186) is the last Fibonacci number below 2^128
static constexpr
index_type max_safe_index = 186;

static constexpr
index_type range_chunk_size = 10;

// index and microseconds spent in compute(index)
using benchmark_sample = std::pair<index_type, double>;

class engine {
private:

  memo_table<index_type, uint128> cache;

  double multiplier;

  std::string label;

public:

  engine(double multiplier, std::string label)
  : cache({ { 0, 0 }, { 1, 1 } }),
    multiplier(multiplier),
    label(std::move(label)) { }

  explicit engine(strain s)
  : engine(profile_of(s).multiplier, name_of(s)) { }

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  double get_multiplier() const {
    return multiplier;
  }

  const std::string& get_label() const {
    return label;
  }

  std::size_t cache_size() const {
    return cache.size();
  }

  // a(n) = floor(multiplier * (a(n-1) + a(n-2))), a(0) = 0, a(1) = 1; the
  // sum saturates at 2^128-1. Throws overflow_risk for n > max_safe_index.
  uint128 compute(index_type n) {
    if (n > max_safe_index) {
      throw overflow_risk();
    }
    uint128 result;
    if (cache.find(n, result)) {
      return result;
    }
    if (n <= 1) {
      result = (uint128) n;
    } else {
      uint128 a = compute(n - 1);
      uint128 b = compute(n - 2);
      result = u128::scale(u128::saturating_add(a, b), multiplier);
    }
    logging::buffer::push_cache_fill(n);
    return cache.insert(n, result);
  }

  std::vector<uint128> generate_sequence(std::size_t count) {
    std::vector<uint128> sequence;
    sequence.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
      sequence.push_back(compute((index_type) i));
    }
    return sequence;
  }

  // Indices past max_safe_index are left out of the result and get no
  // chunk; a chunk that fails fails the whole range with worker_failure.
  std::map<index_type, uint128> compute_range_concurrently(index_type start, index_type end) {
    if (end <= start) {
      throw invalid_range();
    }
    auto t = time::now();
    memo_table<index_type, uint128> results;
    index_type stop = std::min(end, max_safe_index + 1);
    index_type nb_chunks =
      workers::range::chunked_for(start, stop, range_chunk_size,
                                  [&] (index_type lo, index_type hi) {
      for (index_type n = lo; n < hi; n++) {
        results.insert(n, compute(n));
      }
    });
    logging::buffer::push_range_run(start, end, nb_chunks, time::microseconds_since(t));
    return results.snapshot();
  }

  std::vector<double> golden_ratio_ratios(std::size_t terms) {
    std::vector<uint128> sequence = generate_sequence(terms);
    std::vector<double> ratios;
    for (std::size_t i = 1; i < sequence.size(); i++) {
      if (sequence[i - 1] == 0) {
        continue;
      }
      ratios.push_back(u128::to_double(sequence[i]) / u128::to_double(sequence[i - 1]));
    }
    return ratios;
  }

  // times a single compute(n) for n = 1, 6, 11, ... up to max_n
  std::vector<benchmark_sample> benchmark(index_type max_n) {
    std::vector<benchmark_sample> samples;
    for (index_type n = 1; n <= max_n; n += 5) {
      auto t = time::now();
      compute(n);
      samples.push_back(std::make_pair(n, time::microseconds_since(t)));
      if (max_n - n < 5) {
        break;
      }
    }
    return samples;
  }

};

} // end namespace

#endif
