
#include <cstddef>
#include <vector>

#include "sfengine.hpp"
#include "sfuint128.hpp"

#ifndef _SFIB_SEQUENCE_H_
#define _SFIB_SEQUENCE_H_

namespace sfib {

/*---------------------------------------------------------------------*/
/* Bounded lazy sequence */

static constexpr
std::size_t max_sequence_length = 100;

/* Iterative counterpart of engine::compute: same recurrence, no cache and
 * no index limit. The sequence ends after max_sequence_length elements, or as
 * soon as the next element would exceed u128::half_max_value, and stays
 * ended; a fresh instance starts over from 0.
 */

class bounded_sequence {
private:

  double multiplier;

  uint128 current = 0;

  uint128 following = 1;

  std::size_t nb_emitted = 0;

  bool ended = false;

public:

  explicit bounded_sequence(double multiplier)
  : multiplier(multiplier) { }

  explicit bounded_sequence(strain s)
  : multiplier(profile_of(s).multiplier) { }

  bool next(uint128& dst) {
    if (ended) {
      return false;
    }
    if (nb_emitted >= max_sequence_length || current > u128::half_max_value) {
      ended = true;
      return false;
    }
    dst = current;
    uint128 after = u128::scale(u128::saturating_add(current, following), multiplier);
    current = following;
    following = after;
    nb_emitted++;
    return true;
  }

  std::size_t get_nb_emitted() const {
    return nb_emitted;
  }

  bool is_ended() const {
    return ended;
  }

};

// at most count elements, fewer if the sequence ends first
static inline
std::vector<uint128> take(bounded_sequence& seq, std::size_t count) {
  std::vector<uint128> xs;
  uint128 x;
  while (xs.size() < count && seq.next(x)) {
    xs.push_back(x);
  }
  return xs;
}

} // end namespace

#endif
