#include <algorithm>
#include <iostream>
#include <vector>

#include "sflaunch.hpp"
#include "sfio.hpp"
#include "sfsequence.hpp"

namespace sfib {

void ex() {
  int count = deepsea::cmdline::parse_or_default_int("count", (int) max_sequence_length);
  strain s = parse_or_default_strain("strain", strain::sativa);
  double multiplier = deepsea::cmdline::parse_or_default_double("multiplier", profile_of(s).multiplier);
  bool compact = deepsea::cmdline::parse_or_default_bool("compact", false, false);
  bounded_sequence seq(multiplier);
  std::vector<uint128> xs = take(seq, (std::size_t) std::max(0, count));
  if (compact) {
    io::write_sequence(std::cout, xs) << std::endl;
  } else {
    io::write_terms(std::cout, xs, 0, 40);
  }
  std::cout << "nb_emitted\t" << seq.get_nb_emitted() << std::endl;
  std::cout << "ended\t" << (seq.is_ended() ? "yes" : "no") << std::endl;
}

} // end namespace

int main(int argc, char** argv) {
  sfib::launch(argc, argv, [&] {
    sfib::ex();
  });
  return 0;
}
