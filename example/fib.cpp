#include <iostream>
#include <string>

#include "sflaunch.hpp"
#include "sfengine.hpp"

namespace sfib {

void ex() {
  index_type n = deepsea::cmdline::parse_or_default_int("n", 10);
  strain s = parse_or_default_strain("strain", strain::hybrid);
  double multiplier = deepsea::cmdline::parse_or_default_double("multiplier", profile_of(s).multiplier);
  engine calculator(multiplier, name_of(s));
  try {
    uint128 r = calculator.compute(n);
    std::cout << "strain\t" << calculator.get_label() << std::endl;
    std::cout << "multiplier\t" << calculator.get_multiplier() << std::endl;
    std::cout << "result\t" << u128::to_string(r) << std::endl;
    std::cout << "cache_size\t" << calculator.cache_size() << std::endl;
  } catch (const error& e) {
    std::cerr << "error\t" << e.what() << std::endl;
  }
}

} // end namespace

int main(int argc, char** argv) {
  sfib::launch(argc, argv, [&] {
    sfib::ex();
  });
  return 0;
}
