#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

#include "sflaunch.hpp"
#include "sfengine.hpp"
#include "sfio.hpp"

namespace sfib {

void ex() {
  int terms = deepsea::cmdline::parse_or_default_int("terms", 20);
  strain s = parse_or_default_strain("strain", strain::indica);
  engine calculator(s);
  try {
    std::vector<double> ratios = calculator.golden_ratio_ratios((std::size_t) std::max(0, terms));
    printf("phi %.12f\n", (1.0 + std::sqrt(5.0)) / 2.0);
    io::write_ratios(std::cout, ratios);
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
