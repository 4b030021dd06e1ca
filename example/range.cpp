#include <iostream>
#include <map>

#include "sflaunch.hpp"
#include "sfengine.hpp"
#include "sfio.hpp"
#include "sftime.hpp"

namespace sfib {

void ex() {
  index_type lo = deepsea::cmdline::parse_or_default_int("lo", 20);
  index_type hi = deepsea::cmdline::parse_or_default_int("hi", 41);
  strain s = parse_or_default_strain("strain", strain::hybrid);
  engine calculator(s);
  auto start = time::now();
  try {
    std::map<index_type, uint128> results = calculator.compute_range_concurrently(lo, hi);
    double elapsed = time::microseconds_since(start);
    io::write_table(std::cout, results);
    std::cout << "nb_results\t" << results.size() << std::endl;
    std::cout << "nb_workers\t" << workers::get_nb_workers() << std::endl;
    printf("exectime %.3lf\n", elapsed / 1000000.0);
  } catch (const error& e) {
    std::cerr << "error\t" << name_of(e.get_kind()) << "\t" << e.what() << std::endl;
  }
}

} // end namespace

int main(int argc, char** argv) {
  sfib::launch(argc, argv, [&] {
    sfib::ex();
  });
  return 0;
}
