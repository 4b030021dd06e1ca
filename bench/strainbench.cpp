#include <string>
#include <vector>

#include "cmdline.hpp"
#include "sfengine.hpp"
#include "sflaunch.hpp"
#include "sftime.hpp"

namespace sfib {

  // One fresh engine per strain, so the timings of a strain include
  // filling its own cache.
  void bench(strain s, index_type max_n) {
    engine calculator(s);
    auto start = time::now();
    std::vector<benchmark_sample> samples = calculator.benchmark(max_n);
    double elapsed = time::microseconds_since(start);
    printf("strain %s\n", name_of(s));
    for (auto& sample : samples) {
      printf("n %llu\tmicroseconds %.3lf\n",
             (unsigned long long) sample.first,
             sample.second);
    }
    printf("exectime %.3lf\n", elapsed / 1000000.0);
  }

} // end namespace

int main(int argc, char** argv) {
  deepsea::cmdline::set(argc, argv);
  sfib::index_type max_n = deepsea::cmdline::parse_or_default_int("max_n", (int) sfib::max_safe_index);
  std::string name = deepsea::cmdline::parse_or_default_string("strain", "all");
  try {
    if (name == "all") {
      sfib::bench(sfib::strain::sativa, max_n);
      sfib::bench(sfib::strain::indica, max_n);
      sfib::bench(sfib::strain::hybrid, max_n);
    } else {
      sfib::bench(sfib::parse_or_default_strain("strain", sfib::strain::hybrid), max_n);
    }
  } catch (const sfib::error& e) {
    fprintf(stderr, "error %s\n", e.what());
    return 1;
  }
  return 0;
}
