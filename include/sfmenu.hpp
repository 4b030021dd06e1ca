
#include <cmath>
#include <iomanip>
#include <istream>
#include <limits>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "sfengine.hpp"
#include "sferror.hpp"
#include "sfio.hpp"
#include "sfsequence.hpp"
#include "sftime.hpp"
#include "sfworkers.hpp"

#ifndef _SFIB_MENU_H_
#define _SFIB_MENU_H_

namespace sfib {

/*---------------------------------------------------------------------*/
/* Interactive text menu */

static constexpr
std::size_t menu_max_display_terms = 30;

static constexpr
index_type menu_range_lo = 20;

static constexpr
index_type menu_range_hi = 41;

static constexpr
std::size_t menu_ratio_terms = 20;

static constexpr
index_type menu_comparison_index = 30;

class menu {
private:

  std::istream& in;

  std::ostream& out;

  static
  std::string trim(const std::string& s) {
    const char* blanks = " \t\r\n";
    std::size_t lo = s.find_first_not_of(blanks);
    if (lo == std::string::npos) {
      return "";
    }
    std::size_t hi = s.find_last_not_of(blanks);
    return s.substr(lo, hi - lo + 1);
  }

  static
  bool parse_index(const std::string& s, index_type& dst) {
    if (s.empty()) {
      return false;
    }
    index_type r = 0;
    for (char c : s) {
      if (c < '0' || c > '9') {
        return false;
      }
      index_type d = (index_type) (c - '0');
      if (r > (std::numeric_limits<index_type>::max() - d) / 10) {
        return false;
      }
      r = r * 10 + d;
    }
    dst = r;
    return true;
  }

  // false once the input is exhausted
  bool read_line(std::string& dst) {
    std::string line;
    if (! std::getline(in, line)) {
      return false;
    }
    dst = trim(line);
    return true;
  }

  bool prompt_index(const char* prompt, index_type& dst) {
    out << prompt << std::flush;
    std::string line;
    if (! read_line(line)) {
      return false;
    }
    if (! parse_index(line, dst)) {
      out << "Invalid number format\n";
      return false;
    }
    return true;
  }

  static
  double milliseconds_since(time::time_type start) {
    return time::microseconds_since(start) / 1000.0;
  }

  void print_banner() {
    out << "\nStrain Fibonacci Menu:\n";
    out << "======================\n";
    out << "1. Single Strain Fibonacci\n";
    out << "2. Generate Fibonacci Sequence\n";
    out << "3. Concurrent Fibonacci Range\n";
    out << "4. Golden Ratio Convergence Analysis\n";
    out << "5. Strain Performance Comparison\n";
    out << "6. About the Strain Recurrence\n";
    out << "7. Exit\n";
    out << "\n";
    out << "Enter choice (1-7): " << std::flush;
  }

  void single_value() {
    out << "\nSingle Strain Fibonacci Calculation\n";
    index_type n;
    if (! prompt_index("Enter Fibonacci position (0-186): ", n)) {
      return;
    }
    engine calculator(strain::hybrid);
    try {
      uint128 result = calculator.compute(n);
      out << "Fibonacci(" << n << ") = " << u128::to_string(result) << "\n";
      out << "Calculated with " << calculator.get_label() << " strain multiplier\n";
    } catch (const error& e) {
      out << "Calculation error: " << e.what() << "\n";
    }
  }

  void sequence() {
    out << "\nBounded Fibonacci Sequence\n";
    index_type count;
    if (! prompt_index("Enter number of terms (1-30): ", count)) {
      return;
    }
    if (count > menu_max_display_terms) {
      out << "Limiting to 30 terms for display purposes\n";
      return;
    }
    bounded_sequence seq(strain::sativa);
    out << "\nSativa bounded sequence:\n";
    io::write_terms(out, take(seq, (std::size_t) count));
  }

  void concurrent_range() {
    out << "\nConcurrent Fibonacci Computation\n";
    engine calculator(strain::hybrid);
    out << "Computing Fibonacci numbers " << menu_range_lo << "-" << (menu_range_hi - 1)
        << " on " << workers::get_nb_workers() << " workers...\n";
    auto start = time::now();
    try {
      std::map<index_type, uint128> results =
        calculator.compute_range_concurrently(menu_range_lo, menu_range_hi);
      double elapsed = milliseconds_since(start);
      out << "\nConcurrent Computation Results:\n";
      io::write_table(out, results);
      out << "\nConcurrent computation completed in " << elapsed << " ms\n";
    } catch (const error& e) {
      out << "Concurrent computation error: " << e.what() << "\n";
    }
  }

  void golden_ratio() {
    out << "\nGolden Ratio Convergence Analysis\n";
    engine calculator(strain::indica);
    try {
      std::vector<double> ratios = calculator.golden_ratio_ratios(menu_ratio_terms);
      double phi = (1.0 + std::sqrt(5.0)) / 2.0;
      out << "Theoretical Golden Ratio: " << std::fixed << std::setprecision(12) << phi << "\n";
      out.unsetf(std::ios::floatfield);
      out << std::setprecision(6);
      out << "\n" << calculator.get_label() << " Convergence Analysis:\n";
      io::write_ratios(out, ratios);
    } catch (const error& e) {
      out << "Analysis error: " << e.what() << "\n";
    }
  }

  void strain_comparison() {
    out << "\nStrain Performance Comparison\n";
    out << "Benchmarking Fibonacci(" << menu_comparison_index << ") across all strains...\n\n";
    const strain strains[] = { strain::sativa, strain::indica, strain::hybrid };
    for (strain s : strains) {
      engine calculator(s);
      strain_profile profile = profile_of(s);
      auto start = time::now();
      uint128 result = calculator.compute(menu_comparison_index);
      double elapsed = milliseconds_since(start);
      out << name_of(s) << " Strain (" << profile.personality << "):\n";
      out << "  Multiplier: " << profile.multiplier << "\n";
      out << "  Description: " << profile.description << "\n";
      out << "  Result: " << u128::to_string(result) << "\n";
      out << "  Computation Time: " << elapsed << " ms\n\n";
    }
  }

  void about() {
    out << "\nAbout the Strain Recurrence\n";
    out << "===========================\n\n";
    out << "Every strain distorts the Fibonacci recurrence with its multiplier m:\n";
    out << "  a(0) = 0, a(1) = 1, a(n) = floor(m * (a(n-1) + a(n-2)))\n";
    out << "The sum saturates at 2^128-1 instead of wrapping, and the product is\n";
    out << "truncated toward zero. Hybrid (m = 1.0) yields the true Fibonacci numbers.\n\n";
    out << "Single values are memoized and limited to positions 0-186, the last\n";
    out << "position whose Fibonacci number fits in 128 bits. Ranges are split into\n";
    out << "chunks of " << range_chunk_size << " positions and computed in parallel; positions\n";
    out << "past 186 are simply left out of a range result.\n\n";
    out << "The bounded sequence applies the same recurrence without a cache. It stops\n";
    out << "after " << max_sequence_length << " elements or before emitting a value above 2^127.\n";
  }

public:

  menu(std::istream& in, std::ostream& out)
  : in(in), out(out) { }

  // returns when 7 is selected or the input runs out
  void run() {
    out << "\nSTRAIN FIBONACCI\n";
    out << "    memoized, saturating, concurrent\n";
    while (true) {
      print_banner();
      std::string choice;
      if (! read_line(choice)) {
        out << "\n";
        return;
      }
      if (choice == "1") {
        single_value();
      } else if (choice == "2") {
        sequence();
      } else if (choice == "3") {
        concurrent_range();
      } else if (choice == "4") {
        golden_ratio();
      } else if (choice == "5") {
        strain_comparison();
      } else if (choice == "6") {
        about();
      } else if (choice == "7") {
        out << "Leaving the strain Fibonacci menu.\n";
        return;
      } else {
        out << "Invalid choice - please enter 1-7\n";
      }
      out << "\nPress Enter to continue..." << std::flush;
      std::string dummy;
      if (! read_line(dummy)) {
        out << "\n";
        return;
      }
    }
  }

};

} // end namespace

#endif
