
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <ios>
#include <map>
#include <ostream>
#include <vector>

#include "sfuint128.hpp"

#ifndef _SFIB_IO_H_
#define _SFIB_IO_H_

namespace sfib {
namespace io {

static inline
std::ostream& write_sequence(std::ostream& out, const std::vector<uint128>& xs) {
  out << "{ ";
  std::size_t sz = xs.size();
  for (std::size_t i = 0; i < sz; i++) {
    out << u128::to_string(xs[i]);
    if (i+1 < sz)
      out << ", ";
  }
  out << " }";
  return out;
}

// one "F(i) = value" line per element, indices starting at first
static inline
std::ostream& write_terms(std::ostream& out, const std::vector<uint128>& xs,
                          index_type first = 0, int width = 20) {
  for (std::size_t i = 0; i < xs.size(); i++) {
    out << "F(" << std::setw(2) << (first + i) << ") = "
        << std::setw(width) << u128::to_string(xs[i]) << "\n";
  }
  return out;
}

static inline
std::ostream& write_table(std::ostream& out, const std::map<index_type, uint128>& xs,
                          int width = 25) {
  for (auto& x : xs) {
    out << "F(" << std::setw(2) << x.first << ") = "
        << std::setw(width) << u128::to_string(x.second) << "\n";
  }
  return out;
}

// ratios[i] is F(i+2)/F(i+1), printed with its distance to phi
static inline
std::ostream& write_ratios(std::ostream& out, const std::vector<double>& ratios) {
  const double phi = (1.0 + std::sqrt(5.0)) / 2.0;
  std::ios::fmtflags flags = out.flags();
  std::streamsize precision = out.precision();
  for (std::size_t i = 0; i < ratios.size(); i++) {
    double err = std::fabs(ratios[i] - phi);
    out << "F(" << std::setw(2) << (i + 2) << ")/F(" << std::setw(2) << (i + 1) << ") = "
        << std::fixed << std::setprecision(12) << ratios[i]
        << " (error: " << std::scientific << std::setprecision(2) << err << ")\n";
  }
  out.flags(flags);
  out.precision(precision);
  return out;
}

} // end namespace
} // end namespace

#endif
