
#include <stdexcept>
#include <string>

#ifndef _SFIB_ERROR_H_
#define _SFIB_ERROR_H_

namespace sfib {

/*---------------------------------------------------------------------*/
/* Errors surfaced by the engine */

enum class error_kind {
  overflow_risk,
  invalid_range,
  worker_failure
};

static inline
const char* name_of(error_kind kind) {
  switch (kind) {
    case error_kind::overflow_risk:
      return "overflow_risk";
    case error_kind::invalid_range:
      return "invalid_range";
    case error_kind::worker_failure:
      return "worker_failure";
  }
  return "unknown";
}

class error : public std::runtime_error {
private:

  error_kind kind;

public:

  error(error_kind kind, const std::string& what)
  : std::runtime_error(what), kind(kind) { }

  error_kind get_kind() const {
    return kind;
  }

};

// requested index lies past the largest index whose Fibonacci number
// fits in 128 bits
class overflow_risk : public error {
public:

  overflow_risk()
  : error(error_kind::overflow_risk,
          "Fibonacci overflow: result would exceed uint128 capacity") { }

};

class invalid_range : public error {
public:

  invalid_range()
  : error(error_kind::invalid_range,
          "Invalid range: end must be greater than start") { }

};

class worker_failure : public error {
public:

  explicit worker_failure(const std::string& cause)
  : error(error_kind::worker_failure,
          "Worker failure during concurrent computation: " + cause) { }

};

} // end namespace

#endif
