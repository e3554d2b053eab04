#pragma once

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <numeric>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>
#include <boost/container_hash/hash.hpp>

typedef double real_t;
typedef std::pair<size_t, size_t> chain_pair_t;

template <typename T> T quiet_nan() {
  return std::numeric_limits<T>::quiet_NaN();
}

template <typename T> T inf() { return std::numeric_limits<T>::infinity(); }

// Largest integer argument for which exp() stays finite in real_t.
inline real_t max_exponent() {
  return std::floor(std::log(std::numeric_limits<real_t>::max()));
}

// exp() with its argument clamped to the representable range, so that huge
// energy differences saturate instead of overflowing.
inline real_t clipped_exp(real_t x) {
  const real_t limit = max_exponent();
  return std::exp(std::min(limit, std::max(-limit, x)));
}

// Metropolis acceptance probability min(1, exp(x)), always finite.
inline real_t metropolis_probability(real_t log_ratio) {
  if (log_ratio >= 0) {
    return 1;
  }
  return std::min(real_t(1), clipped_exp(log_ratio));
}

template <typename A, typename B> struct pair_hash {
  std::size_t operator()(const std::pair<A, B> &pair) const {
    size_t hashval = std::hash<A>()(pair.first);
    boost::hash_combine(hashval, pair.second);
    return hashval;
  }
};

typedef std::unordered_map<chain_pair_t, size_t, pair_hash<size_t, size_t>>
    chain_pair_index_t;

class rexmc_quiet_output {
public:
  static bool enabled() { return enabled_; }
  static void disable() { enabled_ = false; }
  static void enable() { enabled_ = true; }

private:
  static bool enabled_;
};

inline void rexmc_log_printf(char const *fmt, ...) {
  if (rexmc_quiet_output::enabled()) {
    return;
  }

  va_list ap;
  va_start(ap, fmt);
  if (fmt)
    vfprintf(stderr, fmt, ap);
  else
    fprintf(stderr, "(null)");
  va_end(ap);
}

// map lookup logging
template <typename container_t>
const auto &logged_at(const container_t &map,
                      const typename container_t::key_type &key,
                      const std::string &mapname) {
  auto result = map.find(key);
  if (result == map.end()) {
    std::ostringstream keystr;
    keystr << key;
    throw std::out_of_range("Key \"" + keystr.str() + "\" not found in " +
                            mapname);
  }
  return result->second;
}

// A parameter was assigned a value outside of its domain.
struct parameter_value_error : public std::invalid_argument {
  parameter_value_error(const std::string &param, real_t value,
                        const std::string &requirement)
      : std::invalid_argument(describe(param, value, requirement)) {}

private:
  static std::string describe(const std::string &param, real_t value,
                              const std::string &requirement) {
    std::ostringstream msg;
    msg << "Invalid value for parameter " << param << ": " << value << " ("
        << requirement << ")";
    return msg.str();
  }
};

template <typename T>
void check_positive(const T &value, const std::string &name) {
  if (!(value > 0) || !std::isfinite(real_t(value))) {
    throw parameter_value_error(name, real_t(value),
                                "must be positive and finite");
  }
}

// An integral count given as a real, e.g. read from a configuration file.
inline size_t count_from_real(real_t value, const std::string &name) {
  if (!(value >= 0) || value != std::floor(value) ||
      value >= real_t(std::numeric_limits<size_t>::max())) {
    throw parameter_value_error(name, value, "must be a non-negative integer");
  }
  return size_t(value);
}

template <typename pointer_t>
void check_not_null(const pointer_t &pointer, const std::string &name) {
  if (!pointer) {
    throw std::invalid_argument(name + " must not be null");
  }
}
