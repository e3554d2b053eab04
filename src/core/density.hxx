#pragma once

#include "../util/eigen.hxx"
#include "../util/util.hxx"

// Probability density a chain samples from.
struct density_t : public std::enable_shared_from_this<density_t> {
  virtual ~density_t() {}

  virtual real_t log_prob(const vector_t &x) const = 0;

  // gradient of -log_prob, needed by dynamics-based chains
  virtual vector_t gradient(const vector_t & /*x*/) const {
    throw std::runtime_error("gradient not defined for this density");
  }

  real_t energy(const vector_t &x) const { return -log_prob(x); }
};
