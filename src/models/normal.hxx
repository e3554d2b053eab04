#pragma once

#include "../core/density.hxx"
#include "../core/interpolation.hxx"
#include "../util/util.hxx"

// Isotropic normal density; every component of x is an independent
// N(mu, sigma^2) variable.
class normal_density_t : public density_t {
  real_t _mu;
  real_t _sigma;

public:
  normal_density_t(real_t mu = 0, real_t sigma = 1) : _mu(0), _sigma(1) {
    set_mu(mu);
    set_sigma(sigma);
  }

  real_t mu() const { return _mu; }
  real_t sigma() const { return _sigma; }

  void set_mu(real_t mu) {
    if (!std::isfinite(mu)) {
      throw parameter_value_error("mu", mu, "must be finite");
    }
    _mu = mu;
  }

  void set_sigma(real_t sigma) { check_positive(sigma, "sigma"); _sigma = sigma; }

  real_t log_prob(const vector_t &x) const override {
    const real_t variance = _sigma * _sigma;
    const real_t norm = -0.5 * std::log(2 * M_PI * variance);
    return x.size() * norm -
           (x.array() - _mu).square().sum() / (2 * variance);
  }

  vector_t gradient(const vector_t &x) const override {
    return ((x.array() - _mu) / (_sigma * _sigma)).matrix();
  }
};

// Switching gradient between two zero-mean normal energies:
// (l / sigma2^2 + (1 - l) / sigma1^2) q
class normal_switching_gradient_t : public switching_gradient_t {
  real_t _sigma1;
  real_t _sigma2;

public:
  normal_switching_gradient_t(real_t sigma1, real_t sigma2)
      : _sigma1(sigma1), _sigma2(sigma2) {
    check_positive(_sigma1, "sigma1");
    check_positive(_sigma2, "sigma2");
  }

  vector_t operator()(const vector_t &q, real_t l) const override {
    return (l / (_sigma2 * _sigma2) + (1 - l) / (_sigma1 * _sigma1)) * q;
  }
};
