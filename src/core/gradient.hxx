#pragma once

#include "density.hxx"

// Time-dependent gradient of a potential energy, G(q, t).
struct gradient_t {
  virtual ~gradient_t() {}
  virtual vector_t operator()(const vector_t &q, real_t t) const = 0;
};

typedef std::shared_ptr<const gradient_t> gradient_ptr;

// Time-independent gradient of a density's energy.
class density_gradient_t : public gradient_t {
  std::shared_ptr<const density_t> _density;

public:
  explicit density_gradient_t(std::shared_ptr<const density_t> density)
      : _density(density) {
    check_not_null(_density, "density");
  }

  vector_t operator()(const vector_t &q, real_t /*t*/) const override {
    return _density->gradient(q);
  }
};
