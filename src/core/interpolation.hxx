#pragma once

#include "gradient.hxx"

// Work parameter protocol lambda(t, tau).  Implementations are expected to
// satisfy lambda(0, tau) = 0 and lambda(tau, tau) = 1.
struct protocol_t {
  virtual ~protocol_t() {}
  virtual real_t operator()(real_t t, real_t tau) const = 0;
};

typedef std::shared_ptr<const protocol_t> protocol_ptr;

struct linear_protocol_t : public protocol_t {
  real_t operator()(real_t t, real_t tau) const override { return t / tau; }
};

// Runs the linear protocol backwards, from 1 down to 0.
struct reverse_linear_protocol_t : public protocol_t {
  real_t operator()(real_t t, real_t tau) const override {
    return (tau - t) / tau;
  }
};

// Gradient as a function of the work parameter, with g(q, 0) the gradient
// of the first chain's energy and g(q, 1) that of the second.
struct switching_gradient_t {
  virtual ~switching_gradient_t() {}
  virtual vector_t operator()(const vector_t &q, real_t l) const = 0;
};

typedef std::shared_ptr<const switching_gradient_t> switching_gradient_ptr;

// A scalar schedule, either as a function of the work parameter or of time.
struct temperature_t {
  virtual ~temperature_t() {}
  virtual real_t operator()(real_t x) const = 0;
};

typedef std::shared_ptr<const temperature_t> temperature_ptr;

class constant_temperature_t : public temperature_t {
  real_t _temperature;

public:
  explicit constant_temperature_t(real_t temperature = 1)
      : _temperature(temperature) {
    check_positive(_temperature, "temperature");
  }
  real_t operator()(real_t /*x*/) const override { return _temperature; }
};

// T(l) = (1 - l) T1 + l T2
class linear_temperature_t : public temperature_t {
  real_t _t1;
  real_t _t2;

public:
  linear_temperature_t(real_t t1, real_t t2) : _t1(t1), _t2(t2) {
    check_positive(_t1, "t1");
    check_positive(_t2, "t2");
  }
  real_t operator()(real_t l) const override {
    return (1 - l) * _t1 + l * _t2;
  }
};

class interpolated_gradient_t : public gradient_t {
  switching_gradient_ptr _gradient;
  protocol_ptr _protocol;
  real_t _tau;

public:
  interpolated_gradient_t(switching_gradient_ptr gradient,
                          protocol_ptr protocol, real_t tau)
      : _gradient(gradient), _protocol(protocol), _tau(tau) {}

  vector_t operator()(const vector_t &q, real_t t) const override {
    return (*_gradient)(q, (*_protocol)(t, _tau));
  }
};

class interpolated_temperature_t : public temperature_t {
  temperature_ptr _temperature;
  protocol_ptr _protocol;
  real_t _tau;

public:
  interpolated_temperature_t(temperature_ptr temperature,
                             protocol_ptr protocol, real_t tau)
      : _temperature(temperature), _protocol(protocol), _tau(tau) {}

  real_t operator()(real_t t) const override {
    return (*_temperature)((*_protocol)(t, _tau));
  }
};

// Produces the time-dependent functions driving a non-equilibrium
// trajectory of length tau under a given protocol.
class interpolation_factory_t {
  protocol_ptr _protocol;
  real_t _tau;

public:
  interpolation_factory_t(protocol_ptr protocol, real_t tau);

  const protocol_ptr &protocol() const { return _protocol; }
  real_t tau() const { return _tau; }

  void set_protocol(protocol_ptr protocol);
  void set_tau(real_t tau);

  gradient_ptr build_gradient(switching_gradient_ptr gradient) const;
  temperature_ptr build_temperature(temperature_ptr temperature) const;
};
