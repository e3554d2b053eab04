#pragma once

#include "gradient.hxx"
#include "trajectory.hxx"

namespace integrators {

enum class integrator_type_t { leapfrog, velocity_verlet };

// Advances a position/momentum pair under a time-dependent gradient.
class integrator_base_t {
protected:
  real_t _timestep;
  gradient_ptr _gradient;

public:
  integrator_base_t(real_t timestep, gradient_ptr gradient)
      : _timestep(timestep), _gradient(gradient) {
    check_positive(_timestep, "timestep");
    check_not_null(_gradient, "gradient");
  }
  virtual ~integrator_base_t() {}

  real_t timestep() const { return _timestep; }

  // one step of size timestep starting at time t
  virtual void step(vector_t &q, vector_t &p,
                    const array_t<real_t> &inverse_masses, real_t t) const = 0;

  // integrate length steps starting from time zero
  virtual propagation_result_ptr integrate(const state_ptr &init_state,
                                           size_t length,
                                           const array_t<real_t> &masses,
                                           bool return_trajectory = false) const;

  virtual integrator_type_t type() const = 0;
  virtual std::string name() const = 0;

  static std::unique_ptr<integrator_base_t>
  create(integrator_type_t type, real_t timestep, gradient_ptr gradient);
};

// Leapfrog with half kicks fused across steps: one gradient evaluation per
// step.  Intermediate states carry half-step momenta.
class leapfrog_t : public integrator_base_t {
public:
  using integrator_base_t::integrator_base_t;

  void step(vector_t &q, vector_t &p, const array_t<real_t> &inverse_masses,
            real_t t) const override;
  propagation_result_ptr integrate(const state_ptr &init_state, size_t length,
                                   const array_t<real_t> &masses,
                                   bool return_trajectory = false) const override;
  integrator_type_t type() const override {
    return integrator_type_t::leapfrog;
  }
  std::string name() const override { return "Leapfrog"; }
};

class velocity_verlet_t : public integrator_base_t {
public:
  using integrator_base_t::integrator_base_t;

  void step(vector_t &q, vector_t &p, const array_t<real_t> &inverse_masses,
            real_t t) const override;
  integrator_type_t type() const override {
    return integrator_type_t::velocity_verlet;
  }
  std::string name() const override { return "Velocity Verlet"; }
};

integrator_type_t integrator_type_from_name(const std::string &name);

} // namespace integrators
