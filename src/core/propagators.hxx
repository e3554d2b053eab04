#pragma once

#include "../util/randgen.h"
#include "integrators.hxx"
#include "interpolation.hxx"

// Deterministic molecular dynamics under a (possibly time-dependent)
// gradient.
class md_propagator_t {
protected:
  gradient_ptr _gradient;
  real_t _timestep;
  array_t<real_t> _masses;
  integrators::integrator_type_t _integrator;

public:
  md_propagator_t(gradient_ptr gradient, real_t timestep,
                  const array_t<real_t> &masses = array_t<real_t>(),
                  integrators::integrator_type_t integrator =
                      integrators::integrator_type_t::leapfrog);
  virtual ~md_propagator_t() {}

  virtual propagation_result_ptr generate(const state_ptr &init_state,
                                          size_t length,
                                          bool return_trajectory = false);
};

// MD coupled to an Andersen thermostat: every update_interval steps, each
// momentum component is redrawn from the Maxwell-Boltzmann distribution at
// the current temperature with probability collision_probability.  The
// heat is the sum of the kinetic energy changes divided by temperature.
class thermostatted_md_propagator_t : public md_propagator_t {
  temperature_ptr _temperature;
  real_t _collision_probability;
  size_t _update_interval;
  randgen &_rng;

  real_t collide(vector_t &momentum, const array_t<real_t> &inverse_masses,
                 real_t temperature);

public:
  thermostatted_md_propagator_t(
      gradient_ptr gradient, real_t timestep, temperature_ptr temperature,
      real_t collision_probability, size_t update_interval, randgen &rng,
      const array_t<real_t> &masses = array_t<real_t>(),
      integrators::integrator_type_t integrator =
          integrators::integrator_type_t::leapfrog);

  propagation_result_ptr generate(const state_ptr &init_state, size_t length,
                                  bool return_trajectory = false) override;
};
