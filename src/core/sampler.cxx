#include "sampler.hxx"
#include "propagators.hxx"

single_chain_mc_t::single_chain_mc_t(std::shared_ptr<const density_t> pdf,
                                     const state_ptr &state,
                                     real_t temperature, uint64_t seed)
    : _pdf(pdf), _temperature(1), _rng(seed) {
  check_not_null(_pdf, "density");
  set_temperature(temperature);
  set_state(state);
}

void single_chain_mc_t::check_state(const state_ptr &state) const {
  mc_t<state_t>::check_state(state);
  if (this->state() && this->state()->dimension() != state->dimension()) {
    throw std::invalid_argument("state dimension " +
                                std::to_string(state->dimension()) +
                                " does not match chain dimension " +
                                std::to_string(this->state()->dimension()));
  }
}

void single_chain_mc_t::set_temperature(real_t temperature) {
  check_positive(temperature, "temperature");
  _temperature = temperature;
}

real_t single_chain_mc_t::energy() const {
  return _pdf->energy(state()->position());
}

state_ptr single_chain_mc_t::sample() {
  real_t log_ratio = 0;
  auto proposal = propose(log_ratio);
  bool accepted = _rng.uniform() < metropolis_probability(log_ratio);
  if (accepted) {
    set_state(proposal);
  }
  _statistics.update(accepted);
  return state();
}

rwmc_sampler_t::rwmc_sampler_t(std::shared_ptr<const density_t> pdf,
                               const state_ptr &state, real_t stepsize,
                               real_t temperature, uint64_t seed)
    : single_chain_mc_t(pdf, state, temperature, seed), _stepsize(1) {
  set_stepsize(stepsize);
}

void rwmc_sampler_t::set_stepsize(real_t stepsize) {
  check_positive(stepsize, "stepsize");
  _stepsize = stepsize;
}

state_ptr rwmc_sampler_t::propose(real_t &log_ratio) {
  const vector_t &x = state()->position();
  vector_t y(x.size());
  for (Eigen::Index i = 0; i < x.size(); i++) {
    y[i] = x[i] + _stepsize * (2 * _rng.uniform() - 1);
  }
  log_ratio = -(energy(y) - energy(x)) / _temperature;
  return std::make_shared<state_t>(y);
}

hmc_sampler_t::hmc_sampler_t(std::shared_ptr<const density_t> pdf,
                             const state_ptr &state, gradient_ptr gradient,
                             real_t timestep, size_t nsteps,
                             real_t temperature, uint64_t seed,
                             const array_t<real_t> &masses,
                             integrators::integrator_type_t integrator)
    : single_chain_mc_t(pdf, state, temperature, seed), _gradient(gradient),
      _timestep(timestep), _nsteps(nsteps), _masses(masses),
      _integrator(integrator) {
  check_not_null(_gradient, "gradient");
  check_positive(_timestep, "timestep");
  if (_nsteps == 0) {
    throw parameter_value_error("nsteps", 0, "must be positive");
  }
  // validates the mass count against the chain dimension
  inverse_masses(_masses, state->dimension());
}

state_ptr hmc_sampler_t::propose(real_t &log_ratio) {
  const vector_t &q = state()->position();
  auto inv_masses = inverse_masses(_masses, q.size());
  vector_t p(q.size());
  for (Eigen::Index i = 0; i < q.size(); i++) {
    p[i] = _rng.gaussian(0, std::sqrt(_temperature / inv_masses[i]));
  }
  auto init_state = std::make_shared<state_t>(q, p);

  md_propagator_t propagator(_gradient, _timestep, _masses, _integrator);
  auto result = propagator.generate(init_state, _nsteps);
  const auto &final_state = *result->final();

  real_t h_old = energy(q) + kinetic_energy(p, inv_masses);
  real_t h_new = energy(final_state.position()) +
                 kinetic_energy(final_state.momentum(), inv_masses);
  log_ratio = -(h_new - h_old) / _temperature;
  return final_state.without_momentum();
}
