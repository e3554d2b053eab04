#include "propagators.hxx"

using integrators::integrator_base_t;

md_propagator_t::md_propagator_t(gradient_ptr gradient, real_t timestep,
                                 const array_t<real_t> &masses,
                                 integrators::integrator_type_t integrator)
    : _gradient(gradient), _timestep(timestep), _masses(masses),
      _integrator(integrator) {
  check_not_null(_gradient, "gradient");
  check_positive(_timestep, "timestep");
  for (Eigen::Index i = 0; i < _masses.size(); i++) {
    check_positive(_masses[i], "mass");
  }
}

propagation_result_ptr md_propagator_t::generate(const state_ptr &init_state,
                                                 size_t length,
                                                 bool return_trajectory) {
  auto integrator =
      integrator_base_t::create(_integrator, _timestep, _gradient);
  return integrator->integrate(init_state, length, _masses, return_trajectory);
}

thermostatted_md_propagator_t::thermostatted_md_propagator_t(
    gradient_ptr gradient, real_t timestep, temperature_ptr temperature,
    real_t collision_probability, size_t update_interval, randgen &rng,
    const array_t<real_t> &masses, integrators::integrator_type_t integrator)
    : md_propagator_t(gradient, timestep, masses, integrator),
      _temperature(temperature),
      _collision_probability(collision_probability),
      _update_interval(update_interval), _rng(rng) {
  check_not_null(_temperature, "temperature");
  if (!(collision_probability >= 0 && collision_probability <= 1)) {
    throw parameter_value_error("collision_probability", collision_probability,
                                "must lie in [0, 1]");
  }
  if (_update_interval == 0) {
    throw parameter_value_error("update_interval", 0, "must be positive");
  }
}

real_t thermostatted_md_propagator_t::collide(
    vector_t &momentum, const array_t<real_t> &inverse_masses,
    real_t temperature) {
  check_positive(temperature, "temperature");
  std::vector<Eigen::Index> colliding;
  for (Eigen::Index k = 0; k < momentum.size(); k++) {
    if (_rng.uniform() < _collision_probability) {
      colliding.push_back(k);
    }
  }
  if (colliding.empty()) {
    return 0;
  }
  real_t old_kinetic = kinetic_energy(momentum, inverse_masses);
  for (auto k : colliding) {
    momentum[k] = _rng.gaussian(0, std::sqrt(temperature / inverse_masses[k]));
  }
  return (kinetic_energy(momentum, inverse_masses) - old_kinetic) / temperature;
}

propagation_result_ptr
thermostatted_md_propagator_t::generate(const state_ptr &init_state,
                                        size_t length,
                                        bool return_trajectory) {
  check_not_null(init_state, "initial state");
  if (!init_state->has_momentum()) {
    throw std::invalid_argument("propagation requires a state with momentum");
  }
  if (length == 0) {
    throw std::invalid_argument("trajectory length must be positive");
  }
  auto integrator =
      integrator_base_t::create(_integrator, _timestep, _gradient);
  auto inv_masses = inverse_masses(_masses, init_state->dimension());
  auto builder = trajectory_builder_t::create(return_trajectory);
  const auto &temperature = *_temperature;

  builder->add_initial_state(init_state);
  vector_t q = init_state->position();
  vector_t p = init_state->momentum();
  real_t heat = 0;
  for (size_t i = 0; i < length; i++) {
    real_t t = i * _timestep;
    if (i % _update_interval == 0) {
      heat += collide(p, inv_masses, temperature(t));
    }
    integrator->step(q, p, inv_masses, t);
    auto state = std::make_shared<state_t>(q, p);
    if (i + 1 < length) {
      builder->add_intermediate_state(state);
    } else {
      builder->add_final_state(state);
    }
  }
  builder->set_heat(heat);
  rexmc_log_printf("Thermostatted trajectory: %lu steps, heat %f\n", length,
                   heat);
  return builder->product();
}
