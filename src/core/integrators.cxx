#include "integrators.hxx"

namespace integrators {

namespace {
void check_initial_state(const state_ptr &init_state, size_t length) {
  check_not_null(init_state, "initial state");
  if (!init_state->has_momentum()) {
    throw std::invalid_argument("integration requires a state with momentum");
  }
  if (length == 0) {
    throw std::invalid_argument("trajectory length must be positive");
  }
}
} // namespace

propagation_result_ptr
integrator_base_t::integrate(const state_ptr &init_state, size_t length,
                             const array_t<real_t> &masses,
                             bool return_trajectory) const {
  check_initial_state(init_state, length);
  auto builder = trajectory_builder_t::create(return_trajectory);
  auto inv_masses = inverse_masses(masses, init_state->dimension());

  builder->add_initial_state(init_state);
  vector_t q = init_state->position();
  vector_t p = init_state->momentum();
  for (size_t i = 0; i < length; i++) {
    step(q, p, inv_masses, i * _timestep);
    auto state = std::make_shared<state_t>(q, p);
    if (i + 1 < length) {
      builder->add_intermediate_state(state);
    } else {
      builder->add_final_state(state);
    }
  }
  return builder->product();
}

std::unique_ptr<integrator_base_t>
integrator_base_t::create(integrator_type_t type, real_t timestep,
                          gradient_ptr gradient) {
  switch (type) {
  case integrator_type_t::leapfrog:
    return std::unique_ptr<integrator_base_t>(
        new leapfrog_t(timestep, gradient));
  case integrator_type_t::velocity_verlet:
    return std::unique_ptr<integrator_base_t>(
        new velocity_verlet_t(timestep, gradient));
  }
  throw std::invalid_argument("unknown integrator type");
}

void leapfrog_t::step(vector_t &q, vector_t &p,
                      const array_t<real_t> &inverse_masses, real_t t) const {
  const auto &gradient = *_gradient;
  p -= 0.5 * _timestep * gradient(q, t);
  q += _timestep * (inverse_masses * p.array()).matrix();
  p -= 0.5 * _timestep * gradient(q, t + _timestep);
}

propagation_result_ptr leapfrog_t::integrate(const state_ptr &init_state,
                                             size_t length,
                                             const array_t<real_t> &masses,
                                             bool return_trajectory) const {
  check_initial_state(init_state, length);
  auto builder = trajectory_builder_t::create(return_trajectory);
  auto inv_masses = inverse_masses(masses, init_state->dimension());
  const auto &gradient = *_gradient;

  builder->add_initial_state(init_state);
  vector_t q = init_state->position();
  vector_t p = init_state->momentum();

  p -= 0.5 * _timestep * gradient(q, 0);
  for (size_t i = 0; i + 1 < length; i++) {
    q += _timestep * (inv_masses * p.array()).matrix();
    p -= _timestep * gradient(q, (i + 1) * _timestep);
    builder->add_intermediate_state(std::make_shared<state_t>(q, p));
  }
  q += _timestep * (inv_masses * p.array()).matrix();
  p -= 0.5 * _timestep * gradient(q, length * _timestep);
  builder->add_final_state(std::make_shared<state_t>(q, p));

  return builder->product();
}

void velocity_verlet_t::step(vector_t &q, vector_t &p,
                             const array_t<real_t> &inverse_masses,
                             real_t t) const {
  const auto &gradient = *_gradient;
  vector_t v = (inverse_masses * p.array()).matrix();
  vector_t a = -(inverse_masses * gradient(q, t).array()).matrix();
  q += _timestep * v + 0.5 * _timestep * _timestep * a;
  vector_t a_new = -(inverse_masses * gradient(q, t + _timestep).array()).matrix();
  v += 0.5 * _timestep * (a + a_new);
  p = (v.array() / inverse_masses).matrix();
}

integrator_type_t integrator_type_from_name(const std::string &name) {
  static const std::map<std::string, integrator_type_t> types = {
      {"leapfrog", integrator_type_t::leapfrog},
      {"velocity_verlet", integrator_type_t::velocity_verlet}};
  return logged_at(types, name, "integrator types");
}

} // namespace integrators
