#include "param_info.hxx"

swap_param_info_t::swap_param_info_t(single_chain_ptr sampler1,
                                     single_chain_ptr sampler2)
    : _sampler1(sampler1), _sampler2(sampler2) {
  check_not_null(_sampler1, "sampler1");
  check_not_null(_sampler2, "sampler2");
  if (_sampler1 == _sampler2) {
    throw std::invalid_argument("a chain cannot be swapped with itself");
  }
  if (_sampler1->state()->dimension() != _sampler2->state()->dimension()) {
    throw std::invalid_argument("swapped chains must have equal dimension");
  }
}

md_rens_swap_param_info_t::md_rens_swap_param_info_t(
    single_chain_ptr sampler1, single_chain_ptr sampler2, real_t timestep,
    size_t traj_length, switching_gradient_ptr gradient,
    const array_t<real_t> &masses)
    : swap_param_info_t(sampler1, sampler2) {
  set_timestep(timestep);
  set_traj_length(traj_length);
  set_gradient(gradient);
  set_masses(masses);
}

void md_rens_swap_param_info_t::set_timestep(real_t timestep) {
  check_positive(timestep, "timestep");
  _timestep = timestep;
}

void md_rens_swap_param_info_t::set_traj_length(size_t traj_length) {
  if (traj_length == 0) {
    throw parameter_value_error("traj_length", 0, "must be positive");
  }
  _traj_length = traj_length;
}

void md_rens_swap_param_info_t::set_gradient(switching_gradient_ptr gradient) {
  check_not_null(gradient, "switching gradient");
  _gradient = gradient;
}

void md_rens_swap_param_info_t::set_masses(const array_t<real_t> &masses) {
  if (masses.size() != 0 &&
      size_t(masses.size()) != sampler1()->state()->dimension()) {
    throw std::invalid_argument("Mass count must equal the state dimension");
  }
  for (Eigen::Index i = 0; i < masses.size(); i++) {
    check_positive(masses[i], "mass");
  }
  _masses = masses;
}

thermostatted_md_rens_swap_param_info_t::
    thermostatted_md_rens_swap_param_info_t(
        single_chain_ptr sampler1, single_chain_ptr sampler2, real_t timestep,
        size_t traj_length, switching_gradient_ptr gradient,
        real_t collision_probability, size_t collision_interval,
        temperature_ptr temperature, const array_t<real_t> &masses)
    : md_rens_swap_param_info_t(sampler1, sampler2, timestep, traj_length,
                                gradient, masses) {
  set_temperature(temperature);
  set_collision_probability(collision_probability);
  set_collision_interval(collision_interval);
}

void thermostatted_md_rens_swap_param_info_t::set_temperature(
    temperature_ptr temperature) {
  check_not_null(temperature, "temperature schedule");
  _temperature = temperature;
}

void thermostatted_md_rens_swap_param_info_t::set_collision_probability(
    real_t probability) {
  if (!(probability >= 0 && probability <= 1)) {
    throw parameter_value_error("collision_probability", probability,
                                "must lie in [0, 1]");
  }
  _collision_probability = probability;
}

void thermostatted_md_rens_swap_param_info_t::set_collision_interval(
    size_t interval) {
  if (interval == 0) {
    throw parameter_value_error("collision_interval", 0, "must be positive");
  }
  _collision_interval = interval;
}
