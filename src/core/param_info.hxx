#pragma once

#include "interpolation.hxx"
#include "sampler.hxx"

// Everything needed to attempt a swap between two chains.  Plain replica
// exchange needs nothing beyond the chains themselves.
class swap_param_info_t {
  single_chain_ptr _sampler1;
  single_chain_ptr _sampler2;

public:
  swap_param_info_t(single_chain_ptr sampler1, single_chain_ptr sampler2);
  virtual ~swap_param_info_t() {}

  const single_chain_ptr &sampler1() const { return _sampler1; }
  const single_chain_ptr &sampler2() const { return _sampler2; }
};

typedef std::shared_ptr<const swap_param_info_t> swap_param_info_ptr;

// RENS with molecular dynamics switching trajectories.
class md_rens_swap_param_info_t : public swap_param_info_t {
  real_t _timestep;
  size_t _traj_length;
  switching_gradient_ptr _gradient;
  // diagonal of the mass matrix; full (non-diagonal) mass matrices are not
  // supported
  array_t<real_t> _masses;

public:
  md_rens_swap_param_info_t(single_chain_ptr sampler1,
                            single_chain_ptr sampler2, real_t timestep,
                            size_t traj_length,
                            switching_gradient_ptr gradient,
                            const array_t<real_t> &masses = array_t<real_t>());

  real_t timestep() const { return _timestep; }
  size_t traj_length() const { return _traj_length; }
  const switching_gradient_ptr &gradient() const { return _gradient; }
  // diagonal masses only, empty for unit masses
  const array_t<real_t> &masses() const { return _masses; }
  real_t switching_time() const { return _timestep * _traj_length; }

  void set_timestep(real_t timestep);
  void set_traj_length(size_t traj_length);
  void set_gradient(switching_gradient_ptr gradient);
  void set_masses(const array_t<real_t> &masses);
};

// RENS with Andersen-thermostatted MD trajectories.
class thermostatted_md_rens_swap_param_info_t
    : public md_rens_swap_param_info_t {
  temperature_ptr _temperature;
  real_t _collision_probability;
  size_t _collision_interval;

public:
  thermostatted_md_rens_swap_param_info_t(
      single_chain_ptr sampler1, single_chain_ptr sampler2, real_t timestep,
      size_t traj_length, switching_gradient_ptr gradient,
      real_t collision_probability = 0.1, size_t collision_interval = 1,
      temperature_ptr temperature = std::make_shared<constant_temperature_t>(),
      const array_t<real_t> &masses = array_t<real_t>());

  // temperature as a function of the work parameter
  const temperature_ptr &temperature() const { return _temperature; }
  real_t collision_probability() const { return _collision_probability; }
  size_t collision_interval() const { return _collision_interval; }

  void set_temperature(temperature_ptr temperature);
  void set_collision_probability(real_t probability);
  void set_collision_interval(size_t interval);
};
