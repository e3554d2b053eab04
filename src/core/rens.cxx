#include "rens.hxx"

rens_t::rens_t(const std::vector<single_chain_ptr> &samplers,
               const std::vector<swap_param_info_ptr> &param_infos,
               uint64_t seed)
    : exchange_mc_t(samplers, param_infos, seed) {
  for (const auto &info : _param_infos) {
    rens_param_info(info);
  }
}

std::shared_ptr<const md_rens_swap_param_info_t>
rens_t::rens_param_info(const swap_param_info_ptr &info) const {
  auto rens_info =
      std::dynamic_pointer_cast<const md_rens_swap_param_info_t>(info);
  if (!rens_info) {
    throw std::invalid_argument(
        "RENS swaps require md_rens_swap_param_info_t parameters");
  }
  return rens_info;
}

state_ptr rens_t::thermalize(const state_t &state, real_t temperature,
                             const array_t<real_t> &masses) {
  auto inv_masses = inverse_masses(masses, state.dimension());
  vector_t momentum(state.dimension());
  for (Eigen::Index i = 0; i < momentum.size(); i++) {
    momentum[i] = _rng.gaussian(0, std::sqrt(temperature / inv_masses[i]));
  }
  return std::make_shared<state_t>(state.position(), momentum);
}

swap_communicator_t rens_t::propose_swap(const swap_param_info_ptr &info) {
  auto rens_info = rens_param_info(info);
  const auto &sampler1 = *info->sampler1();
  const auto &sampler2 = *info->sampler2();

  auto init_state1 = thermalize(*sampler1.state(), sampler1.temperature(),
                                rens_info->masses());
  auto init_state2 = thermalize(*sampler2.state(), sampler2.temperature(),
                                rens_info->masses());

  // chain 1 is switched from lambda = 0 to 1, chain 2 from 1 to 0
  rens_traj_info_t info12{rens_info, init_state1,
                          std::make_shared<linear_protocol_t>()};
  rens_traj_info_t info21{rens_info, init_state2,
                          std::make_shared<reverse_linear_protocol_t>()};
  auto traj12 = run_traj_generator(info12);
  auto traj21 = run_traj_generator(info21);
  return swap_communicator_t(info, traj12, traj21);
}

void rens_t::calc_acceptance(swap_communicator_t &swapcom) const {
  auto rens_info = rens_param_info(swapcom.param_info);
  const auto &sampler1 = swapcom.sampler1();
  const auto &sampler2 = swapcom.sampler2();
  real_t t1 = sampler1.temperature();
  real_t t2 = sampler2.temperature();

  const state_t &state1 = *swapcom.traj12->initial();
  const state_t &state2 = *swapcom.traj21->initial();
  const state_t &proposal1 = *swapcom.traj21->final();
  const state_t &proposal2 = *swapcom.traj12->final();
  auto inv_masses = inverse_masses(rens_info->masses(), state1.dimension());
  auto kinetic = [&](const state_t &state) {
    return kinetic_energy(state.momentum(), inv_masses);
  };

  real_t w12 = (kinetic(proposal2) + sampler2.energy(proposal2.position())) / t2 -
               (kinetic(state1) + sampler1.energy(state1.position())) / t1 -
               swapcom.traj12->heat();
  real_t w21 = (kinetic(proposal1) + sampler1.energy(proposal1.position())) / t1 -
               (kinetic(state2) + sampler2.energy(state2.position())) / t2 -
               swapcom.traj21->heat();
  rexmc_log_printf("RENS work: w12 = %f, w21 = %f\n", w12, w21);

  swapcom.work12 = w12;
  swapcom.work21 = w21;
  swapcom.set_log_acceptance_ratio(-w12 - w21);
}

md_rens_t::md_rens_t(const std::vector<single_chain_ptr> &samplers,
                     const std::vector<swap_param_info_ptr> &param_infos,
                     uint64_t seed, integrators::integrator_type_t integrator)
    : rens_t(samplers, param_infos, seed), _integrator(integrator) {}

propagation_result_ptr
md_rens_t::run_traj_generator(const rens_traj_info_t &traj_info) {
  const auto &info = *traj_info.param_info;
  interpolation_factory_t factory(traj_info.protocol, info.switching_time());

  md_propagator_t propagator(factory.build_gradient(info.gradient()),
                             info.timestep(), info.masses(), _integrator);
  return propagator.generate(traj_info.init_state, info.traj_length());
}

thermostatted_md_rens_t::thermostatted_md_rens_t(
    const std::vector<single_chain_ptr> &samplers,
    const std::vector<swap_param_info_ptr> &param_infos, uint64_t seed,
    integrators::integrator_type_t integrator)
    : md_rens_t(samplers, param_infos, seed, integrator) {
  for (const auto &info : _param_infos) {
    if (!std::dynamic_pointer_cast<
            const thermostatted_md_rens_swap_param_info_t>(info)) {
      throw std::invalid_argument("thermostatted RENS swaps require "
                                  "thermostatted_md_rens_swap_param_info_t "
                                  "parameters");
    }
  }
}

propagation_result_ptr thermostatted_md_rens_t::run_traj_generator(
    const rens_traj_info_t &traj_info) {
  auto info = std::static_pointer_cast<
      const thermostatted_md_rens_swap_param_info_t>(traj_info.param_info);
  interpolation_factory_t factory(traj_info.protocol, info->switching_time());

  thermostatted_md_propagator_t propagator(
      factory.build_gradient(info->gradient()), info->timestep(),
      factory.build_temperature(info->temperature()),
      info->collision_probability(), info->collision_interval(), _rng,
      info->masses(), _integrator);
  return propagator.generate(traj_info.init_state, info->traj_length());
}
