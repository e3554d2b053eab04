#pragma once

#include "exchange.hxx"
#include "propagators.hxx"

// Input of one directional switching trajectory.
struct rens_traj_info_t {
  std::shared_ptr<const md_rens_swap_param_info_t> param_info;
  state_ptr init_state;
  protocol_ptr protocol;
};

// Replica exchange with nonequilibrium switches (Ballard & Jarzynski
// 2009).  Instead of exchanging states directly, each chain's state is
// driven towards the other chain's ensemble by a switching trajectory, and
// the swap is accepted according to the work both trajectories performed.
class rens_t : public exchange_mc_t {
protected:
  // draw momenta for a chain at temperature T
  state_ptr thermalize(const state_t &state, real_t temperature,
                       const array_t<real_t> &masses);

  virtual propagation_result_ptr
  run_traj_generator(const rens_traj_info_t &traj_info) = 0;

  std::shared_ptr<const md_rens_swap_param_info_t>
  rens_param_info(const swap_param_info_ptr &info) const;

public:
  rens_t(const std::vector<single_chain_ptr> &samplers,
         const std::vector<swap_param_info_ptr> &param_infos,
         uint64_t seed = 0);

  swap_communicator_t propose_swap(const swap_param_info_ptr &info) override;
  void calc_acceptance(swap_communicator_t &swapcom) const override;
};

// RENS with deterministic MD switching trajectories.
class md_rens_t : public rens_t {
protected:
  integrators::integrator_type_t _integrator;

  propagation_result_ptr
  run_traj_generator(const rens_traj_info_t &traj_info) override;

public:
  md_rens_t(const std::vector<single_chain_ptr> &samplers,
            const std::vector<swap_param_info_ptr> &param_infos,
            uint64_t seed = 0,
            integrators::integrator_type_t integrator =
                integrators::integrator_type_t::leapfrog);
};

// RENS with Andersen-thermostatted MD switching trajectories.  Every pair
// must carry thermostatted_md_rens_swap_param_info_t.
class thermostatted_md_rens_t : public md_rens_t {
protected:
  propagation_result_ptr
  run_traj_generator(const rens_traj_info_t &traj_info) override;

public:
  thermostatted_md_rens_t(
      const std::vector<single_chain_ptr> &samplers,
      const std::vector<swap_param_info_ptr> &param_infos, uint64_t seed = 0,
      integrators::integrator_type_t integrator =
          integrators::integrator_type_t::leapfrog);
};
