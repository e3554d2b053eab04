#pragma once

#include "param_info.hxx"
#include "trajectory.hxx"

// Samples a collection of independent chains; one sample() advances every
// chain by one step.
class ensemble_mc_t : public mc_t<ensemble_state_t> {
protected:
  std::vector<single_chain_ptr> _samplers;

  ensemble_state_ptr collect_states() const;

public:
  explicit ensemble_mc_t(const std::vector<single_chain_ptr> &samplers);

  void check_state(const ensemble_state_ptr &state) const override;

  // sum of the chain energies
  real_t energy() const override;
  ensemble_state_ptr sample() override;

  const std::vector<single_chain_ptr> &samplers() const { return _samplers; }
  size_t chain_count() const { return _samplers.size(); }
};

// State of one swap attempt: the pair, the two directional propagations
// and the resulting acceptance probability.
struct swap_communicator_t {
  swap_param_info_ptr param_info;
  // chain 1 propagated towards chain 2, and chain 2 towards chain 1
  propagation_result_ptr traj12;
  propagation_result_ptr traj21;
  // dimensionless switching works, w12 + w21 = -log_acceptance_ratio
  real_t work12;
  real_t work21;
  real_t log_acceptance_ratio;
  real_t acceptance_probability;

  swap_communicator_t(swap_param_info_ptr info, propagation_result_ptr t12,
                      propagation_result_ptr t21)
      : param_info(info), traj12(t12), traj21(t21),
        work12(quiet_nan<real_t>()), work21(quiet_nan<real_t>()),
        log_acceptance_ratio(quiet_nan<real_t>()),
        acceptance_probability(quiet_nan<real_t>()) {}

  single_chain_mc_t &sampler1() const { return *param_info->sampler1(); }
  single_chain_mc_t &sampler2() const { return *param_info->sampler2(); }

  // store the log ratio and the saturated probability min(1, exp(x));
  // NaN gives probability 0
  void set_log_acceptance_ratio(real_t log_ratio);
};

// Per-pair swap counters.
class swap_statistics_t {
  std::vector<acceptance_statistics_t> _stats;

public:
  void init(size_t pair_count) { _stats.assign(pair_count, acceptance_statistics_t()); }
  void update(size_t pair_index, bool accepted) {
    _stats.at(pair_index).update(accepted);
  }
  const acceptance_statistics_t &operator[](size_t pair_index) const {
    return _stats.at(pair_index);
  }
  std::vector<real_t> acceptance_rates() const;
};

// Replica-exchange-like algorithm: the ensemble plus pairwise swaps.
// Subclasses decide how a swap is proposed and how its acceptance
// probability is computed.
class exchange_mc_t : public ensemble_mc_t {
protected:
  std::vector<swap_param_info_ptr> _param_infos;
  std::vector<chain_pair_t> _pair_chains;
  chain_pair_index_t _pair_index;
  swap_statistics_t _statistics;
  randgen _rng;

  size_t chain_index(const single_chain_ptr &sampler) const;

public:
  exchange_mc_t(const std::vector<single_chain_ptr> &samplers,
                const std::vector<swap_param_info_ptr> &param_infos,
                uint64_t seed = 0);

  // attempt the swap of the pair param_infos[index]; true if accepted
  bool swap(size_t index);

  virtual swap_communicator_t propose_swap(const swap_param_info_ptr &info) = 0;
  virtual void calc_acceptance(swap_communicator_t &swapcom) const = 0;
  bool accept_or_reject(swap_communicator_t &swapcom);

  size_t pair_count() const { return _param_infos.size(); }
  const swap_param_info_ptr &param_info(size_t index) const {
    return _param_infos.at(index);
  }
  // chain indices of a pair, in (sampler1, sampler2) order
  const chain_pair_t &pair_chains(size_t index) const {
    return _pair_chains.at(index);
  }
  // pair index for two chain indices, in either order
  size_t pair_index(size_t chain1, size_t chain2) const;

  const swap_statistics_t &statistics() const { return _statistics; }
  std::vector<real_t> acceptance_rates() const {
    return _statistics.acceptance_rates();
  }
};

// Replica exchange (Swendsen & Yang 1986): the proposal for each chain is
// the other chain's current state.
class replica_exchange_mc_t : public exchange_mc_t {
public:
  using exchange_mc_t::exchange_mc_t;

  swap_communicator_t propose_swap(const swap_param_info_ptr &info) override;
  void calc_acceptance(swap_communicator_t &swapcom) const override;
};
