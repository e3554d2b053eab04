#include "exchange.hxx"

ensemble_mc_t::ensemble_mc_t(const std::vector<single_chain_ptr> &samplers)
    : _samplers(samplers) {
  if (_samplers.empty()) {
    throw std::invalid_argument("an ensemble needs at least one chain");
  }
  for (const auto &sampler : _samplers) {
    check_not_null(sampler, "ensemble chain");
  }
  set_state(collect_states());
}

ensemble_state_ptr ensemble_mc_t::collect_states() const {
  std::vector<state_ptr> states;
  states.reserve(_samplers.size());
  for (const auto &sampler : _samplers) {
    states.push_back(sampler->state());
  }
  return std::make_shared<ensemble_state_t>(states);
}

void ensemble_mc_t::check_state(const ensemble_state_ptr &state) const {
  mc_t<ensemble_state_t>::check_state(state);
  if (state->size() != _samplers.size()) {
    throw std::invalid_argument("ensemble state size must equal chain count");
  }
}

real_t ensemble_mc_t::energy() const {
  real_t total = 0;
  for (const auto &sampler : _samplers) {
    total += sampler->energy();
  }
  return total;
}

ensemble_state_ptr ensemble_mc_t::sample() {
  for (auto &sampler : _samplers) {
    sampler->sample();
  }
  set_state(collect_states());
  return state();
}

void swap_communicator_t::set_log_acceptance_ratio(real_t log_ratio) {
  // infinite ratios saturate; a NaN ratio (e.g. a diverged switching
  // trajectory) is a rejection
  log_acceptance_ratio = log_ratio;
  if (std::isnan(log_ratio)) {
    rexmc_log_printf("Swap acceptance ratio is NaN, rejecting\n");
    acceptance_probability = 0;
    return;
  }
  acceptance_probability = metropolis_probability(log_ratio);
}

std::vector<real_t> swap_statistics_t::acceptance_rates() const {
  std::vector<real_t> rates(_stats.size());
  for (size_t i = 0; i < _stats.size(); i++) {
    rates[i] = _stats[i].acceptance_rate();
  }
  return rates;
}

exchange_mc_t::exchange_mc_t(
    const std::vector<single_chain_ptr> &samplers,
    const std::vector<swap_param_info_ptr> &param_infos, uint64_t seed)
    : ensemble_mc_t(samplers), _param_infos(param_infos), _rng(seed) {
  if (_param_infos.empty()) {
    throw std::invalid_argument("an exchange algorithm needs at least one pair");
  }
  for (size_t index = 0; index < _param_infos.size(); index++) {
    check_not_null(_param_infos[index], "swap parameter info");
    chain_pair_t chains(chain_index(_param_infos[index]->sampler1()),
                        chain_index(_param_infos[index]->sampler2()));
    _pair_chains.push_back(chains);
    chain_pair_t key(std::min(chains.first, chains.second),
                     std::max(chains.first, chains.second));
    if (!_pair_index.emplace(key, index).second) {
      throw std::invalid_argument("chains " + std::to_string(key.first) +
                                  " and " + std::to_string(key.second) +
                                  " are paired more than once");
    }
  }
  _statistics.init(_param_infos.size());
}

size_t exchange_mc_t::chain_index(const single_chain_ptr &sampler) const {
  auto found = std::find(_samplers.begin(), _samplers.end(), sampler);
  if (found == _samplers.end()) {
    throw std::invalid_argument(
        "swap pair refers to a chain outside of the ensemble");
  }
  return found - _samplers.begin();
}

size_t exchange_mc_t::pair_index(size_t chain1, size_t chain2) const {
  chain_pair_t key(std::min(chain1, chain2), std::max(chain1, chain2));
  auto found = _pair_index.find(key);
  if (found == _pair_index.end()) {
    throw std::out_of_range("chains " + std::to_string(key.first) + " and " +
                            std::to_string(key.second) + " are not paired");
  }
  return found->second;
}

bool exchange_mc_t::swap(size_t index) {
  if (index >= _param_infos.size()) {
    throw std::out_of_range("swap index " + std::to_string(index) +
                            " out of range");
  }
  auto swapcom = propose_swap(_param_infos[index]);
  calc_acceptance(swapcom);
  bool accepted = accept_or_reject(swapcom);
  set_state(collect_states());
  _statistics.update(index, accepted);
  rexmc_log_printf("Swap %lu (%lu <-> %lu): p = %f, %s\n", index,
                   _pair_chains[index].first, _pair_chains[index].second,
                   swapcom.acceptance_probability,
                   accepted ? "accepted" : "rejected");
  return accepted;
}

bool exchange_mc_t::accept_or_reject(swap_communicator_t &swapcom) {
  if (!(swapcom.acceptance_probability >= 0)) {
    throw std::logic_error("acceptance probability was not computed");
  }
  if (_rng.uniform() >= swapcom.acceptance_probability) {
    return false;
  }
  auto &sampler1 = swapcom.sampler1();
  auto &sampler2 = swapcom.sampler2();
  state_ptr proposal1 = swapcom.traj21->final();
  state_ptr proposal2 = swapcom.traj12->final();
  if (!sampler1.state()->has_momentum() && !sampler2.state()->has_momentum()) {
    proposal1 = proposal1->without_momentum();
    proposal2 = proposal2->without_momentum();
  }
  // both chains change or neither does
  sampler1.check_state(proposal1);
  sampler2.check_state(proposal2);
  sampler1.set_state(proposal1);
  sampler2.set_state(proposal2);
  return true;
}

swap_communicator_t
replica_exchange_mc_t::propose_swap(const swap_param_info_ptr &info) {
  const auto &state1 = info->sampler1()->state();
  const auto &state2 = info->sampler2()->state();
  auto traj12 = std::make_shared<trajectory_t>(
      std::vector<state_ptr>{state1, state1});
  auto traj21 = std::make_shared<trajectory_t>(
      std::vector<state_ptr>{state2, state2});
  return swap_communicator_t(info, traj12, traj21);
}

void replica_exchange_mc_t::calc_acceptance(swap_communicator_t &swapcom) const {
  const auto &sampler1 = swapcom.sampler1();
  const auto &sampler2 = swapcom.sampler2();
  real_t t1 = sampler1.temperature();
  real_t t2 = sampler2.temperature();

  const vector_t &state1 = swapcom.traj12->initial()->position();
  const vector_t &state2 = swapcom.traj21->initial()->position();
  const vector_t &proposal1 = swapcom.traj21->final()->position();
  const vector_t &proposal2 = swapcom.traj12->final()->position();

  // instantaneous switches: chain 1's state moves to chain 2 and back
  swapcom.work12 = sampler2.energy(state1) / t2 - sampler1.energy(state1) / t1;
  swapcom.work21 = sampler1.energy(state2) / t1 - sampler2.energy(state2) / t2;
  swapcom.set_log_acceptance_ratio(
      -sampler1.energy(proposal1) / t1 + sampler1.energy(state1) / t1 -
      sampler2.energy(proposal2) / t2 + sampler2.energy(state2) / t2);
}
