#pragma once

#include "swap_scheme.hxx"

// A configured ensemble of chains, an exchange algorithm over them and the
// alternating swap schedule.  Each step samples every chain once; every
// swap_interval steps a swap round follows.
class exchange_simulation_t {
  std::shared_ptr<exchange_mc_t> _algorithm;
  std::shared_ptr<alternating_adjacent_swap_scheme_t> _scheme;
  size_t _swap_interval;
  size_t _time;

public:
  exchange_simulation_t(std::shared_ptr<exchange_mc_t> algorithm,
                        size_t swap_interval = 1);

  void step(size_t num_steps = 1);

  size_t time() const { return _time; }
  exchange_mc_t &algorithm() const { return *_algorithm; }
  std::vector<real_t> swap_acceptance_rates() const {
    return _algorithm->acceptance_rates();
  }
  std::vector<real_t> chain_acceptance_rates() const;
  std::vector<std::vector<real_t>> chain_positions() const;
};
