#include "simulation.hxx"

exchange_simulation_t::exchange_simulation_t(
    std::shared_ptr<exchange_mc_t> algorithm, size_t swap_interval)
    : _algorithm(algorithm),
      _scheme(std::make_shared<alternating_adjacent_swap_scheme_t>(algorithm)),
      _swap_interval(swap_interval), _time(0) {
  if (_swap_interval == 0) {
    throw parameter_value_error("swap_interval", 0, "must be positive");
  }
}

void exchange_simulation_t::step(size_t num_steps) {
  for (size_t i = 0; i < num_steps; i++) {
    _algorithm->sample();
    _time++;
    if (_time % _swap_interval == 0) {
      _scheme->swap_all();
    }
  }
}

std::vector<real_t> exchange_simulation_t::chain_acceptance_rates() const {
  std::vector<real_t> rates;
  for (const auto &sampler : _algorithm->samplers()) {
    rates.push_back(sampler->acceptance_rate());
  }
  return rates;
}

std::vector<std::vector<real_t>> exchange_simulation_t::chain_positions() const {
  std::vector<std::vector<real_t>> positions;
  for (const auto &sampler : _algorithm->samplers()) {
    positions.push_back(stdvector_from_vector(sampler->state()->position()));
  }
  return positions;
}
