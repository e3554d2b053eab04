#include "swap_scheme.hxx"

swap_scheme_t::swap_scheme_t(std::shared_ptr<exchange_mc_t> algorithm)
    : _algorithm(algorithm) {
  check_not_null(_algorithm, "exchange algorithm");
}

void swap_scheme_t::swap_pairs(const std::vector<size_t> &indices) {
  std::vector<bool> active(_algorithm->chain_count(), false);
  for (size_t index : indices) {
    const auto &chains = _algorithm->pair_chains(index);
    for (size_t chain : {chains.first, chains.second}) {
      if (active[chain]) {
        throw std::logic_error("chain " + std::to_string(chain) +
                               " takes part in more than one swap");
      }
      active[chain] = true;
    }
  }
  for (size_t index : indices) {
    _algorithm->swap(index);
  }
}

alternating_adjacent_swap_scheme_t::alternating_adjacent_swap_scheme_t(
    std::shared_ptr<exchange_mc_t> algorithm)
    : swap_scheme_t(algorithm) {
  size_t npairs = _algorithm->pair_count();
  for (size_t i = 0; i < npairs; i += 2) {
    _swap_list1.push_back(i);
  }
  for (size_t i = 1; i < npairs; i += 2) {
    _swap_list2.push_back(i);
  }
  if (_swap_list2.empty()) {
    _swap_list2 = _swap_list1;
  }
}

void alternating_adjacent_swap_scheme_t::swap_all() {
  swap_pairs(current_swap_list());
  _use_list1 = !_use_list1;
}
