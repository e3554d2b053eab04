#pragma once

#include "exchange.hxx"

// Decides which pairs of an exchange algorithm are attempted in a round.
class swap_scheme_t {
protected:
  std::shared_ptr<exchange_mc_t> _algorithm;

  // attempt the given pairs; no chain may appear in two of them
  void swap_pairs(const std::vector<size_t> &indices);

public:
  explicit swap_scheme_t(std::shared_ptr<exchange_mc_t> algorithm);
  virtual ~swap_scheme_t() {}

  virtual void swap_all() = 0;

  exchange_mc_t &algorithm() const { return *_algorithm; }
};

typedef std::shared_ptr<swap_scheme_t> swap_scheme_ptr;

// Alternates between the even pairs {0, 2, 4, ...} and the odd pairs
// {1, 3, ...}.  For adjacent pairs (i, i+1) the pairs in one list never
// share a chain.  With a single pair both lists are {0}.
class alternating_adjacent_swap_scheme_t : public swap_scheme_t {
  std::vector<size_t> _swap_list1;
  std::vector<size_t> _swap_list2;
  bool _use_list1 = true;

public:
  explicit alternating_adjacent_swap_scheme_t(
      std::shared_ptr<exchange_mc_t> algorithm);

  void swap_all() override;

  const std::vector<size_t> &current_swap_list() const {
    return _use_list1 ? _swap_list1 : _swap_list2;
  }
};
