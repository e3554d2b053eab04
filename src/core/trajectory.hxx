#pragma once

#include "state.hxx"

// Outcome of a deterministic or stochastic propagation of a state.
class propagation_result_t {
public:
  virtual ~propagation_result_t() {}

  virtual state_ptr initial() const = 0;
  virtual state_ptr final() const = 0;
  // heat produced during the propagation
  virtual real_t heat() const = 0;
};

// Endpoints only; used when intermediate states are not needed.
class short_propagation_result_t : public propagation_result_t {
  state_ptr _initial;
  state_ptr _final;
  real_t _heat;

public:
  short_propagation_result_t(state_ptr initial, state_ptr final,
                             real_t heat = 0);

  state_ptr initial() const override { return _initial; }
  state_ptr final() const override { return _final; }
  real_t heat() const override { return _heat; }
};

// Ordered phase-space trajectory; the first and last states are the
// endpoints of the propagation.
class trajectory_t : public propagation_result_t {
  std::vector<state_ptr> _states;
  real_t _heat;
  real_t _work;

public:
  trajectory_t(const std::vector<state_ptr> &states, real_t heat = 0,
               real_t work = 0);

  state_ptr initial() const override { return _states.front(); }
  state_ptr final() const override { return _states.back(); }
  real_t heat() const override { return _heat; }
  real_t work() const { return _work; }

  size_t size() const { return _states.size(); }
  const state_ptr &operator[](size_t i) const { return _states[i]; }
  const state_ptr &at(size_t i) const { return _states.at(i); }

  std::vector<state_ptr>::const_iterator begin() const {
    return _states.begin();
  }
  std::vector<state_ptr>::const_iterator end() const { return _states.end(); }
};

typedef std::shared_ptr<const propagation_result_t> propagation_result_ptr;

// Builds a trajectory step by step.  Every state handed in is cloned, so
// the product never aliases a live chain state.
class trajectory_builder_t {
protected:
  real_t _heat;
  real_t _work;
  std::vector<state_ptr> _states;

public:
  trajectory_builder_t(real_t heat = 0, real_t work = 0)
      : _heat(heat), _work(work) {}
  virtual ~trajectory_builder_t() {}

  // full = false gives a builder that only keeps the endpoints
  static std::unique_ptr<trajectory_builder_t> create(bool full = true);

  void add_initial_state(const state_ptr &state);
  virtual void add_intermediate_state(const state_ptr &state);
  void add_final_state(const state_ptr &state);

  void set_heat(real_t heat) { _heat = heat; }
  void set_work(real_t work) { _work = work; }
  real_t heat() const { return _heat; }
  real_t work() const { return _work; }
  size_t state_count() const { return _states.size(); }

  virtual propagation_result_ptr product() const;
};

class short_trajectory_builder_t : public trajectory_builder_t {
public:
  using trajectory_builder_t::trajectory_builder_t;

  void add_intermediate_state(const state_ptr & /*state*/) override {}

  // requires exactly the initial and the final state
  propagation_result_ptr product() const override;
};
