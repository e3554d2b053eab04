#include "trajectory.hxx"

short_propagation_result_t::short_propagation_result_t(state_ptr initial,
                                                       state_ptr final,
                                                       real_t heat)
    : _initial(initial), _final(final), _heat(heat) {
  check_not_null(_initial, "initial state");
  check_not_null(_final, "final state");
}

trajectory_t::trajectory_t(const std::vector<state_ptr> &states, real_t heat,
                           real_t work)
    : _states(states), _heat(heat), _work(work) {
  if (_states.size() < 2) {
    throw std::invalid_argument(
        "A trajectory needs at least an initial and a final state");
  }
  for (const auto &state : _states) {
    check_not_null(state, "trajectory state");
  }
}

std::unique_ptr<trajectory_builder_t> trajectory_builder_t::create(bool full) {
  if (full) {
    return std::unique_ptr<trajectory_builder_t>(new trajectory_builder_t());
  }
  return std::unique_ptr<trajectory_builder_t>(
      new short_trajectory_builder_t());
}

void trajectory_builder_t::add_initial_state(const state_ptr &state) {
  check_not_null(state, "initial state");
  _states.insert(_states.begin(), state->clone());
}

void trajectory_builder_t::add_intermediate_state(const state_ptr &state) {
  check_not_null(state, "intermediate state");
  _states.push_back(state->clone());
}

void trajectory_builder_t::add_final_state(const state_ptr &state) {
  check_not_null(state, "final state");
  _states.push_back(state->clone());
}

propagation_result_ptr trajectory_builder_t::product() const {
  return std::make_shared<trajectory_t>(_states, _heat, _work);
}

propagation_result_ptr short_trajectory_builder_t::product() const {
  if (_states.size() != 2) {
    throw std::invalid_argument(
        "Can't create a product, two states required (got " +
        std::to_string(_states.size()) + ")");
  }
  return std::make_shared<short_propagation_result_t>(_states[0], _states[1],
                                                      _heat);
}
