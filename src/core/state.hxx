#pragma once

#include "../util/util.hxx"
#include "../util/eigen.hxx"
#include <boost/optional.hpp>

// A phase-space point of one chain.  States are never modified after
// construction; chains swap in new state objects instead.
class state_t {
  vector_t _position;
  vector_t _momentum;
  bool _has_momentum;

public:
  explicit state_t(const vector_t &position)
      : _position(position), _has_momentum(false) {
    check_dimension();
  }

  state_t(const vector_t &position, const vector_t &momentum)
      : _position(position), _momentum(momentum), _has_momentum(true) {
    check_dimension();
    check_same_size(_position, _momentum, "state momentum");
  }

  const vector_t &position() const { return _position; }

  const vector_t &momentum() const {
    if (!_has_momentum) {
      throw std::logic_error("state has no momentum");
    }
    return _momentum;
  }

  bool has_momentum() const { return _has_momentum; }

  size_t dimension() const { return _position.size(); }

  std::shared_ptr<const state_t> clone() const {
    return std::make_shared<state_t>(*this);
  }

  // the same position, without momentum
  std::shared_ptr<const state_t> without_momentum() const {
    return std::make_shared<state_t>(_position);
  }

private:
  void check_dimension() const {
    if (_position.size() == 0) {
      throw std::invalid_argument("state position must not be empty");
    }
  }
};

typedef std::shared_ptr<const state_t> state_ptr;

// One state per chain of an ensemble, in chain order, with an optional
// ensemble-wide scalar such as a shared temperature.
class ensemble_state_t {
  std::vector<state_ptr> _states;
  boost::optional<real_t> _parameter;

public:
  explicit ensemble_state_t(const std::vector<state_ptr> &states,
                            boost::optional<real_t> parameter = boost::none)
      : _states(states), _parameter(parameter) {
    if (_states.empty()) {
      throw std::invalid_argument("ensemble state needs at least one state");
    }
    for (const auto &state : _states) {
      check_not_null(state, "ensemble member state");
    }
  }

  const boost::optional<real_t> &parameter() const { return _parameter; }

  size_t size() const { return _states.size(); }

  const state_ptr &operator[](size_t i) const { return _states[i]; }

  const state_ptr &at(size_t i) const { return _states.at(i); }

  std::vector<state_ptr>::const_iterator begin() const {
    return _states.begin();
  }
  std::vector<state_ptr>::const_iterator end() const { return _states.end(); }
};

typedef std::shared_ptr<const ensemble_state_t> ensemble_state_ptr;
