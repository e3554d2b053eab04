#pragma once

#include "../util/randgen.h"
#include "density.hxx"
#include "integrators.hxx"
#include "state.hxx"

// Monte Carlo sampler holding a current state of type state_type.  The
// state is replaced, never mutated, on every accepted move.
template <typename state_type> class mc_t {
  std::shared_ptr<const state_type> _state;

public:
  typedef std::shared_ptr<const state_type> state_pointer_t;

  virtual ~mc_t() {}

  const state_pointer_t &state() const { return _state; }

  void set_state(state_pointer_t state) {
    check_state(state);
    _state = std::move(state);
  }

  // throws if state could not be this sampler's current state
  virtual void check_state(const state_pointer_t &state) const {
    check_not_null(state, "sampler state");
  }

  virtual real_t energy() const = 0;

  virtual state_pointer_t sample() = 0;
};

// Attempt/acceptance counters of a sampler or of an exchange pair.
struct acceptance_statistics_t {
  size_t attempted;
  size_t accepted;

  acceptance_statistics_t() : attempted(0), accepted(0) {}

  void update(bool was_accepted) {
    attempted++;
    if (was_accepted) {
      accepted++;
    }
  }

  real_t acceptance_rate() const {
    if (attempted == 0) {
      return 0;
    }
    return real_t(accepted) / attempted;
  }

  void reset() { attempted = accepted = 0; }
};

// A single Markov chain sampling exp(-E(x) / T) with E = -log_prob.
class single_chain_mc_t : public mc_t<state_t> {
protected:
  std::shared_ptr<const density_t> _pdf;
  real_t _temperature;
  acceptance_statistics_t _statistics;
  randgen _rng;

  // propose a new state; the proposal's log acceptance ratio goes to
  // log_ratio
  virtual state_ptr propose(real_t &log_ratio) = 0;

public:
  single_chain_mc_t(std::shared_ptr<const density_t> pdf,
                    const state_ptr &state, real_t temperature,
                    uint64_t seed);

  void check_state(const state_ptr &state) const override;

  real_t energy() const override;
  real_t energy(const vector_t &x) const { return _pdf->energy(x); }
  state_ptr sample() override;

  const density_t &pdf() const { return *_pdf; }
  real_t temperature() const { return _temperature; }
  void set_temperature(real_t temperature);

  real_t acceptance_rate() const { return _statistics.acceptance_rate(); }
  const acceptance_statistics_t &statistics() const { return _statistics; }
  randgen &rng() { return _rng; }
};

typedef std::shared_ptr<single_chain_mc_t> single_chain_ptr;

// Random walk Metropolis with uniform proposals of half-width stepsize.
class rwmc_sampler_t : public single_chain_mc_t {
  real_t _stepsize;

protected:
  state_ptr propose(real_t &log_ratio) override;

public:
  rwmc_sampler_t(std::shared_ptr<const density_t> pdf, const state_ptr &state,
                 real_t stepsize, real_t temperature = 1, uint64_t seed = 0);

  real_t stepsize() const { return _stepsize; }
  void set_stepsize(real_t stepsize);
};

// Hybrid/Hamiltonian Monte Carlo.  Stored states carry no momentum; fresh
// momenta are drawn for every trajectory.
class hmc_sampler_t : public single_chain_mc_t {
  gradient_ptr _gradient;
  real_t _timestep;
  size_t _nsteps;
  array_t<real_t> _masses;
  integrators::integrator_type_t _integrator;

protected:
  state_ptr propose(real_t &log_ratio) override;

public:
  hmc_sampler_t(std::shared_ptr<const density_t> pdf, const state_ptr &state,
                gradient_ptr gradient, real_t timestep, size_t nsteps,
                real_t temperature = 1, uint64_t seed = 0,
                const array_t<real_t> &masses = array_t<real_t>(),
                integrators::integrator_type_t integrator =
                    integrators::integrator_type_t::leapfrog);

  real_t timestep() const { return _timestep; }
  size_t nsteps() const { return _nsteps; }
};
