#pragma once
#include "util.hxx"

/* Random123 stuff */
#include <Random123/philox.h>
#include <Random123/u01fixedpt.h>
#include <Random123/boxmuller.hpp>

typedef r123::Philox2x64 r123_type;

/*! \file util/randgen.h

  Counter-based random number generation for the samplers and the
  exchange algorithms.  Every generator is fully determined by its seed
  and its counter, so a simulation is reproducible given its seeds.

  Defines two classes.  One representing a random value, which
  can be extracted as a real with various distributions.  The other is
  a random value generator, which is counter-based and can return the
  same number if it is not advanced.

 */

  /*! A 'value' returned by the random number generator.  This
    value contains a bunch of random bits and its member functions
    extract those bits so that the result follows the selected
    distribution. */
  struct randval {
    /*! c'tor, we expect only randgen to use this.
      @param v Random123 counter type.
    */
    randval(const r123_type::ctr_type &v) : value(v) {}

    //! Return a uniformly distributed double on [0,1)
    double   as_double_co() const {
      return u01fixedpt_closed_open_64_double(value[0]);
    }
    //! Return a standard normal deviate (Box-Muller on both words)
    double   as_gaussian() const {
      return r123::boxmuller(value[0], value[1]).x;
    }

    //! we leave the value accessible in case someone
    //! has some dark purpose for it.
    r123_type::ctr_type value;
  };

  /*! Random number generator.  The \Code{next} function advances
    the generator to a completely different random table. */
  struct randgen {

    /*! reset the counter and set the seed.
      @param seed
    */
    void seed(uint64_t seed);

    /*! compute and return the random value corresponding
      to the current randgen state.  The optional key parameter
      allows the used to select alternate values.
      @param key additional random value salt.
    */
    randval value(uint64_t key=0) const;

    //! Advance the state counter to the next set of random values.
    randgen &next() { state[0]++; return *this; }

    //! The next().value() combo is very common.
    randval  yield() { return next().value(); }

    //! Uniform on [0,1); used for accept/reject decisions.
    double uniform() { return yield().as_double_co(); }

    //! Standard normal draw, one counter value per draw.
    double gaussian() { return yield().as_gaussian(); }

    //! Normal draw with the given mean and standard deviation.
    double gaussian(double mean, double std) { return mean + std * gaussian(); }

    //! Number of values drawn since the last seed.
    uint64_t counter() const { return state[0]; }

    randgen() { seed(0); }
    explicit randgen(uint64_t s) { seed(s); }
  private:
    r123_type::ctr_type state; // state[0] = sequence count, state[1] = seed
  };
