#pragma once

#include <Eigen/Dense>
#include "util.hxx"

template <typename value_t = real_t>
using array_t = Eigen::Array<value_t, Eigen::Dynamic, 1>;
typedef Eigen::Matrix<real_t, Eigen::Dynamic, 1> vector_t;

inline void check_same_size(const vector_t &a, const vector_t &b,
                            const std::string &what) {
  if (a.size() != b.size()) {
    std::ostringstream msg;
    msg << what << ": dimension mismatch (" << a.size() << " vs " << b.size()
        << ")";
    throw std::invalid_argument(msg.str());
  }
}

inline std::vector<real_t> stdvector_from_vector(const vector_t &vector) {
  return std::vector<real_t>(vector.data(), vector.data() + vector.size());
}

inline vector_t vector_from_stdvector(const std::vector<real_t> &values) {
  return vector_t::Map(values.data(), values.size());
}

// Diagonal mass specification; an empty array stands for unit masses.
inline array_t<real_t> inverse_masses(const array_t<real_t> &masses,
                                      Eigen::Index dimension) {
  if (masses.size() == 0) {
    return array_t<real_t>::Ones(dimension);
  }
  if (masses.size() != dimension) {
    throw std::invalid_argument("Mass count must equal the state dimension");
  }
  return masses.inverse();
}

// K(p) = 1/2 p^T M^-1 p for a diagonal mass matrix
inline real_t kinetic_energy(const vector_t &momentum,
                             const array_t<real_t> &inverse_masses) {
  return 0.5 * (momentum.array().square() * inverse_masses).sum();
}
