#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <ark/ark.hpp>

#include "configuration.hxx"

namespace py = pybind11;

class ExchangeSimulation {
private:
  std::shared_ptr<exchange_mc_t> m_algorithm;
  std::unique_ptr<exchange_simulation_t> m_simulation;

public:
  ExchangeSimulation(Ark::ark config_ark, std::string algorithm = "re",
                     size_t seed = 10, size_t swap_interval = 1,
                     bool quiet = true) {
    m_algorithm = configure_exchange(
        config_ark, exchange_algorithm_from_name(algorithm), seed, quiet);
    m_simulation.reset(new exchange_simulation_t(m_algorithm, swap_interval));
  }

  void step(size_t num_steps = 1) { m_simulation->step(num_steps); }

  bool swap(size_t pair) { return m_algorithm->swap(pair); }

  size_t getTime() const { return m_simulation->time(); }
  size_t getNumChains() const { return m_algorithm->chain_count(); }
  size_t getNumPairs() const { return m_algorithm->pair_count(); }

  std::pair<size_t, size_t> getPairChains(size_t pair) const {
    return m_algorithm->pair_chains(pair);
  }

  std::vector<real_t> getSwapAcceptanceRates() const {
    return m_simulation->swap_acceptance_rates();
  }

  std::vector<real_t> getChainAcceptanceRates() const {
    return m_simulation->chain_acceptance_rates();
  }

  std::vector<std::vector<real_t>> getChainPositions() const {
    return m_simulation->chain_positions();
  }
};

PYBIND11_MODULE(_rexmc, m) {
  m.doc() = "Python bindings for replica exchange Monte Carlo simulations";

  py::class_<ExchangeSimulation>(m, "ExchangeSimulation")
      .def(py::init<Ark::ark, std::string, size_t, size_t, bool>(),
           py::arg("config_ark"), py::arg("algorithm") = "re",
           py::arg("seed") = 10, py::arg("swap_interval") = 1,
           py::arg("quiet") = true,
           R"DOC(
Build the chains and swap pairs described by a configuration ark.

Args:
    config_ark (Ark): Ark holding exchange.chains and, optionally,
        exchange.pairs.
    algorithm (str): "re", "mdrens" or "tmdrens" (default "re").
    seed (int): Seed of the exchange random stream; chain k uses
        seed + k + 1 (default 10).
    swap_interval (int): Steps between swap rounds (default 1).
    quiet (bool): Whether to suppress debugging output (default True).
)DOC")

      .def("step", &ExchangeSimulation::step, py::arg("num_steps") = 1, R"DOC(
Sample every chain once per step, with a swap round every swap_interval
steps.

Args:
    num_steps (int): The number of steps to take (default 1).
)DOC")

      .def("swap", &ExchangeSimulation::swap, py::arg("pair"), R"DOC(
Attempt a single swap outside of the alternating schedule.

Args:
    pair (int): The pair index.

Returns:
    bool: Whether the swap was accepted.
)DOC")

      .def("getTime", &ExchangeSimulation::getTime)
      .def("getNumChains", &ExchangeSimulation::getNumChains)
      .def("getNumPairs", &ExchangeSimulation::getNumPairs)

      .def("getPairChains", &ExchangeSimulation::getPairChains,
           py::arg("pair"), R"DOC(
Returns:
    tuple: The chain indices of a pair.
)DOC")

      .def("getSwapAcceptanceRates",
           &ExchangeSimulation::getSwapAcceptanceRates, R"DOC(
Returns:
    list (float): The swap acceptance rate of every pair.
)DOC")

      .def("getChainAcceptanceRates",
           &ExchangeSimulation::getChainAcceptanceRates, R"DOC(
Returns:
    list (float): The acceptance rate of every chain's own moves.
)DOC")

      .def("getChainPositions", &ExchangeSimulation::getChainPositions,
           R"DOC(
Returns:
    list (list (float)): The current position of every chain.
)DOC");
}
