#include <ark/ark.hpp>
#include <ark/arkTo.hpp>
#include "configuration.hxx"
#include "core/rens.hxx"
#include "models/normal.hxx"

namespace {

inline Ark::vector_t to_ark_vector(const Ark::reader &a) {
  return a;
}

template <typename T>
T ark_value(const Ark::ark &elem, const std::string &key, T fallback) {
  auto value = elem.get(key);
  return value ? Ark::arkTo<T>(*value) : fallback;
}

template <typename T>
T required_ark_value(const Ark::ark &elem, const std::string &key,
                     const std::string &where) {
  auto value = elem.get(key);
  if (!value) {
    throw std::runtime_error(where + " has no '" + key + "' entry");
  }
  return Ark::arkTo<T>(*value);
}

// counts are read as reals so that a negative entry is rejected instead of
// wrapping around
size_t ark_count(const Ark::ark &elem, const std::string &key,
                 size_t fallback, const std::string &where) {
  return count_from_real(ark_value<real_t>(elem, key, real_t(fallback)),
                         where + " " + key);
}

state_ptr initial_state(const Ark::ark &chain_ark, const std::string &where) {
  std::vector<real_t> position;
  if (chain_ark.get("position")) {
    Ark::arkToIter<real_t>(chain_ark, "position",
                           std::back_inserter(position));
  } else {
    position.assign(ark_count(chain_ark, "dimension", 1, where), 0);
  }
  return std::make_shared<state_t>(vector_from_stdvector(position));
}

single_chain_ptr configure_chain(const Ark::ark &chain_ark, size_t index,
                                 uint64_t seed) {
  std::string where = "chain " + std::to_string(index);
  auto pdf = std::make_shared<normal_density_t>(
      0, required_ark_value<real_t>(chain_ark, "sigma", where));
  real_t temperature = ark_value<real_t>(chain_ark, "temperature", 1);
  std::string kind = ark_value<std::string>(chain_ark, "sampler", "rwmc");
  auto state = initial_state(chain_ark, where);

  if (kind == "rwmc") {
    return std::make_shared<rwmc_sampler_t>(
        pdf, state, ark_value<real_t>(chain_ark, "stepsize", 0.7),
        temperature, seed);
  } else if (kind == "hmc") {
    return std::make_shared<hmc_sampler_t>(
        pdf, state, std::make_shared<density_gradient_t>(pdf),
        ark_value<real_t>(chain_ark, "timestep", 0.1),
        ark_count(chain_ark, "nsteps", 10, where), temperature, seed);
  }
  throw std::runtime_error(where + ": unknown sampler '" + kind + "'");
}

} // namespace

exchange_algorithm_t exchange_algorithm_from_name(const std::string &name) {
  static const std::unordered_map<std::string, exchange_algorithm_t> names = {
      {"re", exchange_algorithm_t::replica_exchange},
      {"mdrens", exchange_algorithm_t::md_rens},
      {"tmdrens", exchange_algorithm_t::thermostatted_md_rens}};
  return logged_at(names, name, "exchange algorithms");
}

std::vector<single_chain_ptr> configure_chains(const Ark::ark &config_ark,
                                               uint64_t seed) {
  Ark::reader a(config_ark);
  auto chains_ark = to_ark_vector(a.get("exchange.chains"));
  if (chains_ark.size() < 2) {
    throw std::runtime_error("exchange.chains needs at least two chains");
  }
  std::vector<single_chain_ptr> samplers;
  for (size_t index = 0; index < chains_ark.size(); index++) {
    samplers.push_back(
        configure_chain(chains_ark[index], index, seed + index + 1));
  }
  return samplers;
}

std::shared_ptr<exchange_mc_t>
configure_exchange(const Ark::ark &config_ark, exchange_algorithm_t algorithm,
                   uint64_t seed, bool quiet) {
  if (quiet) { rexmc_quiet_output::enable(); }
  else { rexmc_quiet_output::disable(); }

  auto samplers = configure_chains(config_ark, seed);

  // pairs default to the adjacent chains (k, k + 1) with default RENS
  // parameters
  Ark::vector_t pairs_ark;
  auto exchange_ark = config_ark.get("exchange");
  if (exchange_ark && exchange_ark->get("pairs")) {
    pairs_ark = exchange_ark->get("pairs")->vector();
  } else {
    pairs_ark.resize(samplers.size() - 1);
  }

  std::vector<swap_param_info_ptr> param_infos;
  for (size_t index = 0; index < pairs_ark.size(); index++) {
    const Ark::ark &pair_ark = pairs_ark[index];
    std::string where = "pair " + std::to_string(index);
    size_t chain1 = index;
    size_t chain2 = index + 1;
    if (pair_ark.kind() == Ark::Table && pair_ark.get("chains")) {
      const Ark::vector_t &chains = pair_ark.get("chains")->vector();
      if (chains.size() != 2) {
        throw std::runtime_error(where + ": 'chains' must name two chains");
      }
      chain1 = count_from_real(Ark::arkTo<real_t>(chains[0]),
                               where + " chains");
      chain2 = count_from_real(Ark::arkTo<real_t>(chains[1]),
                               where + " chains");
    }
    if (chain1 >= samplers.size() || chain2 >= samplers.size()) {
      throw std::runtime_error(where + " refers to a missing chain");
    }
    const auto &sampler1 = samplers[chain1];
    const auto &sampler2 = samplers[chain2];

    bool has_table = pair_ark.kind() == Ark::Table;
    auto pair_value = [&](const std::string &key, real_t fallback) {
      return has_table ? ark_value<real_t>(pair_ark, key, fallback) : fallback;
    };
    auto pair_count = [&](const std::string &key, size_t fallback) {
      return count_from_real(pair_value(key, real_t(fallback)),
                             where + " " + key);
    };
    real_t timestep = pair_value("timestep", 0.1);
    size_t traj_length = pair_count("traj_length", 20);

    auto sigma = [](const single_chain_ptr &sampler) {
      return dynamic_cast<const normal_density_t &>(sampler->pdf()).sigma();
    };
    auto gradient = std::make_shared<normal_switching_gradient_t>(
        sigma(sampler1), sigma(sampler2));

    switch (algorithm) {
    case exchange_algorithm_t::replica_exchange:
      param_infos.push_back(
          std::make_shared<swap_param_info_t>(sampler1, sampler2));
      break;
    case exchange_algorithm_t::md_rens:
      param_infos.push_back(std::make_shared<md_rens_swap_param_info_t>(
          sampler1, sampler2, timestep, traj_length, gradient));
      break;
    case exchange_algorithm_t::thermostatted_md_rens:
      param_infos.push_back(
          std::make_shared<thermostatted_md_rens_swap_param_info_t>(
              sampler1, sampler2, timestep, traj_length, gradient,
              pair_value("collision_probability", 0.1),
              pair_count("collision_interval", 1),
              std::make_shared<linear_temperature_t>(
                  sampler1->temperature(), sampler2->temperature())));
      break;
    }
  }

  switch (algorithm) {
  case exchange_algorithm_t::md_rens:
    return std::make_shared<md_rens_t>(samplers, param_infos, seed);
  case exchange_algorithm_t::thermostatted_md_rens:
    return std::make_shared<thermostatted_md_rens_t>(samplers, param_infos,
                                                     seed);
  default:
    return std::make_shared<replica_exchange_mc_t>(samplers, param_infos, seed);
  }
}
