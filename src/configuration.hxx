#pragma once

#include <string>

#include "core/simulation.hxx"

namespace Ark {
  class ark;
}

enum class exchange_algorithm_t {
  replica_exchange,
  md_rens,
  thermostatted_md_rens
};

// "re", "mdrens" or "tmdrens"
exchange_algorithm_t exchange_algorithm_from_name(const std::string &name);

std::vector<single_chain_ptr> configure_chains(const Ark::ark &config_ark,
                                               uint64_t seed = 0);

std::shared_ptr<exchange_mc_t>
configure_exchange(const Ark::ark &config_ark, exchange_algorithm_t algorithm,
                   uint64_t seed = 0, bool quiet = true);
