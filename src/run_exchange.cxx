#include <iostream>
#include <unistd.h>
#include <ark/ark.hpp>
#include "configuration.hxx"

void show_usage(std::string name) {
  std::cerr
      << "Usage: " << name << " <option(s)>\n"
      << "Options:\n"
      << "\t-h\t\tShow this help message\n"
      << "\t-a\t\tExchange algorithm: re, mdrens or tmdrens (default re)\n"
      << "\t-l\t\tNumber of steps to run (default 1000)\n"
      << "\t-i\t\tSteps between swap rounds (default 1)\n"
      << "\t-s\t\tRandom seed (default 10)\n"
      << "\t-q\t\tWhether to run with quiet output (default 1)\n"
      << "\t-g\t\tConfiguration file name (default 'exchange.cfg')\n"
      << std::endl;
}

int main(int argc, char **argv) {
  std::string algorithm_name("re");
  int last_time = 1000;
  int interval = 1;
  int seed = 10;
  int quiet = 1;
  std::string config_file("exchange.cfg");

  int opt;
  while ((opt = getopt(argc, argv, "a:l:i:s:q:g:h")) != -1) {
    switch (opt) {
    case 'a':
      algorithm_name = std::string(optarg);
      break;
    case 'l':
      last_time = std::atoi(optarg);
      break;
    case 'i':
      interval = std::atoi(optarg);
      break;
    case 's':
      seed = std::atoi(optarg);
      break;
    case 'q':
      quiet = std::atoi(optarg);
      break;
    case 'g':
      config_file = std::string(optarg);
      break;
    case 'h':
    default:
      show_usage(argv[0]);
      return 0;
    }
  }
  if (interval <= 0) {
    std::cerr << "swap interval must be positive" << std::endl;
    return 1;
  }
  if (last_time < 0) {
    std::cerr << "number of steps must not be negative" << std::endl;
    return 1;
  }
  if (seed < 0) {
    std::cerr << "random seed must not be negative" << std::endl;
    return 1;
  }

  try {
    Ark::ark config_ark;
    Ark::parser parser;
    parser.parse_file(config_ark, config_file);

    auto algorithm = configure_exchange(
        config_ark, exchange_algorithm_from_name(algorithm_name), seed, quiet);
    exchange_simulation_t simulation(algorithm, interval);
    simulation.step(size_t(last_time));

    auto swap_rates = simulation.swap_acceptance_rates();
    for (size_t pair = 0; pair < swap_rates.size(); pair++) {
      const auto &chains = algorithm->pair_chains(pair);
      std::cout << "swap " << chains.first << " <-> " << chains.second
                << ": acceptance rate " << swap_rates[pair] << "\n";
    }
    auto chain_rates = simulation.chain_acceptance_rates();
    for (size_t chain = 0; chain < chain_rates.size(); chain++) {
      std::cout << "chain " << chain << ": acceptance rate "
                << chain_rates[chain] << "\n";
    }
  } catch (const std::exception &e) {
    std::cerr << argv[0] << ": " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
