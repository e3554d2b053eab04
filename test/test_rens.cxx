#include <gtest/gtest.h>
#include "core/rens.hxx"
#include "core/simulation.hxx"
#include "test_helpers.hxx"

namespace {
std::vector<swap_param_info_ptr>
md_rens_infos(const single_chain_ptr &a, const single_chain_ptr &b,
              real_t timestep = 0.05, size_t traj_length = 20) {
  auto gradient = std::make_shared<normal_switching_gradient_t>(
      dynamic_cast<const normal_density_t &>(a->pdf()).sigma(),
      dynamic_cast<const normal_density_t &>(b->pdf()).sigma());
  return {std::make_shared<md_rens_swap_param_info_t>(a, b, timestep,
                                                      traj_length, gradient)};
}

std::vector<swap_param_info_ptr>
thermostatted_infos(const single_chain_ptr &a, const single_chain_ptr &b,
                    real_t collision_probability) {
  auto gradient = std::make_shared<normal_switching_gradient_t>(
      dynamic_cast<const normal_density_t &>(a->pdf()).sigma(),
      dynamic_cast<const normal_density_t &>(b->pdf()).sigma());
  return {std::make_shared<thermostatted_md_rens_swap_param_info_t>(
      a, b, 0.05, 20, gradient, collision_probability, 1,
      std::make_shared<linear_temperature_t>(a->temperature(),
                                             b->temperature()))};
}

real_t log_ratio(exchange_mc_t &algorithm, swap_communicator_t &swapcom) {
  algorithm.calc_acceptance(swapcom);
  return swapcom.log_acceptance_ratio;
}

std::vector<real_t> md_rens_rates(uint64_t seed) {
  auto a = make_rwmc(1, 1, {0}, seed + 1);
  auto b = make_rwmc(2, 1, {0}, seed + 2);
  auto algorithm = std::make_shared<md_rens_t>(
      std::vector<single_chain_ptr>{a, b}, md_rens_infos(a, b), seed);
  exchange_simulation_t simulation(algorithm);
  simulation.step(500);
  return simulation.swap_acceptance_rates();
}
} // namespace

TEST(RensTest, ParameterInfoMustMatchTheAlgorithm) {
  auto a = make_rwmc(1, 1, {0}, 1);
  auto b = make_rwmc(2, 1, {0}, 2);
  std::vector<single_chain_ptr> chains{a, b};
  std::vector<swap_param_info_ptr> plain{
      std::make_shared<swap_param_info_t>(a, b)};
  EXPECT_THROW(md_rens_t(chains, plain), std::invalid_argument);
  EXPECT_THROW(thermostatted_md_rens_t(chains, md_rens_infos(a, b)),
               std::invalid_argument);
  // a thermostatted pair is also a valid plain MD pair
  EXPECT_NO_THROW(md_rens_t(chains, thermostatted_infos(a, b, 0.1)));
}

TEST(RensTest, ParameterValidation) {
  auto a = make_rwmc(1, 1, {0}, 1);
  auto b = make_rwmc(2, 1, {0}, 2);
  auto gradient = std::make_shared<normal_switching_gradient_t>(1, 2);
  EXPECT_THROW(md_rens_swap_param_info_t(a, b, 0, 10, gradient),
               parameter_value_error);
  EXPECT_THROW(md_rens_swap_param_info_t(a, b, 0.1, 0, gradient),
               parameter_value_error);
  EXPECT_THROW(md_rens_swap_param_info_t(a, b, 0.1, 10, nullptr),
               std::invalid_argument);
  array_t<real_t> masses(2);
  masses << 1, 1;
  EXPECT_THROW(md_rens_swap_param_info_t(a, b, 0.1, 10, gradient, masses),
               std::invalid_argument);

  thermostatted_md_rens_swap_param_info_t info(a, b, 0.1, 10, gradient);
  EXPECT_EQ(info.collision_probability(), 0.1);
  EXPECT_EQ(info.collision_interval(), 1u);
  EXPECT_NEAR(info.switching_time(), 1.0, 1e-12);
  EXPECT_THROW(info.set_collision_probability(-0.1), parameter_value_error);
  EXPECT_THROW(info.set_collision_interval(0), parameter_value_error);
  EXPECT_THROW(info.set_temperature(nullptr), std::invalid_argument);
}

TEST(RensTest, SwitchingTrajectoriesRunInOppositeDirections) {
  auto a = make_rwmc(1, 1, {0.4}, 1);
  auto b = make_rwmc(2, 1.5, {-0.9}, 2);
  md_rens_t algorithm({a, b}, md_rens_infos(a, b), 7);
  auto swapcom = algorithm.propose_swap(algorithm.param_info(0));

  // both trajectories start from the chain positions with fresh momenta
  EXPECT_EQ(swapcom.traj12->initial()->position(), a->state()->position());
  EXPECT_EQ(swapcom.traj21->initial()->position(), b->state()->position());
  EXPECT_TRUE(swapcom.traj12->initial()->has_momentum());
  EXPECT_EQ(swapcom.traj12->heat(), 0);
  EXPECT_NE(swapcom.traj12->final()->position(),
            swapcom.traj12->initial()->position());

  // the acceptance uses the work of both switches
  real_t t1 = a->temperature(), t2 = b->temperature();
  const state_t &x1 = *swapcom.traj12->initial();
  const state_t &x2 = *swapcom.traj21->initial();
  const state_t &y1 = *swapcom.traj21->final();
  const state_t &y2 = *swapcom.traj12->final();
  auto h = [](const single_chain_ptr &chain, const state_t &state) {
    return chain->energy(state.position()) +
           0.5 * state.momentum().squaredNorm();
  };
  real_t w12 = h(b, y2) / t2 - h(a, x1) / t1;
  real_t w21 = h(a, y1) / t1 - h(b, x2) / t2;
  EXPECT_NEAR(log_ratio(algorithm, swapcom), -(w12 + w21), 1e-10);
  EXPECT_NEAR(swapcom.work12, w12, 1e-10);
  EXPECT_NEAR(swapcom.work21, w21, 1e-10);
  EXPECT_NEAR(swapcom.log_acceptance_ratio,
              -(swapcom.work12 + swapcom.work21), 1e-12);
  EXPECT_GE(swapcom.acceptance_probability, 0);
  EXPECT_LE(swapcom.acceptance_probability, 1);
}

TEST(RensTest, IdenticalChainsSwapAlmostSurely) {
  // without a switch the work is the integration error only
  auto a = make_rwmc(1, 1, {0.3}, 1);
  auto b = make_rwmc(1, 1, {-0.6}, 2);
  md_rens_t algorithm({a, b}, md_rens_infos(a, b, 0.01, 50), 5);
  for (int i = 0; i < 10; i++) {
    auto swapcom = algorithm.propose_swap(algorithm.param_info(0));
    EXPECT_NEAR(log_ratio(algorithm, swapcom), 0, 1e-3);
  }
}

TEST(RensTest, DivergingSwitchIsRejected) {
  // leapfrog is unstable for omega * dt > 2; the trajectory overflows to NaN
  auto a = make_rwmc(1, 1, {0.3}, 1);
  auto b = make_rwmc(1, 1, {-0.6}, 2);
  md_rens_t algorithm({a, b}, md_rens_infos(a, b, 2.5, 2000), 5);
  vector_t position_a = a->state()->position();
  vector_t position_b = b->state()->position();

  bool accepted = true;
  EXPECT_NO_THROW(accepted = algorithm.swap(0));
  EXPECT_FALSE(accepted);
  EXPECT_EQ(algorithm.statistics()[0].attempted, 1u);
  EXPECT_EQ(algorithm.statistics()[0].accepted, 0u);
  EXPECT_EQ(a->state()->position(), position_a);
  EXPECT_EQ(b->state()->position(), position_b);

  auto swapcom = algorithm.propose_swap(algorithm.param_info(0));
  EXPECT_NO_THROW(algorithm.calc_acceptance(swapcom));
  EXPECT_FALSE(std::isfinite(swapcom.log_acceptance_ratio));
  EXPECT_EQ(swapcom.acceptance_probability, 0);
}

TEST(RensTest, AcceptedSwapDropsMomenta) {
  auto a = make_rwmc(1, 1, {0.3}, 1);
  auto b = make_rwmc(1, 1, {-0.6}, 2);
  md_rens_t algorithm({a, b}, md_rens_infos(a, b, 0.01, 50), 5);
  size_t accepted = 0;
  for (int i = 0; i < 20; i++) {
    accepted += algorithm.swap(0);
  }
  EXPECT_GT(accepted, 0u);
  EXPECT_FALSE(a->state()->has_momentum());
  EXPECT_FALSE(b->state()->has_momentum());
  EXPECT_EQ(algorithm.statistics()[0].attempted, 20u);
}

TEST(RensTest, DifferentWidthsSwapSometimes) {
  auto rates = md_rens_rates(31);
  EXPECT_GT(rates[0], 0);
  EXPECT_LT(rates[0], 1);
  EXPECT_EQ(md_rens_rates(31), rates);
}

TEST(ThermostattedRensTest, NoCollisionsMatchesPlainMd) {
  auto a = make_rwmc(1, 1, {0.4}, 1);
  auto b = make_rwmc(2, 1.5, {-0.9}, 2);
  md_rens_t plain({a, b}, thermostatted_infos(a, b, 0), 13);
  thermostatted_md_rens_t thermostatted({a, b}, thermostatted_infos(a, b, 0),
                                        13);
  auto plain_swap = plain.propose_swap(plain.param_info(0));
  auto thermostatted_swap =
      thermostatted.propose_swap(thermostatted.param_info(0));
  EXPECT_EQ(thermostatted_swap.traj12->heat(), 0);
  EXPECT_NEAR(log_ratio(thermostatted, thermostatted_swap),
              log_ratio(plain, plain_swap), 1e-8);
}

TEST(ThermostattedRensTest, CollisionsProduceHeat) {
  auto a = make_rwmc(1, 1, {0.4}, 1);
  auto b = make_rwmc(2, 3, {-0.9}, 2);
  thermostatted_md_rens_t algorithm({a, b}, thermostatted_infos(a, b, 0.5), 3);
  auto swapcom = algorithm.propose_swap(algorithm.param_info(0));
  EXPECT_NE(swapcom.traj12->heat(), 0);
  EXPECT_NE(swapcom.traj21->heat(), 0);
  algorithm.calc_acceptance(swapcom);
  EXPECT_GE(swapcom.acceptance_probability, 0);
  EXPECT_LE(swapcom.acceptance_probability, 1);

  exchange_simulation_t simulation(
      std::make_shared<thermostatted_md_rens_t>(
          std::vector<single_chain_ptr>{a, b}, thermostatted_infos(a, b, 0.5),
          4),
      5);
  simulation.step(200);
  EXPECT_EQ(simulation.time(), 200u);
  EXPECT_EQ(simulation.algorithm().statistics()[0].attempted, 40u);
}
