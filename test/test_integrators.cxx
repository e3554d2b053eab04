#include <gtest/gtest.h>
#include "core/propagators.hxx"
#include "test_helpers.hxx"

using namespace integrators;

namespace {
// E(q, t) = -t q: a force that grows linearly in time
struct ramp_gradient_t : public gradient_t {
  vector_t operator()(const vector_t &q, real_t t) const override {
    return vector_t::Constant(q.size(), -t);
  }
};

struct zero_gradient_t : public gradient_t {
  vector_t operator()(const vector_t &q, real_t /*t*/) const override {
    return vector_t::Zero(q.size());
  }
};

gradient_ptr harmonic_gradient() {
  return std::make_shared<density_gradient_t>(
      std::make_shared<normal_density_t>());
}

real_t harmonic_energy(const state_t &state, const array_t<real_t> &masses) {
  return 0.5 * state.position().squaredNorm() +
         kinetic_energy(state.momentum(),
                        inverse_masses(masses, state.dimension()));
}
} // namespace

TEST(IntegratorTest, CreateAndNames) {
  auto leapfrog = integrator_base_t::create(integrator_type_t::leapfrog, 0.1,
                                            harmonic_gradient());
  EXPECT_EQ(leapfrog->type(), integrator_type_t::leapfrog);
  EXPECT_EQ(leapfrog->name(), "Leapfrog");
  EXPECT_EQ(integrator_type_from_name("velocity_verlet"),
            integrator_type_t::velocity_verlet);
  EXPECT_THROW(integrator_type_from_name("euler"), std::out_of_range);
  EXPECT_THROW(leapfrog_t(0, harmonic_gradient()), parameter_value_error);
  EXPECT_THROW(leapfrog_t(0.1, nullptr), std::invalid_argument);
}

TEST(IntegratorTest, HarmonicEnergyIsConserved) {
  array_t<real_t> masses;
  for (auto type :
       {integrator_type_t::leapfrog, integrator_type_t::velocity_verlet}) {
    auto integrator = integrator_base_t::create(type, 0.01, harmonic_gradient());
    auto init = make_state({1}, {0});
    auto result = integrator->integrate(init, 1000, masses);
    EXPECT_NEAR(harmonic_energy(*result->final(), masses), 0.5, 1e-3)
        << integrator->name();
    // ten time units: q(t) = cos(t)
    EXPECT_NEAR(result->final()->position()[0], std::cos(10.0), 1e-3)
        << integrator->name();
  }
}

TEST(IntegratorTest, MassesSlowTheDynamics) {
  array_t<real_t> masses(1);
  masses << 4;
  leapfrog_t integrator(0.01, harmonic_gradient());
  auto init = make_state({1}, {2});
  auto result = integrator.integrate(init, 2000, masses);
  EXPECT_NEAR(harmonic_energy(*init, masses), 1.0, 1e-12);
  EXPECT_NEAR(harmonic_energy(*result->final(), masses), 1.0, 1e-3);

  array_t<real_t> wrong(2);
  wrong << 1, 1;
  EXPECT_THROW(integrator.integrate(init, 10, wrong), std::invalid_argument);
}

TEST(IntegratorTest, LeapfrogMatchesVelocityVerlet) {
  auto init = make_state({0.3, -1.2}, {0.7, 0.1});
  auto a = leapfrog_t(0.05, harmonic_gradient())
               .integrate(init, 200, array_t<real_t>());
  auto b = velocity_verlet_t(0.05, harmonic_gradient())
               .integrate(init, 200, array_t<real_t>());
  for (Eigen::Index i = 0; i < 2; i++) {
    EXPECT_NEAR(a->final()->position()[i], b->final()->position()[i], 1e-9);
    EXPECT_NEAR(a->final()->momentum()[i], b->final()->momentum()[i], 1e-9);
  }
}

TEST(IntegratorTest, TimeDependentGradientSeesTime) {
  // dp/dt = t, so p(1) = 1/2; the trapezoidal kicks are exact here
  auto gradient = std::make_shared<ramp_gradient_t>();
  for (auto type :
       {integrator_type_t::leapfrog, integrator_type_t::velocity_verlet}) {
    auto integrator = integrator_base_t::create(type, 0.1, gradient);
    auto result =
        integrator->integrate(make_state({0}, {0}), 10, array_t<real_t>());
    EXPECT_NEAR(result->final()->momentum()[0], 0.5, 1e-12);
  }
}

TEST(IntegratorTest, TrajectoryOutput) {
  velocity_verlet_t integrator(0.1, harmonic_gradient());
  auto init = make_state({1}, {0});
  auto full = std::dynamic_pointer_cast<const trajectory_t>(
      integrator.integrate(init, 5, array_t<real_t>(), true));
  ASSERT_TRUE(full);
  EXPECT_EQ(full->size(), 6u);
  EXPECT_EQ(full->initial()->position(), init->position());

  auto leapfrog_full = std::dynamic_pointer_cast<const trajectory_t>(
      leapfrog_t(0.1, harmonic_gradient())
          .integrate(init, 5, array_t<real_t>(), true));
  ASSERT_TRUE(leapfrog_full);
  EXPECT_EQ(leapfrog_full->size(), 6u);

  auto endpoints = integrator.integrate(init, 5, array_t<real_t>());
  EXPECT_FALSE(std::dynamic_pointer_cast<const trajectory_t>(endpoints));
  EXPECT_EQ(endpoints->heat(), 0);
}

TEST(IntegratorTest, InitialStateContracts) {
  leapfrog_t integrator(0.1, harmonic_gradient());
  EXPECT_THROW(integrator.integrate(make_state({1}), 5, array_t<real_t>()),
               std::invalid_argument);
  EXPECT_THROW(integrator.integrate(make_state({1}, {0}), 0, array_t<real_t>()),
               std::invalid_argument);
  EXPECT_THROW(integrator.integrate(nullptr, 5, array_t<real_t>()),
               std::invalid_argument);
}

TEST(PropagatorTest, MdPropagatorRunsTheIntegrator) {
  md_propagator_t propagator(harmonic_gradient(), 0.01);
  auto init = make_state({1}, {0});
  auto result = propagator.generate(init, 100);
  auto expected =
      leapfrog_t(0.01, harmonic_gradient()).integrate(init, 100, array_t<real_t>());
  EXPECT_EQ(result->final()->position(), expected->final()->position());
  EXPECT_EQ(result->heat(), 0);

  array_t<real_t> masses(1);
  masses << -1;
  EXPECT_THROW(md_propagator_t(harmonic_gradient(), 0.01, masses),
               parameter_value_error);
}

TEST(PropagatorTest, NoCollisionsIsPlainDynamics) {
  randgen rng(3);
  auto temperature = std::make_shared<constant_temperature_t>(1);
  auto init = make_state({1, 0.5}, {0, -0.3});
  for (auto type :
       {integrator_type_t::leapfrog, integrator_type_t::velocity_verlet}) {
    thermostatted_md_propagator_t thermostatted(
        harmonic_gradient(), 0.02, temperature, 0, 1, rng, array_t<real_t>(),
        type);
    md_propagator_t plain(harmonic_gradient(), 0.02, array_t<real_t>(), type);
    auto a = thermostatted.generate(init, 50);
    auto b = plain.generate(init, 50);
    EXPECT_EQ(a->heat(), 0);
    for (Eigen::Index i = 0; i < 2; i++) {
      EXPECT_NEAR(a->final()->position()[i], b->final()->position()[i], 1e-9);
      EXPECT_NEAR(a->final()->momentum()[i], b->final()->momentum()[i], 1e-9);
    }
  }
}

TEST(PropagatorTest, HeatIsKineticChangeOverTemperature) {
  // without forces only collisions change the kinetic energy
  randgen rng(11);
  array_t<real_t> masses(3);
  masses << 1, 2, 0.5;
  thermostatted_md_propagator_t propagator(
      std::make_shared<zero_gradient_t>(), 0.1,
      std::make_shared<constant_temperature_t>(2), 1.0, 3, rng, masses);
  auto init = make_state({0, 0, 0}, {1, -1, 0.5});
  auto result = propagator.generate(init, 10);
  auto inv = inverse_masses(masses, 3);
  real_t expected = (kinetic_energy(result->final()->momentum(), inv) -
                     kinetic_energy(init->momentum(), inv)) /
                    2;
  EXPECT_NE(result->heat(), 0);
  EXPECT_NEAR(result->heat(), expected, 1e-12);
}

TEST(PropagatorTest, ThermostatValidation) {
  randgen rng;
  auto temperature = std::make_shared<constant_temperature_t>();
  EXPECT_THROW(thermostatted_md_propagator_t(harmonic_gradient(), 0.1,
                                             temperature, 1.5, 1, rng),
               parameter_value_error);
  EXPECT_THROW(thermostatted_md_propagator_t(harmonic_gradient(), 0.1,
                                             temperature, 0.5, 0, rng),
               parameter_value_error);
  EXPECT_THROW(thermostatted_md_propagator_t(harmonic_gradient(), 0.1, nullptr,
                                             0.5, 1, rng),
               std::invalid_argument);
}

TEST(RandgenTest, SeededStreamsAreReproducible) {
  randgen a(42), b(42), c(43);
  for (int i = 0; i < 10; i++) {
    real_t x = a.gaussian();
    EXPECT_EQ(x, b.gaussian());
    EXPECT_NE(x, c.gaussian());
  }
  EXPECT_EQ(a.counter(), 10u);
  real_t u = a.uniform();
  EXPECT_GE(u, 0);
  EXPECT_LT(u, 1);
}

TEST(RandgenTest, GaussianDrawsAreStandardNormal) {
  randgen rng(7);
  const int n = 20000;
  real_t sum = 0, sum2 = 0;
  for (int i = 0; i < n; i++) {
    real_t x = rng.gaussian();
    ASSERT_TRUE(std::isfinite(x));
    sum += x;
    sum2 += x * x;
  }
  real_t mean = sum / n;
  EXPECT_NEAR(mean, 0, 0.05);
  EXPECT_NEAR(sum2 / n - mean * mean, 1, 0.05);
  EXPECT_DOUBLE_EQ(randgen(7).gaussian(),
                   r123::boxmuller(randgen(7).yield().value[0],
                                   randgen(7).yield().value[1]).x);
}
