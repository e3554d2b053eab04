#include <gtest/gtest.h>
#include "core/trajectory.hxx"
#include "test_helpers.hxx"

TEST(StateTest, MomentumIsOptional) {
  auto state = make_state({1, 2});
  EXPECT_FALSE(state->has_momentum());
  EXPECT_EQ(state->dimension(), 2u);
  EXPECT_THROW(state->momentum(), std::logic_error);

  auto phase_point = make_state({1, 2}, {3, 4});
  ASSERT_TRUE(phase_point->has_momentum());
  EXPECT_EQ(phase_point->momentum()[1], 4);
  auto stripped = phase_point->without_momentum();
  EXPECT_FALSE(stripped->has_momentum());
  EXPECT_EQ(stripped->position(), phase_point->position());
}

TEST(StateTest, RejectsBadShapes) {
  EXPECT_THROW(state_t(vector_t(0)), std::invalid_argument);
  EXPECT_THROW(state_t(vec({1, 2}), vec({1})), std::invalid_argument);
}

TEST(StateTest, CloneIsIndependentCopy) {
  auto state = make_state({1.5}, {-0.5});
  auto copy = state->clone();
  EXPECT_NE(copy.get(), state.get());
  EXPECT_EQ(copy->position(), state->position());
  EXPECT_EQ(copy->momentum(), state->momentum());
}

TEST(EnsembleStateTest, Contracts) {
  std::vector<state_ptr> no_states;
  EXPECT_THROW(ensemble_state_t{no_states}, std::invalid_argument);
  EXPECT_THROW(ensemble_state_t({make_state({0}), nullptr}),
               std::invalid_argument);
  ensemble_state_t ensemble({make_state({0}), make_state({1})});
  EXPECT_EQ(ensemble.size(), 2u);
  EXPECT_EQ(ensemble[1]->position()[0], 1);
  EXPECT_THROW(ensemble.at(2), std::out_of_range);
  EXPECT_FALSE(ensemble.parameter());

  ensemble_state_t tempered({make_state({0})}, 2.5);
  ASSERT_TRUE(tempered.parameter());
  EXPECT_EQ(*tempered.parameter(), 2.5);
}

TEST(TrajectoryTest, NeedsTwoStates) {
  EXPECT_THROW(trajectory_t({make_state({0})}), std::invalid_argument);
  trajectory_t trajectory({make_state({0}), make_state({1})}, 0.5, 2.0);
  EXPECT_EQ(trajectory.size(), 2u);
  EXPECT_EQ(trajectory.heat(), 0.5);
  EXPECT_EQ(trajectory.work(), 2.0);
}

TEST(TrajectoryBuilderTest, FullBuilderKeepsEveryState) {
  auto builder = trajectory_builder_t::create(true);
  builder->add_intermediate_state(make_state({1}));
  builder->add_intermediate_state(make_state({2}));
  builder->add_final_state(make_state({3}));
  // the initial state goes in front even when added last
  builder->add_initial_state(make_state({0}));
  builder->set_work(-0.5);
  EXPECT_EQ(builder->state_count(), 4u);

  auto result = builder->product();
  auto trajectory = std::dynamic_pointer_cast<const trajectory_t>(result);
  ASSERT_TRUE(trajectory);
  EXPECT_EQ(trajectory->size(), 4u);
  EXPECT_EQ(trajectory->work(), -0.5);
  EXPECT_EQ(result->initial()->position()[0], 0);
  EXPECT_EQ(result->final()->position()[0], 3);
  for (size_t i = 0; i < trajectory->size(); i++) {
    EXPECT_EQ((*trajectory)[i]->position()[0], real_t(i));
  }
}

TEST(TrajectoryBuilderTest, StatesAreCopied) {
  auto state = make_state({7});
  trajectory_builder_t builder;
  builder.add_initial_state(state);
  builder.add_final_state(state);
  auto result = builder.product();
  EXPECT_NE(result->initial().get(), state.get());
  EXPECT_EQ(result->initial()->position(), state->position());
}

TEST(TrajectoryBuilderTest, NullStatesThrow) {
  trajectory_builder_t builder;
  EXPECT_THROW(builder.add_initial_state(nullptr), std::invalid_argument);
  EXPECT_THROW(builder.add_final_state(nullptr), std::invalid_argument);
}

TEST(ShortTrajectoryBuilderTest, ProductNeedsExactlyTwoStates) {
  auto builder = trajectory_builder_t::create(false);
  EXPECT_THROW(builder->product(), std::invalid_argument);
  builder->add_initial_state(make_state({0}));
  EXPECT_THROW(builder->product(), std::invalid_argument);

  builder->add_intermediate_state(make_state({1}));
  EXPECT_EQ(builder->state_count(), 1u);
  builder->add_final_state(make_state({2}));
  builder->set_heat(1.25);

  auto result = builder->product();
  EXPECT_EQ(result->initial()->position()[0], 0);
  EXPECT_EQ(result->final()->position()[0], 2);
  EXPECT_EQ(result->heat(), 1.25);
  EXPECT_FALSE(std::dynamic_pointer_cast<const trajectory_t>(result));

  builder->add_final_state(make_state({3}));
  EXPECT_THROW(builder->product(), std::invalid_argument);
}
