#include <gtest/gtest.h>
#include "util/util.hxx"

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  rexmc_quiet_output::enable();
  return RUN_ALL_TESTS();
}
