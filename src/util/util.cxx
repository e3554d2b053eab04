#include "util.hxx"

bool rexmc_quiet_output::enabled_ = true;
