#pragma once

#include "dopt/diag/FailManager.hpp"

namespace dopt {
class OptSet;
}

namespace dopt::policy {

// Throws UnexpectedPosIfHasCmd for a force positional at index 1 next to
// a command.
void pre_check(const OptSet &set);

// The remaining checks throw the failure, chained with the recorded
// failures of the offending option.
void opt_check(const OptSet &set, const diag::FailManager &fails);
void cmd_check(const OptSet &set, const diag::FailManager &fails);
void pos_check(const OptSet &set, const diag::FailManager &fails);
void post_check(const OptSet &set, const diag::FailManager &fails);

} // namespace dopt::policy
