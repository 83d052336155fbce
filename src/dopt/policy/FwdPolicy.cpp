#include "dopt/policy/FwdPolicy.hpp"
#include "dopt/policy/Checker.hpp"
#include "dopt/policy/PolicyRun.hpp"
#include "dopt/set/OptSet.hpp"

namespace dopt {

void FwdPolicy::run(policy::PolicyRun &state) {
  OptSet &set = state.set();
  policy::PolicyRun::ScanHooks hooks;
  hooks.on_matched = [&](OptProcess &proc) { state.invoke_opt(proc); };
  state.scan_options(hooks);
  if (state.quit()) {
    return;
  }
  policy::opt_check(set, state.fails());

  state.resolve_cmd();
  if (state.quit()) {
    return;
  }
  policy::cmd_check(set, state.fails());

  state.resolve_pos();
  if (state.quit()) {
    return;
  }
  policy::pos_check(set, state.fails());

  state.resolve_main();
  if (state.quit()) {
    return;
  }
  policy::post_check(set, state.fails());
}

ParseReturn FwdPolicy::parse(OptSet &set, const Invoker &inv,
                             std::vector<std::string> args) const {
  policy::pre_check(set);
  set.reset();

  ParseCtx ctx = policy::init_ctx(std::move(args));
  diag::FailManager fails;
  policy::PolicyRun state(set, inv, m_settings, ctx, fails);
  return policy::guarded(ctx, [&] { run(state); });
}

} // namespace dopt
