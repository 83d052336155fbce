#include "dopt/policy/PrePolicy.hpp"
#include "dopt/diag/logging.hpp"
#include "dopt/policy/Checker.hpp"
#include "dopt/policy/FwdPolicy.hpp"
#include "dopt/policy/PolicyRun.hpp"
#include "dopt/set/OptSet.hpp"

namespace dopt {

std::optional<std::size_t>
PrePolicy::find_boundary(OptSet &set, const Invoker &inv,
                         const std::vector<std::string> &args,
                         const IsSubParser &is_sub) const {
  set.reset();
  ParseCtx ctx = policy::init_ctx(args);
  diag::FailManager fails;
  policy::PolicyRun run(set, inv, m_settings, ctx, fails);

  std::optional<std::size_t> boundary;
  policy::PolicyRun::ScanHooks hooks;
  hooks.trial = true;
  hooks.on_matched = [&](OptProcess &proc) { proc.undo(set); };
  hooks.on_noa = [&](std::size_t idx, const std::string &raw) {
    if (is_sub(raw)) {
      boundary = idx;
      return true;
    }
    return false;
  };
  run.scan_options(hooks);
  set.reset();
  return boundary;
}

ParseReturn PrePolicy::parse(OptSet &set, const Invoker &inv,
                             std::vector<std::string> args,
                             const IsSubParser &is_sub) const {
  policy::pre_check(set);

  std::optional<Delegation> delegation;
  if (is_sub) {
    if (auto boundary = find_boundary(set, inv, args, is_sub)) {
      std::vector<std::string> tail(
          args.begin() + static_cast<std::ptrdiff_t>(*boundary), args.end());
      delegation = Delegation{*boundary, args[*boundary], std::move(tail)};
      args.resize(*boundary);
      DOPT_DEBUG("sub parser `{}` starts at {}", delegation->name, *boundary);
    }
  }

  set.reset();
  ParseCtx ctx = policy::init_ctx(std::move(args));
  ctx.delegation = std::move(delegation);
  diag::FailManager fails;
  policy::PolicyRun state(set, inv, m_settings, ctx, fails);
  return policy::guarded(ctx, [&] { FwdPolicy::run(state); });
}

} // namespace dopt
