#include "dopt/policy/DelayPolicy.hpp"
#include "dopt/diag/logging.hpp"
#include "dopt/policy/Checker.hpp"
#include "dopt/policy/PolicyRun.hpp"
#include "dopt/set/OptSet.hpp"
#include <utility>

namespace dopt {

namespace {

// A delayed match and the number of bindings logged when it matched.
using Pending = std::pair<OptMatch, std::size_t>;

// Puts each delayed binding back where its token was confirmed, so the
// log reads in the same order a forward parse produces.
void merge_delayed(std::vector<Binding> &bindings,
                   std::vector<std::pair<std::size_t, Binding>> delayed) {
  if (delayed.empty()) {
    return;
  }
  std::vector<Binding> merged;
  merged.reserve(bindings.size() + delayed.size());
  std::size_t next = 0;
  for (auto &[slot, binding] : delayed) {
    while (next < slot) {
      merged.push_back(std::move(bindings[next++]));
    }
    merged.push_back(std::move(binding));
  }
  while (next < bindings.size()) {
    merged.push_back(std::move(bindings[next++]));
  }
  bindings = std::move(merged);
}

} // namespace

ParseReturn DelayPolicy::parse(OptSet &set, const Invoker &inv,
                               std::vector<std::string> args) const {
  policy::pre_check(set);
  set.reset();

  ParseCtx ctx = policy::init_ctx(std::move(args));
  diag::FailManager fails;
  policy::PolicyRun run(set, inv, m_settings, ctx, fails);

  return policy::guarded(ctx, [&] {
    std::vector<Pending> pending;

    policy::PolicyRun::ScanHooks hooks;
    hooks.on_matched = [&](OptProcess &proc) {
      std::vector<Binding> &bindings = run.ctx().bindings;
      std::size_t pending_mark = pending.size();
      std::size_t binding_mark = bindings.size();
      for (OptMatch &match : proc.matches()) {
        if (!match.is_matched()) {
          continue;
        }
        if (!set[*match.uid()].no_delay()) {
          pending.emplace_back(match, bindings.size());
          continue;
        }
        if (!run.invoke_match(match)) {
          proc.undo(set);
          pending.erase(pending.begin() +
                            static_cast<std::ptrdiff_t>(pending_mark),
                        pending.end());
          bindings.erase(bindings.begin() +
                             static_cast<std::ptrdiff_t>(binding_mark),
                         bindings.end());
          return;
        }
      }
    };
    run.scan_options(hooks);
    if (run.quit()) {
      return;
    }

    run.resolve_cmd();
    if (run.quit()) {
      return;
    }
    policy::cmd_check(set, fails);

    run.resolve_pos();
    if (run.quit()) {
      return;
    }

    DOPT_TRACE("flush {} delayed bindings", pending.size());
    // delayed options count as matched once a handler accepted them
    for (auto &[match, slot] : pending) {
      set[*match.uid()].set_matched(false);
    }
    std::vector<std::pair<std::size_t, Binding>> delayed;
    for (auto &[match, slot] : pending) {
      Uid uid = *match.uid();
      if (run.invoke_match(match)) {
        set[uid].set_matched(true);
        delayed.emplace_back(slot, std::move(run.ctx().bindings.back()));
        run.ctx().bindings.pop_back();
      } else {
        bool matched = set[uid].matched();
        match.undo(set);
        set[uid].set_matched(matched);
      }
      if (run.quit()) {
        break;
      }
    }
    merge_delayed(run.ctx().bindings, std::move(delayed));
    if (run.quit()) {
      return;
    }
    run.ctx().act = PolicyAct::Null;

    policy::opt_check(set, fails);
    policy::pos_check(set, fails);

    run.resolve_main();
    if (run.quit()) {
      return;
    }
    policy::post_check(set, fails);
  });
}

} // namespace dopt
