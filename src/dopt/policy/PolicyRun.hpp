#pragma once

#include "dopt/diag/FailManager.hpp"
#include "dopt/lex/Token.hpp"
#include "dopt/policy/InvokeCtx.hpp"
#include "dopt/policy/Invoker.hpp"
#include "dopt/policy/ParseReturn.hpp"
#include "dopt/policy/PolicySettings.hpp"
#include "dopt/proc/Process.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dopt {
class OptSet;
}

namespace dopt::policy {

// State and phases shared by every policy for one parse.
class PolicyRun {
public:
  struct ScanHooks {
    // Called with a fully matched process. The token stays consumed by
    // the process even when a handler rejects its binding.
    std::function<void(OptProcess &)> on_matched;
    // Called for every token that ends up a NOA. Returning true stops
    // the scan at that token without recording it.
    std::function<bool(std::size_t, const std::string &)> on_noa;
    // Match failures are swallowed and strict mode is ignored.
    bool trial = false;
  };

  PolicyRun(OptSet &set, const Invoker &inv, const PolicySettings &settings,
            ParseCtx &ctx, diag::FailManager &fails)
      : m_set(set), m_inv(inv), m_settings(settings), m_ctx(ctx),
        m_fails(fails) {}

  // Walks args[1..] matching prefixed tokens against options, collecting
  // every other token as NOA. Returns the index the scan stopped at.
  std::size_t scan_options(const ScanHooks &hooks);

  // Binds NOA 1 to a command if any command is registered.
  void resolve_cmd();
  // Binds every NOA to the first positional accepting its index.
  void resolve_pos();
  // Binds the program name to the first main slot.
  void resolve_main();

  // Offers `proc` to every option in registration order.
  bool match_opt(OptProcess &proc);
  bool match_noa(NoaProcess &proc);

  // Invokes every matched binding of `proc`; on rejection the whole
  // process and its bindings are undone and false returned.
  bool invoke_opt(OptProcess &proc);
  bool invoke_noa(NoaProcess &proc);

  // Invokes one option binding and stores the result.
  bool invoke_match(OptMatch &match);

  bool quit() const noexcept { return m_ctx.act == PolicyAct::Quit; }

  ParseCtx &ctx() noexcept { return m_ctx; }
  diag::FailManager &fails() noexcept { return m_fails; }
  OptSet &set() noexcept { return m_set; }

private:
  // Raises the failure for a prefixed token no option accepted, if any.
  void fail_unmatched(const lex::Token &tok, const std::string &raw,
                      std::size_t mark) const;

  // Stores `value` for ctx.uid and logs the binding.
  void store(const InvokeCtx &ictx, const Value &value);

  std::optional<Value> call(InvokeCtx &ictx);

  InvokeCtx make_ctx(const OptMatch &match) const;
  InvokeCtx make_ctx(const NoaMatch &match) const;

  OptSet &m_set;
  const Invoker &m_inv;
  const PolicySettings &m_settings;
  ParseCtx &m_ctx;
  diag::FailManager &m_fails;
};

// Fresh parse state for `args`, args[0] being the program name.
ParseCtx init_ctx(std::vector<std::string> args);

// Runs `body` and turns a thrown failure into a failed ParseReturn.
// Configuration errors propagate.
template <typename F> ParseReturn guarded(ParseCtx &ctx, F &&body) {
  try {
    body();
  } catch (const Error &e) {
    if (!e.is_failure()) {
      throw;
    }
    return ParseReturn(std::move(ctx), e);
  }
  return ParseReturn(std::move(ctx));
}

} // namespace dopt::policy
