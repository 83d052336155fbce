#include "dopt/policy/PolicyRun.hpp"
#include "dopt/diag/logging.hpp"
#include "dopt/lex/split.hpp"
#include "dopt/policy/guess.hpp"
#include "dopt/set/OptSet.hpp"

namespace dopt::policy {

ParseCtx init_ctx(std::vector<std::string> args) {
  ParseCtx ctx;
  ctx.noa.push_back(args.empty() ? std::string{} : args.front());
  ctx.args = std::move(args);
  return ctx;
}

std::size_t PolicyRun::scan_options(const ScanHooks &hooks) {
  const std::vector<std::string> &args = m_ctx.args;
  auto push_noa = [&](std::size_t idx) {
    if (hooks.on_noa && hooks.on_noa(idx, args[idx])) {
      return true;
    }
    m_ctx.noa.push_back(args[idx]);
    return false;
  };

  bool options_done = false;
  std::size_t idx = 1;
  while (idx < args.size()) {
    const std::string &raw = args[idx];
    if (options_done) {
      if (push_noa(idx)) {
        return idx;
      }
      ++idx;
      continue;
    }
    if (m_settings.end_of_options && raw == "--") {
      DOPT_TRACE("end of options at {}", idx);
      options_done = true;
      ++idx;
      continue;
    }

    lex::Token tok = lex::split(raw, m_set.prefixes());
    DOPT_TRACE("split `{}` into {}", raw, tok);
    if (!tok.is_option()) {
      if (push_noa(idx)) {
        return idx;
      }
      ++idx;
      continue;
    }

    std::optional<std::string_view> next;
    if (idx + 1 < args.size()) {
      next = args[idx + 1];
    }
    std::size_t mark = m_fails.size();
    bool matched = false;
    bool consumed = false;
    for (Style style : m_settings.styles) {
      auto proc = guess_opt(style, tok, next, m_set);
      if (!proc) {
        continue;
      }
      bool ok = false;
      if (hooks.trial) {
        try {
          ok = match_opt(*proc);
        } catch (const Error &e) {
          if (!e.is_failure()) {
            throw;
          }
          DOPT_TRACE("ignore `{}` in trial scan", e.what());
        }
      } else {
        ok = match_opt(*proc);
      }
      if (!ok) {
        proc->undo(m_set);
        continue;
      }
      hooks.on_matched(*proc);
      matched = true;
      consumed = proc->consume();
      break;
    }
    if (quit()) {
      return args.size();
    }

    if (matched) {
      idx += consumed ? 2 : 1;
    } else {
      if (!hooks.trial) {
        fail_unmatched(tok, raw, mark);
      }
      if (push_noa(idx)) {
        return idx;
      }
      ++idx;
    }
    if (m_ctx.act == PolicyAct::Stop) {
      DOPT_TRACE("stop option matching after {}", idx - 1);
      m_ctx.act = PolicyAct::Null;
      options_done = true;
    }
  }
  return args.size();
}

void PolicyRun::fail_unmatched(const lex::Token &tok, const std::string &raw,
                               std::size_t mark) const {
  if (auto failure = m_fails.option_failure_since(mark)) {
    throw *failure;
  }
  // tokens only recognized through the empty prefix fall back to NOA
  if (m_settings.strict && !tok.prefix->empty()) {
    Error err = Error::not_found(raw);
    for (std::size_t i = mark; i < m_fails.size(); ++i) {
      err.caused_by(m_fails.failures()[i]);
    }
    throw err;
  }
  DOPT_TRACE("`{}` matched no option, keep it as NOA", raw);
}

void PolicyRun::resolve_cmd() {
  if (!m_set.has_cmd() || m_ctx.noa.size() < 2) {
    return;
  }
  NoaProcess proc =
      guess_noa(Style::Cmd, m_ctx.noa[1], 1, m_ctx.noa.size(), m_set);
  if (match_noa(proc)) {
    invoke_noa(proc);
  }
}

void PolicyRun::resolve_pos() {
  std::size_t total = m_ctx.noa.size();
  for (std::size_t idx = 1; idx < total; ++idx) {
    NoaProcess proc = guess_noa(Style::Pos, m_ctx.noa[idx], idx, total, m_set);
    if (match_noa(proc)) {
      invoke_noa(proc);
    }
    if (quit()) {
      return;
    }
    if (m_ctx.act == PolicyAct::Stop) {
      DOPT_TRACE("stop positional matching at {}", idx);
      m_ctx.act = PolicyAct::Null;
      return;
    }
  }
}

void PolicyRun::resolve_main() {
  NoaProcess proc = guess_noa(Style::Main, m_ctx.noa.front(), 0,
                              m_ctx.noa.size(), m_set);
  if (match_noa(proc)) {
    invoke_noa(proc);
  }
}

bool PolicyRun::match_opt(OptProcess &proc) {
  for (Opt &opt : m_set) {
    if (proc.quit()) {
      break;
    }
    if (opt.kind() != OptKind::Option) {
      continue;
    }
    proc.process(opt, m_settings.overload, m_fails);
  }
  return proc.is_matched();
}

bool PolicyRun::match_noa(NoaProcess &proc) {
  auto empty_prefix = m_set.pool().find("");
  for (Opt &opt : m_set) {
    if (proc.quit()) {
      break;
    }
    proc.process(opt, empty_prefix, m_fails);
  }
  return proc.is_matched();
}

bool PolicyRun::invoke_opt(OptProcess &proc) {
  std::size_t mark = m_ctx.bindings.size();
  for (OptMatch &match : proc.matches()) {
    if (!match.is_matched()) {
      continue;
    }
    if (!invoke_match(match)) {
      proc.undo(m_set);
      m_ctx.bindings.erase(m_ctx.bindings.begin() +
                               static_cast<std::ptrdiff_t>(mark),
                           m_ctx.bindings.end());
      return false;
    }
    if (quit()) {
      break;
    }
  }
  return true;
}

bool PolicyRun::invoke_match(OptMatch &match) {
  InvokeCtx ictx = make_ctx(match);
  match.save_store(m_set[ictx.uid].store());
  auto ret = call(ictx);
  if (!ret) {
    return false;
  }
  store(ictx, *ret);
  return true;
}

bool PolicyRun::invoke_noa(NoaProcess &proc) {
  NoaMatch &match = proc.match();
  InvokeCtx ictx = make_ctx(match);
  match.save_store(m_set[ictx.uid].store());
  auto ret = call(ictx);
  if (!ret) {
    proc.undo(m_set);
    return false;
  }
  store(ictx, *ret);
  return true;
}

void PolicyRun::store(const InvokeCtx &ictx, const Value &value) {
  Opt &opt = m_set[ictx.uid];
  opt.store().apply(opt.action(), value);
  m_ctx.bindings.push_back(Binding{ictx.uid, ictx.idx, value});
  DOPT_TRACE("bind {} `{}` = {}", ictx.uid, ictx.name, describe_value(value));
}

std::optional<Value> PolicyRun::call(InvokeCtx &ictx) {
  std::optional<Value> ret;
  try {
    ret = m_inv.invoke(m_set, ictx);
  } catch (const Error &e) {
    if (!e.is_recoverable()) {
      throw;
    }
    Error err = e;
    if (!err.uid()) {
      err.with_uid(ictx.uid);
    }
    m_fails.push(std::move(err));
    return std::nullopt;
  }
  if (ictx.act != PolicyAct::Null) {
    m_ctx.act = ictx.act;
  }
  return ret;
}

InvokeCtx PolicyRun::make_ctx(const OptMatch &match) const {
  const Opt &opt = m_set[*match.uid()];
  InvokeCtx ictx;
  ictx.uid = opt.uid();
  ictx.style = match.style();
  ictx.total = m_ctx.noa.size();
  ictx.name = opt.hint();
  ictx.arg = match.arg();
  ictx.value = match.value();
  ictx.disabled = match.disabled();
  if (const Value *last = opt.store().last(); last != nullptr) {
    ictx.prior = *last;
  }
  return ictx;
}

InvokeCtx PolicyRun::make_ctx(const NoaMatch &match) const {
  const Opt &opt = m_set[*match.uid()];
  InvokeCtx ictx;
  ictx.uid = opt.uid();
  ictx.style = match.style();
  ictx.idx = match.idx();
  ictx.total = match.total();
  ictx.name = opt.hint();
  ictx.arg = match.raw();
  ictx.value = match.value();
  if (const Value *last = opt.store().last(); last != nullptr) {
    ictx.prior = *last;
  }
  return ictx;
}

} // namespace dopt::policy
