#include "dopt/proc/Match.hpp"
#include "dopt/diag/logging.hpp"
#include "dopt/set/OptSet.hpp"

namespace dopt {

bool OptMatch::process(Opt &opt, bool overload) {
  if (m_uid) {
    return false;
  }
  if (!opt.mat_style(binding_style(m_style))) {
    return false;
  }
  bool named = (opt.mat_name(m_name) && opt.mat_prefix(m_prefix)) ||
               opt.mat_alias(m_prefix, m_name);
  if (!named) {
    return false;
  }
  if (m_attempted && !overload) {
    return false;
  }
  m_attempted = true;

  if (m_disabled && !opt.deactivatable()) {
    throw Error::illegal_deactivation(m_hint, opt.uid());
  }

  std::string raw;
  if (is_boolean_style(m_style)) {
    raw = m_disabled ? "false" : "true";
  } else if (m_style == Style::Flag) {
    raw.clear();
  } else if (m_arg) {
    raw = *m_arg;
  } else {
    throw Error::missing_value(m_hint, opt.uid());
  }

  auto value = opt.parse_value(raw);
  if (!value) {
    throw Error::invalid_value(m_hint, raw, opt.uid());
  }

  DOPT_TRACE("`{}` matched {} `{}` with {}", m_hint, opt.uid(), opt.hint(),
             m_style);
  m_was_matched = opt.matched();
  m_uid = opt.uid();
  m_value = std::move(value);
  opt.set_matched(true);
  return true;
}

void OptMatch::undo(OptSet &set) {
  if (!m_uid) {
    return;
  }
  Opt &opt = set[*m_uid];
  opt.set_matched(m_was_matched);
  if (m_prior) {
    opt.store() = *m_prior;
  }
  DOPT_TRACE("undo `{}` on {}", m_hint, *m_uid);
  m_uid.reset();
  m_value.reset();
  m_prior.reset();
}

bool NoaMatch::process(Opt &opt, std::optional<memory::Symbol> empty_prefix) {
  if (m_uid) {
    return false;
  }
  if (!opt.mat_style(m_style)) {
    return false;
  }
  switch (m_style) {
  case Style::Cmd:
    if (!(opt.mat_name(m_name) || opt.mat_alias(empty_prefix, m_name)) ||
        !opt.mat_index(m_idx, m_total)) {
      return false;
    }
    break;
  case Style::Pos:
    if (!opt.mat_index(m_idx, m_total)) {
      return false;
    }
    break;
  case Style::Main:
    break;
  default:
    return false;
  }

  std::string raw = m_raw;
  if (opt.kind() != OptKind::Main && opt.value_type() == ValueType::Bool) {
    raw = "true";
  }
  auto value = opt.parse_value(raw);
  if (!value) {
    throw Error::invalid_value(opt.hint(), m_raw, opt.uid());
  }

  DOPT_TRACE("noa `{}`@{} matched {} `{}` with {}", m_raw, m_idx, opt.uid(),
             opt.hint(), m_style);
  m_was_matched = opt.matched();
  m_uid = opt.uid();
  m_value = std::move(value);
  opt.set_matched(true);
  return true;
}

void NoaMatch::undo(OptSet &set) {
  if (!m_uid) {
    return;
  }
  Opt &opt = set[*m_uid];
  opt.set_matched(m_was_matched);
  if (m_prior) {
    opt.store() = *m_prior;
  }
  m_uid.reset();
  m_value.reset();
  m_prior.reset();
}

} // namespace dopt
