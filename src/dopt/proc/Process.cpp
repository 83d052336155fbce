#include "dopt/proc/Process.hpp"
#include <algorithm>

namespace dopt {

std::optional<std::size_t> OptProcess::process(Opt &opt, bool overload,
                                               diag::FailManager &fails) {
  std::optional<std::size_t> first;
  for (std::size_t i = 0; i < m_matches.size(); ++i) {
    if (quit()) {
      break;
    }
    OptMatch &match = m_matches[i];
    if (match.is_matched()) {
      continue;
    }
    try {
      if (!match.process(opt, overload)) {
        continue;
      }
    } catch (const Error &e) {
      if (!e.is_recoverable()) {
        throw;
      }
      fails.push(e);
      continue;
    }
    // a combined token may name the same option more than once
    if (m_mode != Mode::All) {
      return i;
    }
    if (!first) {
      first = i;
    }
  }
  return first;
}

bool OptProcess::quit() const {
  if (m_mode == Mode::Any) {
    return std::any_of(m_matches.begin(), m_matches.end(),
                       [](const OptMatch &m) { return m.is_matched(); });
  }
  return std::all_of(m_matches.begin(), m_matches.end(),
                     [](const OptMatch &m) { return m.is_matched(); });
}

void OptProcess::undo(OptSet &set) {
  // reverse order so a twice bound option ends up in its first state
  for (auto it = m_matches.rbegin(); it != m_matches.rend(); ++it) {
    it->undo(set);
  }
}

bool NoaProcess::process(Opt &opt, std::optional<memory::Symbol> empty_prefix,
                         diag::FailManager &fails) {
  try {
    return m_match.process(opt, empty_prefix);
  } catch (const Error &e) {
    if (!e.is_recoverable()) {
      throw;
    }
    fails.push(e);
  }
  return false;
}

} // namespace dopt
