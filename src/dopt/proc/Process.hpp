#pragma once

#include "dopt/diag/FailManager.hpp"
#include "dopt/proc/Match.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace dopt {

class OptSet;

// The matches generated from one token for one catalog style.
class OptProcess {
public:
  enum class Mode {
    Single, // one match
    All,    // every match must bind (combined options)
    Any,    // the first binding match wins (embedded value plus)
  };

  OptProcess(Mode mode, Style style, bool consume)
      : m_mode(mode), m_style(style), m_consume(consume) {}

  void add_match(OptMatch match) { m_matches.push_back(std::move(match)); }

  // Offers `opt` to the unmatched matches and returns the index of the
  // first match that bound it. In All mode every unmatched match is
  // offered, otherwise the first binding ends the call. Recoverable
  // failures are pushed to `fails`.
  std::optional<std::size_t> process(Opt &opt, bool overload,
                                     diag::FailManager &fails);

  // Nothing is left to match.
  bool quit() const;
  bool is_matched() const { return !m_matches.empty() && quit(); }

  void undo(OptSet &set);

  Mode mode() const noexcept { return m_mode; }
  Style style() const noexcept { return m_style; }
  // Argument style with a following token consumes it.
  bool consume() const noexcept { return m_consume; }
  bool empty() const noexcept { return m_matches.empty(); }
  std::vector<OptMatch> &matches() noexcept { return m_matches; }
  const std::vector<OptMatch> &matches() const noexcept { return m_matches; }

private:
  Mode m_mode;
  Style m_style;
  bool m_consume;
  std::vector<OptMatch> m_matches;
};

// A single non-option argument tried against every Pos, Cmd or Main slot
// until one accepts it.
class NoaProcess {
public:
  explicit NoaProcess(NoaMatch match) : m_match(std::move(match)) {}

  bool process(Opt &opt, std::optional<memory::Symbol> empty_prefix,
               diag::FailManager &fails);

  bool quit() const noexcept { return m_match.is_matched(); }
  bool is_matched() const noexcept { return m_match.is_matched(); }

  void undo(OptSet &set) { m_match.undo(set); }

  NoaMatch &match() noexcept { return m_match; }
  const NoaMatch &match() const noexcept { return m_match; }

private:
  NoaMatch m_match;
};

} // namespace dopt
