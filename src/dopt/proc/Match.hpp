#pragma once

#include "dopt/memory/StringPool.hpp"
#include "dopt/opt/Opt.hpp"
#include "dopt/opt/Style.hpp"
#include "dopt/opt/Value.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace dopt {

class OptSet;

// One attempt to bind a prefixed token to an option. A match is either
// matched, with uid and value set, or leaves the option untouched.
class OptMatch {
public:
  OptMatch(Style style, std::optional<memory::Symbol> prefix,
           std::optional<memory::Symbol> name, std::optional<std::string> arg,
           bool disabled, bool consume, std::string hint)
      : m_style(style), m_prefix(prefix), m_name(name), m_arg(std::move(arg)),
        m_disabled(disabled), m_consume(consume), m_hint(std::move(hint)) {}

  // Binds `opt` if it accepts this match. Throws MissingValue or
  // InvalidValue when the option is named but rejects the value, and
  // IllegalDeactivation when a disable request hits an option that can
  // not be deactivated. Without `overload` only the first named option is
  // ever tried.
  bool process(Opt &opt, bool overload);

  // Restores the bound option to its state before process(). No-op on an
  // unmatched match.
  void undo(OptSet &set);

  // Keeps a copy of the values stored before the binding was applied so
  // that undo() can restore them.
  void save_store(const ValueStore &store) { m_prior = store; }

  bool is_matched() const noexcept { return m_uid.has_value(); }
  const std::optional<Uid> &uid() const noexcept { return m_uid; }
  Style style() const noexcept { return m_style; }
  const std::optional<std::string> &arg() const noexcept { return m_arg; }
  const std::optional<Value> &value() const noexcept { return m_value; }
  bool disabled() const noexcept { return m_disabled; }
  bool consume() const noexcept { return m_consume; }
  const std::string &hint() const noexcept { return m_hint; }

private:
  Style m_style;
  std::optional<memory::Symbol> m_prefix;
  std::optional<memory::Symbol> m_name;
  std::optional<std::string> m_arg;
  bool m_disabled;
  bool m_consume;
  std::string m_hint;

  bool m_attempted = false;
  std::optional<Uid> m_uid;
  std::optional<Value> m_value;
  bool m_was_matched = false;
  std::optional<ValueStore> m_prior;
};

// One attempt to bind a non-option argument to a Pos, Cmd or Main slot.
class NoaMatch {
public:
  NoaMatch(Style style, std::optional<memory::Symbol> name, std::string raw,
           std::size_t idx, std::size_t total)
      : m_style(style), m_name(name), m_raw(std::move(raw)), m_idx(idx),
        m_total(total) {}

  // Throws InvalidValue if the slot accepts the position but its value
  // parser rejects the argument.
  bool process(Opt &opt, std::optional<memory::Symbol> empty_prefix);

  void undo(OptSet &set);

  void save_store(const ValueStore &store) { m_prior = store; }

  bool is_matched() const noexcept { return m_uid.has_value(); }
  const std::optional<Uid> &uid() const noexcept { return m_uid; }
  Style style() const noexcept { return m_style; }
  const std::string &raw() const noexcept { return m_raw; }
  const std::optional<Value> &value() const noexcept { return m_value; }
  std::size_t idx() const noexcept { return m_idx; }
  std::size_t total() const noexcept { return m_total; }

private:
  Style m_style;
  std::optional<memory::Symbol> m_name;
  std::string m_raw;
  std::size_t m_idx;
  std::size_t m_total;

  std::optional<Uid> m_uid;
  std::optional<Value> m_value;
  bool m_was_matched = false;
  std::optional<ValueStore> m_prior;
};

} // namespace dopt
