#pragma once

#include "dopt/opt/Action.hpp"
#include "dopt/opt/Index.hpp"
#include "dopt/opt/Value.hpp"
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dopt {

enum class OptKind {
  Option,
  Pos,
  Cmd,
  Main,
};

// Declarative description of an option, turned into an Opt by
// OptSet::add. Names still carry their prefix, the set resolves it
// against its registered prefixes.
class OptConfig {
public:
  OptConfig() = default;

  // Parses "name(;alias)*(=type)?([!*])?(@index)?(:help)?" where type is
  // one of b, i, u, f, s, p, c, m.
  static OptConfig parse(std::string_view str);

  OptConfig &name(std::string name) {
    m_name = std::move(name);
    return *this;
  }
  OptConfig &alias(std::string alias) {
    m_aliases.push_back(std::move(alias));
    return *this;
  }
  OptConfig &kind(OptKind kind) {
    m_kind = kind;
    return *this;
  }
  OptConfig &value_type(ValueType type) {
    m_type = type;
    return *this;
  }
  OptConfig &force(bool force) {
    m_force = force;
    return *this;
  }
  OptConfig &index(Index index) {
    m_index = std::move(index);
    return *this;
  }
  OptConfig &action(Action action) {
    m_action = action;
    return *this;
  }
  OptConfig &no_delay(bool no_delay) {
    m_no_delay = no_delay;
    return *this;
  }
  OptConfig &deactivatable(bool deactivatable) {
    m_deactivatable = deactivatable;
    return *this;
  }
  OptConfig &default_value(Value value) {
    m_default = std::move(value);
    return *this;
  }
  OptConfig &value_parser(ValueParser parser) {
    m_parser = std::move(parser);
    return *this;
  }
  OptConfig &help(std::string help) {
    m_help = std::move(help);
    return *this;
  }

  const std::string &name() const noexcept { return m_name; }
  const std::vector<std::string> &aliases() const noexcept {
    return m_aliases;
  }
  OptKind kind() const noexcept { return m_kind; }
  ValueType value_type() const noexcept { return m_type; }
  const std::optional<bool> &force() const noexcept { return m_force; }
  const std::optional<Index> &index() const noexcept { return m_index; }
  Action action() const noexcept { return m_action; }
  bool no_delay() const noexcept { return m_no_delay; }
  bool deactivatable() const noexcept { return m_deactivatable; }
  const std::optional<Value> &default_value() const noexcept {
    return m_default;
  }
  const ValueParser &value_parser() const noexcept { return m_parser; }
  const std::string &help() const noexcept { return m_help; }

private:
  std::string m_name;
  std::vector<std::string> m_aliases;
  OptKind m_kind = OptKind::Option;
  ValueType m_type = ValueType::Bool;
  std::optional<bool> m_force;
  std::optional<Index> m_index;
  Action m_action = Action::Set;
  bool m_no_delay = false;
  bool m_deactivatable = false;
  std::optional<Value> m_default;
  ValueParser m_parser;
  std::string m_help;
};

} // namespace dopt

template <> struct fmt::formatter<dopt::OptKind> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(dopt::OptKind kind, FormatContext &ctx) const {
    std::string_view name = "?";
    switch (kind) {
    case dopt::OptKind::Option:
      name = "Option";
      break;
    case dopt::OptKind::Pos:
      name = "Pos";
      break;
    case dopt::OptKind::Cmd:
      name = "Cmd";
      break;
    case dopt::OptKind::Main:
      name = "Main";
      break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
