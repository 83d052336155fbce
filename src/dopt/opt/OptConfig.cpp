#include "dopt/opt/OptConfig.hpp"
#include "dopt/diag/Error.hpp"

namespace dopt {

namespace {

constexpr std::string_view NAME_TERMINATORS = ";=!*@:";

struct Cursor {
  std::string_view whole;
  std::string_view rest;

  bool eat(char c) {
    if (!rest.empty() && rest.front() == c) {
      rest.remove_prefix(1);
      return true;
    }
    return false;
  }

  std::string_view take_until(std::string_view stops) {
    auto end = rest.find_first_of(stops);
    std::string_view taken = rest.substr(0, end);
    rest.remove_prefix(taken.size());
    return taken;
  }
};

} // namespace

OptConfig OptConfig::parse(std::string_view str) {
  OptConfig cfg;
  Cursor cur{str, str};

  std::string_view name = cur.take_until(NAME_TERMINATORS);
  if (name.empty()) {
    throw Error::invalid_create_string(str, "missing option name");
  }
  cfg.m_name = std::string(name);

  while (cur.eat(';')) {
    std::string_view alias = cur.take_until(NAME_TERMINATORS);
    if (alias.empty()) {
      throw Error::invalid_create_string(str, "empty alias");
    }
    cfg.m_aliases.emplace_back(alias);
  }

  bool typed = false;
  if (cur.eat('=')) {
    std::string_view type = cur.take_until("!*@:");
    if (type.size() != 1) {
      throw Error::invalid_create_string(
          str, fmt::format("unknown value type `{}`", type));
    }
    typed = true;
    switch (type.front()) {
    case 'b':
      cfg.m_type = ValueType::Bool;
      break;
    case 'i':
      cfg.m_type = ValueType::Int;
      break;
    case 'u':
      cfg.m_type = ValueType::Uint;
      break;
    case 'f':
      cfg.m_type = ValueType::Flt;
      break;
    case 's':
      cfg.m_type = ValueType::Str;
      break;
    case 'p':
      cfg.m_kind = OptKind::Pos;
      cfg.m_type = ValueType::Bool;
      break;
    case 'c':
      cfg.m_kind = OptKind::Cmd;
      cfg.m_type = ValueType::Bool;
      break;
    case 'm':
      cfg.m_kind = OptKind::Main;
      cfg.m_type = ValueType::Str;
      break;
    default:
      throw Error::invalid_create_string(
          str, fmt::format("unknown value type `{}`", type));
    }
  }

  if (cur.eat('!')) {
    cfg.m_force = true;
  } else if (cur.eat('*')) {
    cfg.m_force = false;
  }

  if (cur.eat('@')) {
    std::string_view index = cur.take_until(":");
    cfg.m_index = Index::parse(index);
    if (!typed) {
      cfg.m_kind = OptKind::Pos;
    }
  }

  if (cur.eat(':')) {
    cfg.m_help = std::string(cur.rest);
    cur.rest = {};
  }

  if (!cur.rest.empty()) {
    throw Error::invalid_create_string(
        str, fmt::format("unexpected trailing `{}`", cur.rest));
  }
  return cfg;
}

} // namespace dopt
