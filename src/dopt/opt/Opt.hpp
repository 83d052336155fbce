#pragma once

#include "dopt/diag/Error.hpp"
#include "dopt/memory/StringPool.hpp"
#include "dopt/opt/OptConfig.hpp"
#include "dopt/opt/Style.hpp"
#include "dopt/opt/Uid.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dopt {

// A registered option: identity, matching predicates and stored values.
class Opt {
public:
  struct Names {
    memory::Symbol prefix;
    memory::Symbol name;
    std::vector<std::pair<memory::Symbol, memory::Symbol>> aliases;
    bool deactivatable = false;
    std::string hint;
  };

  Opt(Uid uid, const OptConfig &cfg, Names names);

  Uid uid() const noexcept { return m_uid; }
  OptKind kind() const noexcept { return m_kind; }
  ValueType value_type() const noexcept { return m_type; }
  memory::Symbol prefix() const noexcept { return m_names.prefix; }
  memory::Symbol name() const noexcept { return m_names.name; }
  const std::string &hint() const noexcept { return m_names.hint; }
  const std::string &help() const noexcept { return m_help; }
  const std::vector<Style> &styles() const noexcept { return m_styles; }
  const Index &index() const noexcept { return m_index; }
  Action action() const noexcept { return m_action; }
  bool force() const noexcept { return m_force; }
  bool no_delay() const noexcept { return m_no_delay; }
  bool deactivatable() const noexcept { return m_names.deactivatable; }

  bool mat_style(Style style) const;
  bool mat_name(std::optional<memory::Symbol> name) const {
    return name && *name == m_names.name;
  }
  bool mat_prefix(std::optional<memory::Symbol> prefix) const {
    return prefix && *prefix == m_names.prefix;
  }
  bool mat_alias(std::optional<memory::Symbol> prefix,
                 std::optional<memory::Symbol> name) const;
  bool mat_index(std::size_t idx, std::size_t total) const {
    return m_index.calc(idx, total);
  }

  // Set while the option holds a binding confirmed in the current parse.
  bool matched() const noexcept { return m_matched; }
  void set_matched(bool matched) noexcept { m_matched = matched; }

  // A force option is valid once it matched, other options always are.
  bool valid() const noexcept { return !m_force || m_matched; }

  std::optional<Value> parse_value(std::string_view raw) const {
    return m_parser(raw);
  }

  ValueStore &store() noexcept { return m_store; }
  const ValueStore &store() const noexcept { return m_store; }

  // Clears the parse state and reinstates the default value.
  void reset();

  template <typename T> const T &val() const {
    const Value *v = m_store.last();
    if (v == nullptr) {
      throw Error::value_not_found(m_uid);
    }
    const T *typed = std::get_if<T>(v);
    if (typed == nullptr) {
      throw Error::value_type_mismatch(m_uid, value_type_name(m_type));
    }
    return *typed;
  }

  template <typename T> std::vector<T> vals() const {
    std::vector<T> out;
    for (const Value &v : m_store.values()) {
      const T *typed = std::get_if<T>(&v);
      if (typed == nullptr) {
        throw Error::value_type_mismatch(m_uid, value_type_name(m_type));
      }
      out.push_back(*typed);
    }
    return out;
  }

private:
  Uid m_uid;
  OptKind m_kind;
  ValueType m_type;
  Names m_names;
  std::vector<Style> m_styles;
  Index m_index;
  Action m_action;
  bool m_force;
  bool m_no_delay;
  std::optional<Value> m_default;
  ValueParser m_parser;
  std::string m_help;

  bool m_matched = false;
  ValueStore m_store;
};

} // namespace dopt
