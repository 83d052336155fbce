#include "dopt/opt/Opt.hpp"
#include <algorithm>

namespace dopt {

static std::vector<Style> supported_styles(OptKind kind, ValueType type) {
  switch (kind) {
  case OptKind::Pos:
    return {Style::Pos};
  case OptKind::Cmd:
    return {Style::Cmd};
  case OptKind::Main:
    return {Style::Main};
  case OptKind::Option:
    break;
  }
  if (type == ValueType::Bool) {
    return {Style::Boolean, Style::CombinedOption};
  }
  return {Style::Argument, Style::Flag};
}

Opt::Opt(Uid uid, const OptConfig &cfg, Names names)
    : m_uid(uid), m_kind(cfg.kind()), m_type(cfg.value_type()),
      m_names(std::move(names)),
      m_styles(supported_styles(cfg.kind(), cfg.value_type())),
      m_index(cfg.index().value_or(Index::null())), m_action(cfg.action()),
      m_force(cfg.force().value_or(cfg.kind() == OptKind::Cmd)),
      m_no_delay(cfg.no_delay()), m_default(cfg.default_value()),
      m_parser(cfg.value_parser()), m_help(cfg.help()) {
  if (m_kind == OptKind::Cmd) {
    m_index = Index::forward(1);
  }
  if (!m_parser) {
    m_parser = default_value_parser(m_type);
  }
  if (!m_default && m_type == ValueType::Bool && m_kind != OptKind::Main) {
    m_default = Value{false};
  }
  reset();
}

bool Opt::mat_style(Style style) const {
  return std::find(m_styles.begin(), m_styles.end(), style) !=
         m_styles.end();
}

bool Opt::mat_alias(std::optional<memory::Symbol> prefix,
                    std::optional<memory::Symbol> name) const {
  if (!prefix || !name) {
    return false;
  }
  return std::any_of(m_names.aliases.begin(), m_names.aliases.end(),
                     [&](const auto &alias) {
                       return alias.first == *prefix && alias.second == *name;
                     });
}

void Opt::reset() {
  m_matched = false;
  m_store.reset(m_default);
}

} // namespace dopt
