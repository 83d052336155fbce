#include "dopt/set/OptSet.hpp"
#include "dopt/diag/logging.hpp"
#include "dopt/lex/split.hpp"
#include <algorithm>

namespace dopt {

OptSet::OptSet() {
  add_prefix("--");
  add_prefix("-");
}

void OptSet::add_prefix(std::string prefix) {
  if (std::find(m_prefixes.begin(), m_prefixes.end(), prefix) !=
      m_prefixes.end()) {
    return;
  }
  m_prefixes.push_back(std::move(prefix));
  std::stable_sort(m_prefixes.begin(), m_prefixes.end(),
                   [](const std::string &lhs, const std::string &rhs) {
                     return lhs.size() > rhs.size();
                   });
}

OptSet::SplitName OptSet::split_name(std::string_view raw) const {
  SplitName out;
  std::string_view rest = raw;
  if (const std::string *prefix = lex::longest_prefix(raw, m_prefixes);
      prefix != nullptr) {
    out.prefix = *prefix;
    rest.remove_prefix(prefix->size());
  }
  if (!out.prefix.empty() && !rest.empty() &&
      rest.front() == lex::DEACTIVATE_MARKER) {
    out.deactivatable = true;
    rest.remove_prefix(1);
  }
  out.name = std::string(rest);
  return out;
}

Uid OptSet::add(const OptConfig &cfg) {
  Uid uid{m_opts.size()};
  Opt::Names names{m_pool.intern(""), m_pool.intern(""), {}, false, ""};

  if (cfg.kind() == OptKind::Option) {
    SplitName split = split_name(cfg.name());
    if (split.name.empty()) {
      throw Error::invalid_create_string(cfg.name(), "missing option name");
    }
    names.prefix = m_pool.intern(split.prefix);
    names.name = m_pool.intern(split.name);
    names.deactivatable = split.deactivatable || cfg.deactivatable();
    names.hint = split.prefix + split.name;
  } else {
    if (cfg.kind() == OptKind::Pos && !cfg.index()) {
      throw Error::invalid_create_string(cfg.name(),
                                         "positional requires an index");
    }
    names.name = m_pool.intern(cfg.name());
    names.hint = cfg.name();
  }

  for (const std::string &alias : cfg.aliases()) {
    if (cfg.kind() == OptKind::Option) {
      SplitName split = split_name(alias);
      names.aliases.emplace_back(m_pool.intern(split.prefix),
                                 m_pool.intern(split.name));
    } else {
      names.aliases.emplace_back(m_pool.intern(""), m_pool.intern(alias));
    }
  }

  DOPT_DEBUG("register {} `{}` ({}) as {}", cfg.kind(), names.hint,
             cfg.value_type(), uid);
  m_opts.emplace_back(uid, cfg, std::move(names));
  return uid;
}

Opt &OptSet::operator[](Uid uid) {
  if (!uid || *uid >= m_opts.size()) {
    throw Error::invalid_uid(uid);
  }
  return m_opts[*uid];
}

const Opt &OptSet::operator[](Uid uid) const {
  if (!uid || *uid >= m_opts.size()) {
    throw Error::invalid_uid(uid);
  }
  return m_opts[*uid];
}

static char type_char(const Opt &opt) {
  switch (opt.kind()) {
  case OptKind::Pos:
    return 'p';
  case OptKind::Cmd:
    return 'c';
  case OptKind::Main:
    return 'm';
  case OptKind::Option:
    break;
  }
  return value_type_name(opt.value_type()).front();
}

std::vector<Uid> OptSet::find_all(std::string_view name) const {
  std::optional<char> type;
  if (auto eq = name.find('='); eq != std::string_view::npos) {
    if (eq + 2 == name.size()) {
      type = name.back();
    }
    name = name.substr(0, eq);
  }
  SplitName split = split_name(name);
  auto prefix = m_pool.find(split.prefix);
  auto bare = m_pool.find(split.name);
  auto whole = m_pool.find(name);

  std::vector<Uid> out;
  for (const Opt &opt : m_opts) {
    if (type && type_char(opt) != *type) {
      continue;
    }
    bool hit = false;
    if (opt.kind() == OptKind::Option) {
      hit = (opt.mat_name(bare) && opt.mat_prefix(prefix)) ||
            opt.mat_alias(prefix, bare);
    } else {
      hit = opt.mat_name(whole) || opt.mat_alias(m_pool.find(""), whole);
    }
    if (hit) {
      out.push_back(opt.uid());
    }
  }
  return out;
}

std::optional<Uid> OptSet::find(std::string_view name) const {
  auto all = find_all(name);
  if (all.empty()) {
    return std::nullopt;
  }
  return all.front();
}

Uid OptSet::find_uid(std::string_view name) const {
  auto uid = find(name);
  if (!uid) {
    throw Error(ErrorKind::ValueNotFound,
                fmt::format("no option named `{}`", name));
  }
  return *uid;
}

bool OptSet::has_cmd() const {
  return std::any_of(m_opts.begin(), m_opts.end(), [](const Opt &opt) {
    return opt.kind() == OptKind::Cmd;
  });
}

void OptSet::reset() {
  for (Opt &opt : m_opts) {
    opt.reset();
  }
}

} // namespace dopt
