#include "dopt/Parser.hpp"
#include "dopt/diag/logging.hpp"
#include "dopt/diag/unreachable.hpp"

namespace dopt {

static std::variant<FwdPolicy, DelayPolicy, PrePolicy>
make_policy(PolicyKind kind) {
  switch (kind) {
  case PolicyKind::Forward:
    return FwdPolicy{};
  case PolicyKind::Delay:
    return DelayPolicy{};
  case PolicyKind::Pre:
    return PrePolicy{};
  }
  diag::unreachable("unknown policy kind");
}

Parser::Parser(PolicyKind kind) : m_policy(make_policy(kind)) {}

Parser &Parser::on(Uid uid, Handler handler) {
  // validates the uid
  (void)m_set[uid];
  m_inv.on(uid, std::move(handler));
  return *this;
}

Parser &Parser::add_sub(std::string name, PolicyKind kind) {
  if (m_subs.contains(name)) {
    throw Error::duplicate_sub_parser(name);
  }
  auto [it, _] = m_subs.emplace(std::move(name), std::make_unique<Parser>(kind));
  return *it->second;
}

Parser &Parser::sub(std::string_view name) {
  auto it = m_subs.find(name);
  if (it == m_subs.end()) {
    throw Error::sub_parser_not_found(name);
  }
  return *it->second;
}

PolicySettings &Parser::settings() {
  return std::visit(
      [](auto &policy) -> PolicySettings & { return policy.settings(); },
      m_policy);
}

const PolicySettings &Parser::settings() const {
  return std::visit(
      [](const auto &policy) -> const PolicySettings & {
        return policy.settings();
      },
      m_policy);
}

ParseReturn Parser::parse(int argc, const char *const *argv) {
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(std::move(args));
}

ParseReturn Parser::parse(std::vector<std::string> args) {
  DOPT_DEBUG("{} parse of {} arguments", policy_kind(), args.size());
  if (const auto *fwd = std::get_if<FwdPolicy>(&m_policy)) {
    return fwd->parse(m_set, m_inv, std::move(args));
  }
  if (const auto *delay = std::get_if<DelayPolicy>(&m_policy)) {
    return delay->parse(m_set, m_inv, std::move(args));
  }

  const auto &pre = std::get<PrePolicy>(m_policy);
  PrePolicy::IsSubParser is_sub;
  if (!m_subs.empty()) {
    is_sub = [this](std::string_view name) { return m_subs.contains(name); };
  }
  ParseReturn ret = pre.parse(m_set, m_inv, std::move(args), is_sub);
  if (ret.ok() && ret.delegation()) {
    const Delegation &delegation = *ret.delegation();
    DOPT_DEBUG("delegate `{}` with {} arguments", delegation.name,
               delegation.args.size());
    ret.set_sub(sub(delegation.name).parse(delegation.args));
  }
  return ret;
}

} // namespace dopt
