#pragma once

#include "dopt/opt/OptConfig.hpp"
#include "dopt/policy/DelayPolicy.hpp"
#include "dopt/policy/FwdPolicy.hpp"
#include "dopt/policy/Invoker.hpp"
#include "dopt/policy/ParseReturn.hpp"
#include "dopt/policy/PrePolicy.hpp"
#include "dopt/set/OptSet.hpp"
#include <fmt/format.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dopt {

enum class PolicyKind {
  Forward,
  Delay,
  Pre,
};

class Parser {
public:
  explicit Parser(PolicyKind kind = PolicyKind::Forward);

  Uid add_opt(std::string_view create) { return m_set.add(create); }
  Uid add_opt(const OptConfig &cfg) { return m_set.add(cfg); }
  Uid add_opt(std::string_view create, Handler handler) {
    Uid uid = m_set.add(create);
    m_inv.on(uid, std::move(handler));
    return uid;
  }

  Parser &on(Uid uid, Handler handler);

  // Registers a sub parser entered when a Pre parse meets `name`.
  Parser &add_sub(std::string name, PolicyKind kind = PolicyKind::Forward);
  Parser &sub(std::string_view name);

  PolicyKind policy_kind() const noexcept {
    return static_cast<PolicyKind>(m_policy.index());
  }

  PolicySettings &settings();
  const PolicySettings &settings() const;

  Parser &set_strict(bool strict) {
    settings().strict = strict;
    return *this;
  }
  Parser &set_overload(bool overload) {
    settings().overload = overload;
    return *this;
  }
  Parser &set_end_of_options(bool enabled) {
    settings().end_of_options = enabled;
    return *this;
  }
  Parser &enable_combined() {
    settings().styles.push(Style::CombinedOption);
    return *this;
  }
  Parser &enable_embedded_plus() {
    settings().styles.push(Style::EmbeddedValuePlus);
    return *this;
  }
  Parser &enable_flag() {
    settings().styles.push(Style::Flag);
    return *this;
  }
  Parser &add_prefix(std::string prefix) {
    m_set.add_prefix(std::move(prefix));
    return *this;
  }

  ParseReturn parse(int argc, const char *const *argv);
  ParseReturn parse(std::vector<std::string> args);

  OptSet &optset() noexcept { return m_set; }
  const OptSet &optset() const noexcept { return m_set; }
  Invoker &invoker() noexcept { return m_inv; }

  template <typename T> const T &find_val(std::string_view name) const {
    return m_set.find_val<T>(name);
  }

  template <typename T>
  std::vector<T> find_vals(std::string_view name) const {
    return m_set.find_vals<T>(name);
  }

  void reset() { m_set.reset(); }

private:
  using Policy = std::variant<FwdPolicy, DelayPolicy, PrePolicy>;

  OptSet m_set;
  Invoker m_inv;
  Policy m_policy;
  std::map<std::string, std::unique_ptr<Parser>, std::less<>> m_subs;
};

} // namespace dopt

template <> struct fmt::formatter<dopt::PolicyKind> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(dopt::PolicyKind kind, FormatContext &ctx) const {
    std::string_view name = "?";
    switch (kind) {
    case dopt::PolicyKind::Forward:
      name = "forward";
      break;
    case dopt::PolicyKind::Delay:
      name = "delay";
      break;
    case dopt::PolicyKind::Pre:
      name = "pre";
      break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
