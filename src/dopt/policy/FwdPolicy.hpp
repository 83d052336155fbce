#pragma once

#include "dopt/policy/ParseReturn.hpp"
#include "dopt/policy/PolicySettings.hpp"
#include <string>
#include <vector>

namespace dopt {

class OptSet;
class Invoker;

namespace policy {
class PolicyRun;
}

// Invokes handlers as soon as a binding is confirmed.
class FwdPolicy {
public:
  FwdPolicy() = default;
  explicit FwdPolicy(PolicySettings settings)
      : m_settings(std::move(settings)) {}

  PolicySettings &settings() noexcept { return m_settings; }
  const PolicySettings &settings() const noexcept { return m_settings; }

  ParseReturn parse(OptSet &set, const Invoker &inv,
                    std::vector<std::string> args) const;

  // The phases of a forward parse on prepared state.
  static void run(policy::PolicyRun &state);

private:
  PolicySettings m_settings;
};

} // namespace dopt
