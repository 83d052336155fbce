#pragma once

#include "dopt/policy/ParseReturn.hpp"
#include "dopt/policy/PolicySettings.hpp"
#include <string>
#include <vector>

namespace dopt {

class OptSet;
class Invoker;

// Queues the handlers of options until every token was scanned and the
// positionals are resolved. Options configured with no_delay, commands
// and positionals are invoked immediately.
class DelayPolicy {
public:
  DelayPolicy() = default;
  explicit DelayPolicy(PolicySettings settings)
      : m_settings(std::move(settings)) {}

  PolicySettings &settings() noexcept { return m_settings; }
  const PolicySettings &settings() const noexcept { return m_settings; }

  ParseReturn parse(OptSet &set, const Invoker &inv,
                    std::vector<std::string> args) const;

private:
  PolicySettings m_settings;
};

} // namespace dopt
