#pragma once

#include "dopt/policy/ParseReturn.hpp"
#include "dopt/policy/PolicySettings.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dopt {

class OptSet;
class Invoker;

// Scans the arguments once without invoking anything to find the first
// token naming a sub parser. The arguments in front of it are parsed
// like FwdPolicy does, the rest is returned as a Delegation.
class PrePolicy {
public:
  using IsSubParser = std::function<bool(std::string_view)>;

  PrePolicy() = default;
  explicit PrePolicy(PolicySettings settings)
      : m_settings(std::move(settings)) {}

  PolicySettings &settings() noexcept { return m_settings; }
  const PolicySettings &settings() const noexcept { return m_settings; }

  ParseReturn parse(OptSet &set, const Invoker &inv,
                    std::vector<std::string> args,
                    const IsSubParser &is_sub) const;

  std::optional<std::size_t>
  find_boundary(OptSet &set, const Invoker &inv,
                const std::vector<std::string> &args,
                const IsSubParser &is_sub) const;

private:
  PolicySettings m_settings;
};

} // namespace dopt
