#pragma once

#include "dopt/diag/Error.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace dopt::diag {

// Ordered record of the failures seen during one parse.
class FailManager {
public:
  void push(Error err);

  bool empty() const noexcept { return m_failures.empty(); }
  std::size_t size() const noexcept { return m_failures.size(); }
  const std::vector<Error> &failures() const noexcept { return m_failures; }

  void clear() { m_failures.clear(); }

  // First option scoped failure (missing or invalid value) recorded at
  // or after `mark`.
  std::optional<Error> option_failure_since(std::size_t mark) const;

  // Chains every recorded failure under `top`.
  Error cause(Error top) const;

  // Chains the failures recorded against the uid of `top` (and those
  // without uid); falls back to every failure when none relate.
  Error cause_uid(Error top) const;

private:
  std::vector<Error> m_failures;
};

} // namespace dopt::diag
