#include "dopt/diag/FailManager.hpp"
#include "dopt/diag/logging.hpp"

namespace dopt::diag {

void FailManager::push(Error err) {
  DOPT_DEBUG("record failure: {}", err.what());
  m_failures.push_back(std::move(err));
}

std::optional<Error> FailManager::option_failure_since(std::size_t mark) const {
  for (std::size_t i = mark; i < m_failures.size(); ++i) {
    ErrorKind kind = m_failures[i].kind();
    if (kind == ErrorKind::InvalidValue || kind == ErrorKind::MissingValue) {
      return m_failures[i];
    }
  }
  return std::nullopt;
}

Error FailManager::cause(Error top) const {
  for (const Error &err : m_failures) {
    top.caused_by(err);
  }
  return top;
}

Error FailManager::cause_uid(Error top) const {
  bool related = false;
  for (const Error &err : m_failures) {
    if (!err.uid() || err.uid() == top.uid()) {
      top.caused_by(err);
      related = true;
    }
  }
  if (!related) {
    return cause(std::move(top));
  }
  return top;
}

} // namespace dopt::diag
