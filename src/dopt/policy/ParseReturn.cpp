#include "dopt/policy/ParseReturn.hpp"

namespace dopt {

const Error *ParseReturn::failure() const noexcept {
  if (m_failure) {
    return &*m_failure;
  }
  if (m_sub) {
    return m_sub->failure();
  }
  return nullptr;
}

void ParseReturn::unwrap() const {
  if (const Error *err = failure(); err != nullptr) {
    throw *err;
  }
}

} // namespace dopt
