#include "dopt/policy/Invoker.hpp"
#include "dopt/diag/logging.hpp"

namespace dopt {

std::optional<Value> Invoker::invoke(OptSet &set, InvokeCtx &ctx) const {
  auto it = m_handlers.find(ctx.uid);
  if (it == m_handlers.end()) {
    return ctx.value;
  }
  DOPT_TRACE("invoke handler of {}", ctx);
  return it->second(set, ctx);
}

} // namespace dopt
