#pragma once

#include "dopt/opt/Uid.hpp"
#include "dopt/opt/Value.hpp"
#include "dopt/policy/InvokeCtx.hpp"
#include <functional>
#include <optional>
#include <unordered_map>

namespace dopt {

class OptSet;

// Returning std::nullopt rejects the binding; throwing Error::failure
// records a failure against the option.
using Handler = std::function<std::optional<Value>(OptSet &, InvokeCtx &)>;

class Invoker {
public:
  void on(Uid uid, Handler handler) { m_handlers[uid] = std::move(handler); }

  // Calls the handler registered for ctx.uid, or passes the parsed value
  // through.
  std::optional<Value> invoke(OptSet &set, InvokeCtx &ctx) const;

private:
  std::unordered_map<Uid, Handler> m_handlers;
};

} // namespace dopt
