#pragma once

#include "dopt/diag/Error.hpp"
#include "dopt/opt/Uid.hpp"
#include "dopt/opt/Value.hpp"
#include "dopt/policy/InvokeCtx.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dopt {

struct Binding {
  Uid uid;
  std::optional<std::size_t> index;
  Value value;
};

// Hand-off of the tail of the arguments to a sub parser.
struct Delegation {
  std::size_t boundary;
  std::string name;
  std::vector<std::string> args;
};

struct ParseCtx {
  std::vector<std::string> args;
  // Non-option arguments, the program name first.
  std::vector<std::string> noa;
  std::vector<Binding> bindings;
  PolicyAct act = PolicyAct::Null;
  std::optional<Delegation> delegation;
};

class ParseReturn {
public:
  explicit ParseReturn(ParseCtx ctx, std::optional<Error> failure = {})
      : m_ctx(std::move(ctx)), m_failure(std::move(failure)) {}

  // False if this parse or the delegated sub parse failed.
  bool ok() const noexcept { return failure() == nullptr; }

  const Error *failure() const noexcept;

  // Throws the failure, if any.
  void unwrap() const;

  const ParseCtx &ctx() const noexcept { return m_ctx; }
  const std::vector<std::string> &args() const noexcept {
    return m_ctx.args;
  }
  const std::vector<std::string> &noa() const noexcept { return m_ctx.noa; }
  const std::vector<Binding> &bindings() const noexcept {
    return m_ctx.bindings;
  }
  const std::optional<Delegation> &delegation() const noexcept {
    return m_ctx.delegation;
  }

  const ParseReturn *sub() const noexcept { return m_sub.get(); }
  void set_sub(ParseReturn sub) {
    m_sub = std::make_shared<const ParseReturn>(std::move(sub));
  }

private:
  ParseCtx m_ctx;
  std::optional<Error> m_failure;
  std::shared_ptr<const ParseReturn> m_sub;
};

} // namespace dopt
