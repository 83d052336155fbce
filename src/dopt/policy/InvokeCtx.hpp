#pragma once

#include "dopt/opt/Style.hpp"
#include "dopt/opt/Uid.hpp"
#include "dopt/opt/Value.hpp"
#include <cstddef>
#include <fmt/format.h>
#include <optional>
#include <string>

namespace dopt {

// Request a handler can make to the running policy.
enum class PolicyAct {
  Null,
  Stop, // stop matching the current phase, remaining tokens become NOAs
  Quit, // end the parse successfully right away
};

// Everything a handler gets to see about one binding.
struct InvokeCtx {
  Uid uid;
  Style style = Style::Main;
  // NOA position for Pos, Cmd and Main bindings.
  std::optional<std::size_t> idx;
  std::size_t total = 0;
  std::string name;
  std::optional<std::string> arg;
  std::optional<Value> value;
  bool disabled = false;
  // Last value stored for the option before this binding.
  std::optional<Value> prior;
  PolicyAct act = PolicyAct::Null;

  void stop() noexcept { act = PolicyAct::Stop; }
  void quit() noexcept { act = PolicyAct::Quit; }
};

} // namespace dopt

template <> struct fmt::formatter<dopt::InvokeCtx> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const dopt::InvokeCtx &ictx, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "InvokeCtx{{uid={}, style={}, name=`{}`}}",
                          ictx.uid, ictx.style, ictx.name);
  }
};
