#pragma once

#include <fmt/format.h>
#include <string_view>

namespace dopt {

// How a newly accepted value merges with the values already stored.
enum class Action {
  Set, // overwrite
  App, // append
  Pop, // remove the last value
  Cnt, // count activations, the value itself is ignored
  Null, // store nothing
};

} // namespace dopt

template <> struct fmt::formatter<dopt::Action> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(dopt::Action action, FormatContext &ctx) const {
    std::string_view name = "?";
    switch (action) {
    case dopt::Action::Set:
      name = "Set";
      break;
    case dopt::Action::App:
      name = "App";
      break;
    case dopt::Action::Pop:
      name = "Pop";
      break;
    case dopt::Action::Cnt:
      name = "Cnt";
      break;
    case dopt::Action::Null:
      name = "Null";
      break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
