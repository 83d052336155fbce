#pragma once

#include "dopt/lex/Token.hpp"
#include "dopt/proc/Process.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace dopt {
class OptSet;
}

namespace dopt::policy {

// Builds the process `style` derives from `tok`, or nothing if the token
// does not have the shape of that style. `next` is the following raw
// argument, if any.
std::optional<OptProcess> guess_opt(Style style, const lex::Token &tok,
                                    std::optional<std::string_view> next,
                                    const OptSet &set);

NoaProcess guess_noa(Style style, const std::string &raw, std::size_t idx,
                     std::size_t total, const OptSet &set);

} // namespace dopt::policy
