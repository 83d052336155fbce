#pragma once

#include "dopt/opt/Action.hpp"
#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dopt {

using Value = std::variant<bool, std::int64_t, std::uint64_t, double,
                           std::string>;

enum class ValueType {
  Bool,
  Int,
  Uint,
  Flt,
  Str,
};

using ValueParser = std::function<std::optional<Value>(std::string_view)>;

// Default parser for values of `type`.
ValueParser default_value_parser(ValueType type);

std::string_view value_type_name(ValueType type) noexcept;

std::string describe_value(const Value &value);

// Values stored for one option, merged according to an Action.
class ValueStore {
public:
  void apply(Action action, const Value &value);

  void reset(const std::optional<Value> &def) {
    m_values.clear();
    if (def) {
      m_values.push_back(*def);
    }
  }

  bool empty() const noexcept { return m_values.empty(); }
  const std::vector<Value> &values() const noexcept { return m_values; }
  const Value *last() const noexcept {
    return m_values.empty() ? nullptr : &m_values.back();
  }

private:
  std::vector<Value> m_values;
};

} // namespace dopt

template <> struct fmt::formatter<dopt::ValueType> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(dopt::ValueType type, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(
        dopt::value_type_name(type), ctx);
  }
};
