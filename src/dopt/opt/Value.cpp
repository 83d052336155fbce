#include "dopt/opt/Value.hpp"
#include "dopt/lex/Literal.hpp"

namespace dopt {

ValueParser default_value_parser(ValueType type) {
  switch (type) {
  case ValueType::Bool:
    return [](std::string_view raw) -> std::optional<Value> {
      auto v = lex::Literal{raw}.parse_bool();
      if (!v) {
        return std::nullopt;
      }
      return Value{*v};
    };
  case ValueType::Int:
    return [](std::string_view raw) -> std::optional<Value> {
      auto v = lex::Literal{raw}.parse_signed();
      if (!v) {
        return std::nullopt;
      }
      return Value{*v};
    };
  case ValueType::Uint:
    return [](std::string_view raw) -> std::optional<Value> {
      auto v = lex::Literal{raw}.parse_unsigned();
      if (!v) {
        return std::nullopt;
      }
      return Value{*v};
    };
  case ValueType::Flt:
    return [](std::string_view raw) -> std::optional<Value> {
      auto v = lex::Literal{raw}.parse_float();
      if (!v) {
        return std::nullopt;
      }
      return Value{*v};
    };
  case ValueType::Str:
    return [](std::string_view raw) -> std::optional<Value> {
      return Value{std::string(raw)};
    };
  }
  return {};
}

std::string_view value_type_name(ValueType type) noexcept {
  switch (type) {
  case ValueType::Bool:
    return "b";
  case ValueType::Int:
    return "i";
  case ValueType::Uint:
    return "u";
  case ValueType::Flt:
    return "f";
  case ValueType::Str:
    return "s";
  }
  return "?";
}

std::string describe_value(const Value &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return fmt::format("\"{}\"", v);
        } else {
          return fmt::format("{}", v);
        }
      },
      value);
}

void ValueStore::apply(Action action, const Value &value) {
  switch (action) {
  case Action::Set:
    m_values.clear();
    m_values.push_back(value);
    break;
  case Action::App:
    m_values.push_back(value);
    break;
  case Action::Pop:
    if (!m_values.empty()) {
      m_values.pop_back();
    }
    break;
  case Action::Cnt: {
    std::uint64_t count = 0;
    if (!m_values.empty()) {
      if (const auto *prev = std::get_if<std::uint64_t>(&m_values.back())) {
        count = *prev;
      }
    }
    m_values.clear();
    m_values.push_back(Value{count + 1});
    break;
  }
  case Action::Null:
    break;
  }
}

} // namespace dopt
