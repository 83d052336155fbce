#pragma once

#include "dopt/opt/Uid.hpp"
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dopt {

enum class ErrorKind {
  // user input failures, reported through ParseReturn
  NotFound,
  MissingValue,
  InvalidValue,
  IllegalDeactivation,
  OptionRequired,
  PosRequired,
  CmdRequired,
  Failure,
  // configuration errors, always thrown
  InvalidCreateString,
  InvalidIndex,
  InvalidUid,
  ValueNotFound,
  ValueTypeMismatch,
  UnexpectedPosIfHasCmd,
  DuplicateSubParser,
  SubParserNotFound,
};

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg,
        std::optional<Uid> uid = std::nullopt)
      : std::runtime_error(msg), m_kind(kind), m_uid(uid) {}

  static Error not_found(std::string_view token);
  static Error missing_value(std::string_view hint, Uid uid);
  static Error invalid_value(std::string_view hint, std::string_view raw,
                             Uid uid);
  static Error illegal_deactivation(std::string_view hint, Uid uid);
  static Error option_required(std::string_view names);
  static Error pos_required(std::string_view names);
  static Error cmd_required(std::string_view names);
  static Error failure(std::string msg);

  static Error invalid_create_string(std::string_view str,
                                     std::string_view reason);
  static Error invalid_index(std::string_view str, std::string_view reason);
  static Error invalid_uid(Uid uid);
  static Error value_not_found(Uid uid);
  static Error value_type_mismatch(Uid uid, std::string_view stored);
  static Error unexpected_pos_if_has_cmd(Uid uid);
  static Error duplicate_sub_parser(std::string_view name);
  static Error sub_parser_not_found(std::string_view name);

  ErrorKind kind() const noexcept { return m_kind; }
  const std::optional<Uid> &uid() const noexcept { return m_uid; }
  const Error *cause() const noexcept { return m_cause.get(); }

  // Failures are caused by user input, everything else is a
  // configuration error of the embedding application.
  bool is_failure() const noexcept;
  // Recoverable failures are recorded while matching goes on with the
  // next candidate.
  bool is_recoverable() const noexcept;

  Error &with_uid(Uid uid) {
    m_uid = uid;
    return *this;
  }

  Error &caused_by(Error cause);

  std::string chain() const;

private:
  ErrorKind m_kind;
  std::optional<Uid> m_uid;
  std::shared_ptr<const Error> m_cause;
};

} // namespace dopt

template <> struct fmt::formatter<dopt::ErrorKind> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(dopt::ErrorKind kind, FormatContext &ctx) const {
    std::string_view name;
    switch (kind) {
    case dopt::ErrorKind::NotFound:
      name = "not-found";
      break;
    case dopt::ErrorKind::MissingValue:
      name = "missing-value";
      break;
    case dopt::ErrorKind::InvalidValue:
      name = "invalid-value";
      break;
    case dopt::ErrorKind::IllegalDeactivation:
      name = "illegal-deactivation";
      break;
    case dopt::ErrorKind::OptionRequired:
      name = "option-required";
      break;
    case dopt::ErrorKind::PosRequired:
      name = "pos-required";
      break;
    case dopt::ErrorKind::CmdRequired:
      name = "cmd-required";
      break;
    case dopt::ErrorKind::Failure:
      name = "failure";
      break;
    case dopt::ErrorKind::InvalidCreateString:
      name = "invalid-create-string";
      break;
    case dopt::ErrorKind::InvalidIndex:
      name = "invalid-index";
      break;
    case dopt::ErrorKind::InvalidUid:
      name = "invalid-uid";
      break;
    case dopt::ErrorKind::ValueNotFound:
      name = "value-not-found";
      break;
    case dopt::ErrorKind::ValueTypeMismatch:
      name = "value-type-mismatch";
      break;
    case dopt::ErrorKind::UnexpectedPosIfHasCmd:
      name = "unexpected-pos-if-has-cmd";
      break;
    case dopt::ErrorKind::DuplicateSubParser:
      name = "duplicate-sub-parser";
      break;
    case dopt::ErrorKind::SubParserNotFound:
      name = "sub-parser-not-found";
      break;
    }
    return fmt::format_to(ctx.out(), "{}", name);
  }
};

template <> struct fmt::formatter<dopt::Error> {
  constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const dopt::Error &err, FormatContext &ctx) const {
    return fmt::format_to(ctx.out(), "{}", err.chain());
  }
};
